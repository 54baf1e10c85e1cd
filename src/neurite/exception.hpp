#ifndef NEURITE_EXCEPTION_HPP
#define NEURITE_EXCEPTION_HPP

/* Copyright 2010 Imperial College London
 * Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include <stdexcept>
#include <string>

#include "types.h"

namespace neurite {

/* Minor extension of std::exception which adds error codes. The error codes
 * are listed in types.h. */
class exception : public std::runtime_error
{
	public :

		exception(int errorNumber, const std::string& msg) :
			std::runtime_error(msg),
			m_errno(errorNumber) {}

		~exception() throw () {}

		int errorNumber() const { return m_errno; }

	private :

		int m_errno;
};



/*! Invalid construction-time parameters. Always raised when a group,
 * connection map or configuration is created, never while stepping. */
class configuration_error : public exception
{
	public :

		explicit configuration_error(const std::string& msg) :
			exception(NEURITE_CONFIGURATION_ERROR, msg) {}
};



/*! Non-finite integration result. The group which raised it can not be
 * stepped any further. */
class numerical_error : public exception
{
	public :

		explicit numerical_error(const std::string& msg) :
			exception(NEURITE_NUMERICAL_ERROR, msg) {}
};



class delay_line_underrun : public exception
{
	public :

		explicit delay_line_underrun(const std::string& msg) :
			exception(NEURITE_BUFFER_UNDERFLOW, msg) {}
};



/*! Assert condition and throw exception with the given message otherwise. Note
 * that unlike the standard assert this function is always executed, regardless
 * of the compilation flags */
inline
void
assert_or_throw(bool cond, const char* str)
{
	if(!cond) {
		throw neurite::exception(NEURITE_LOGIC_ERROR, str);
	}
}



inline
void
assert_or_throw(bool cond, const std::string& str)
{
	if(!cond) {
		throw neurite::exception(NEURITE_LOGIC_ERROR, str);
	}
}


} // end namespace neurite

#endif
