#ifndef NEURITE_PARAMETERS_HPP
#define NEURITE_PARAMETERS_HPP

/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include <map>
#include <string>
#include <vector>

#include <neurite/config.h>

namespace neurite {

/*! \brief Immutable record of the scalar parameters of a model
 *
 * Each model declares the names of its parameters along with default values.
 * The user can override any subset of these by name when the group is
 * created. The values are then fixed for the lifetime of the group.
 */
class NEURITE_DLL_PUBLIC Parameters
{
	public :

		/*! Parameter values by name, used for overriding defaults */
		typedef std::map<std::string, double> overrides_t;

		/*!
		 * \param model name of the model, used in error messages
		 * \param names parameter names, in index order
		 * \param defaults default values, in index order
		 * \param count number of parameters
		 * \param overrides user-specified values
		 *
		 * \throws neurite::configuration_error if \a overrides names a
		 * 		parameter which is not declared by the model, or if any value
		 * 		is not finite
		 */
		Parameters(const std::string& model,
				const char* const names[],
				const double defaults[],
				unsigned count,
				const overrides_t& overrides);

		/*! \return value of parameter with the given index. */
		double operator[](unsigned i) const { return m_values[i]; }

		/*! \return value of the named parameter
		 *
		 * \throws neurite::configuration_error if there is no such parameter
		 */
		double get(const std::string& name) const;

		unsigned size() const { return unsigned(m_values.size()); }

		const std::string& name(unsigned i) const { return m_names.at(i); }

		const std::string& model() const { return m_model; }

		/*! \throws neurite::configuration_error unless the parameter is > 0 */
		void requirePositive(unsigned i) const;

		/*! \throws neurite::configuration_error unless the parameter is >= 0 */
		void requireNonNegative(unsigned i) const;

		/*! Read parameter overrides from a section of an .ini file
		 *
		 * All keys of the form \c section.name are returned as overrides
		 * for parameter \c name. Keys in other sections are ignored.
		 *
		 * \throws neurite::configuration_error if the file cannot be opened
		 * 		or parsed, or if any value in the section is not a number
		 */
		static overrides_t load(const std::string& filename, const std::string& section);

	private :

		std::string m_model;
		std::vector<std::string> m_names;
		std::vector<double> m_values;
};

}

#endif
