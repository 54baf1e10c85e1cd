#ifndef NEURITE_STATE_VECTOR_HPP
#define NEURITE_STATE_VECTOR_HPP

/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include <string>
#include <vector>

#include <boost/multi_array.hpp>
#include <boost/unordered_map.hpp>

#include <neurite/config.h>

namespace neurite {

/*! \brief Per-unit state of a group
 *
 * The state is stored in a dense structure-of-arrays, with one array per
 * named field and one entry per unit. The field set is declared when the
 * state is created and never changes afterwards, nor does the number of
 * units, so all arrays keep the same length for the lifetime of the object.
 *
 * Models access fields by the index of the field in the declaration (see the
 * STATE_ enumerations of the model classes). The name-based accessors are
 * meant for monitors and tests.
 */
class NEURITE_DLL_PUBLIC StateVector
{
	public :

		/*!
		 * \param fields names of the state variables
		 * \param nfields length of \a fields
		 * \param size number of units
		 *
		 * \throws neurite::configuration_error if any field name is empty or
		 * 		repeated
		 */
		StateVector(const char* const fields[], unsigned nfields, size_t size);

		/*! \return number of units */
		size_t size() const { return m_size; }

		/*! \return number of state variables */
		unsigned fieldCount() const { return unsigned(m_names.size()); }

		/*! \return index of the named field
		 *
		 * \throws neurite::configuration_error if there is no such field
		 */
		unsigned fieldIndex(const std::string& name) const;

		bool hasField(const std::string& name) const;

		const std::string& fieldName(unsigned field) const;

		/*! \return pointer to the first element of a field's array
		 *
		 * \pre field < fieldCount()
		 */
		double* operator[](unsigned field) { return m_data.data() + field * m_size; }

		const double* operator[](unsigned field) const { return m_data.data() + field * m_size; }

		/*! \return a single value, after checking both indices */
		double get(unsigned field, size_t unit) const;

		/*! \copydoc get */
		double get(const std::string& field, size_t unit) const;

		/*! Set a single value, after checking both indices */
		void set(unsigned field, size_t unit, double value);

		/*! \copydoc set */
		void set(const std::string& field, size_t unit, double value);

		/*! Set a field to the same value for all units */
		void fill(unsigned field, double value);

	private :

		size_t m_size;

		std::vector<std::string> m_names;

		boost::unordered_map<std::string, unsigned> m_index;

		/* The indices here are:
		 *
		 * 1. (outer) field index
		 * 2. (inner) unit index
		 */
		typedef boost::multi_array<double, 2> array_type;
		array_type m_data;

		unsigned checkedField(unsigned field) const;

		size_t checkedUnit(size_t unit) const;
};

}

#endif
