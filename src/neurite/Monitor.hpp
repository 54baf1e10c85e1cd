#ifndef NEURITE_MONITOR_HPP
#define NEURITE_MONITOR_HPP

/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include <ostream>
#include <string>
#include <vector>

#include <neurite/config.h>
#include "StateVector.hpp"

namespace neurite {

/*! \brief Recorder for a subset of the state variables of a group
 *
 * The monitor keeps a reference to the state of the group, which must outlive
 * it. Each call to \a record appends the current value of every monitored
 * field for every unit.
 */
class NEURITE_DLL_PUBLIC Monitor
{
	public :

		/*!
		 * \throws neurite::configuration_error if any of the fields does not
		 * 		exist in \a state
		 */
		Monitor(const StateVector& state, const std::vector<std::string>& fields);

		/*! Append the current values of the monitored fields, tagged with
		 * time \a t */
		void record(double t);

		/*! \return recording times */
		const std::vector<double>& times() const { return m_times; }

		/*! \return number of records */
		size_t length() const { return m_times.size(); }

		const std::vector<std::string>& fields() const { return m_names; }

		/*! \return history of a single field of a single unit
		 *
		 * \throws neurite::configuration_error if the field is not monitored
		 * \throws neurite::exception (NEURITE_INVALID_INPUT) if the unit is
		 * 		out of range
		 */
		std::vector<double> trace(const std::string& field, size_t unit) const;

		/*! Write recorded data as a whitespace-separated table with one row
		 * per record. The first column is the time. */
		void write(std::ostream& out) const;

	private :

		const StateVector& m_state;

		std::vector<std::string> m_names;

		/* indices into the state vector */
		std::vector<unsigned> m_fields;

		std::vector<double> m_times;

		/* per monitored field, size() values per record */
		std::vector< std::vector<double> > m_data;
};

}

#endif
