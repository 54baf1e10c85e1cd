/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include "Monitor.hpp"

#include <algorithm>
#include <boost/format.hpp>

#include "exception.hpp"

namespace neurite {


Monitor::Monitor(const StateVector& state, const std::vector<std::string>& fields) :
	m_state(state),
	m_names(fields),
	m_data(fields.size())
{
	for(std::vector<std::string>::const_iterator i = fields.begin(); i != fields.end(); ++i) {
		/* throws on unknown names */
		m_fields.push_back(state.fieldIndex(*i));
	}
}



void
Monitor::record(double t)
{
	const size_t units = m_state.size();
	m_times.push_back(t);
	for(size_t f=0; f < m_fields.size(); ++f) {
		const double* values = m_state[m_fields[f]];
		m_data[f].insert(m_data[f].end(), values, values + units);
	}
}



std::vector<double>
Monitor::trace(const std::string& field, size_t unit) const
{
	using boost::format;

	std::vector<std::string>::const_iterator i = std::find(m_names.begin(), m_names.end(), field);
	if(i == m_names.end()) {
		throw configuration_error(str(format("Field '%s' is not monitored") % field));
	}

	const size_t units = m_state.size();
	if(unit >= units) {
		throw exception(NEURITE_INVALID_INPUT,
				str(format("Invalid unit index %u in monitor (group size %u)") % unit % units));
	}

	const std::vector<double>& data = m_data[i - m_names.begin()];
	std::vector<double> ret;
	ret.reserve(m_times.size());
	for(size_t r=0; r < m_times.size(); ++r) {
		ret.push_back(data[r * units + unit]);
	}
	return ret;
}



void
Monitor::write(std::ostream& out) const
{
	using boost::format;

	const size_t units = m_state.size();

	out << "t";
	for(size_t f=0; f < m_names.size(); ++f) {
		for(size_t n=0; n < units; ++n) {
			out << format(" %s[%u]") % m_names[f] % n;
		}
	}
	out << "\n";

	for(size_t r=0; r < m_times.size(); ++r) {
		out << m_times[r];
		for(size_t f=0; f < m_data.size(); ++f) {
			for(size_t n=0; n < units; ++n) {
				out << " " << m_data[f][r * units + n];
			}
		}
		out << "\n";
	}
}

}
