/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include "StateVector.hpp"

#include <algorithm>
#include <boost/format.hpp>

#include "exception.hpp"

namespace neurite {

StateVector::StateVector(const char* const fields[], unsigned nfields, size_t size) :
	m_size(size),
	m_data(boost::extents[nfields][size])
{
	using boost::format;

	for(unsigned i=0; i < nfields; ++i) {
		std::string name(fields[i] == NULL ? "" : fields[i]);
		if(name.empty()) {
			throw configuration_error(str(format("State variable %u has no name") % i));
		}
		if(m_index.count(name)) {
			throw configuration_error(str(format("State variable '%s' declared twice") % name));
		}
		m_index[name] = i;
		m_names.push_back(name);
	}

	std::fill(m_data.data(), m_data.data() + m_data.num_elements(), 0.0);
}



unsigned
StateVector::fieldIndex(const std::string& name) const
{
	using boost::format;
	boost::unordered_map<std::string, unsigned>::const_iterator i = m_index.find(name);
	if(i == m_index.end()) {
		throw configuration_error(str(format("Unknown state variable '%s'") % name));
	}
	return i->second;
}



bool
StateVector::hasField(const std::string& name) const
{
	return m_index.count(name) != 0;
}



const std::string&
StateVector::fieldName(unsigned field) const
{
	return m_names.at(checkedField(field));
}



unsigned
StateVector::checkedField(unsigned i) const
{
	using boost::format;
	if(i >= m_names.size()) {
		throw configuration_error(str(format("Invalid state variable index %u") % i));
	}
	return i;
}



size_t
StateVector::checkedUnit(size_t i) const
{
	using boost::format;
	if(i >= m_size) {
		throw neurite::exception(NEURITE_INVALID_INPUT,
				str(format("Invalid unit index %u (group has %u units)") % i % m_size));
	}
	return i;
}



double
StateVector::get(unsigned field, size_t unit) const
{
	return m_data[checkedField(field)][checkedUnit(unit)];
}



double
StateVector::get(const std::string& field, size_t unit) const
{
	return m_data[fieldIndex(field)][checkedUnit(unit)];
}



void
StateVector::set(unsigned field, size_t unit, double value)
{
	m_data[checkedField(field)][checkedUnit(unit)] = value;
}



void
StateVector::set(const std::string& field, size_t unit, double value)
{
	m_data[fieldIndex(field)][checkedUnit(unit)] = value;
}



void
StateVector::fill(unsigned field, double value)
{
	double* begin = (*this)[checkedField(field)];
	std::fill(begin, begin + m_size, value);
}

}
