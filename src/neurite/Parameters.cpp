/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include "Parameters.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/math/special_functions/fpclassify.hpp>
#include <boost/program_options.hpp>

#include "exception.hpp"

namespace neurite {


Parameters::Parameters(
		const std::string& model,
		const char* const names[],
		const double defaults[],
		unsigned count,
		const overrides_t& overrides) :
	m_model(model),
	m_names(names, names + count),
	m_values(defaults, defaults + count)
{
	using boost::format;

	for(overrides_t::const_iterator i = overrides.begin(); i != overrides.end(); ++i) {
		std::vector<std::string>::const_iterator n =
			std::find(m_names.begin(), m_names.end(), i->first);
		if(n == m_names.end()) {
			throw configuration_error(
					str(format("Model %s has no parameter '%s'") % model % i->first));
		}
		m_values.at(n - m_names.begin()) = i->second;
	}

	for(unsigned i=0; i < count; ++i) {
		if(!boost::math::isfinite(m_values[i])) {
			throw configuration_error(
					str(format("Parameter '%s' of model %s is not finite") % m_names[i] % model));
		}
	}
}



double
Parameters::get(const std::string& name) const
{
	using boost::format;
	std::vector<std::string>::const_iterator n = std::find(m_names.begin(), m_names.end(), name);
	if(n == m_names.end()) {
		throw configuration_error(str(format("Model %s has no parameter '%s'") % m_model % name));
	}
	return m_values.at(n - m_names.begin());
}



void
Parameters::requirePositive(unsigned i) const
{
	using boost::format;
	if(!(m_values.at(i) > 0.0)) {
		throw configuration_error(
				str(format("Parameter '%s' of model %s must be positive (found %g)")
					% m_names[i] % m_model % m_values[i]));
	}
}



void
Parameters::requireNonNegative(unsigned i) const
{
	using boost::format;
	if(m_values.at(i) < 0.0) {
		throw configuration_error(
				str(format("Parameter '%s' of model %s must not be negative (found %g)")
					% m_names[i] % m_model % m_values[i]));
	}
}



Parameters::overrides_t
Parameters::load(const std::string& name, const std::string& section)
{
	using boost::format;
	namespace po = boost::program_options;
	namespace fs = boost::filesystem;

	fs::path filename(name);
	fs::fstream file(filename, std::ios::in);
	if(!file.is_open()) {
		throw configuration_error(
				str(format("Failed to open parameter file %s: %s")
					% filename % strerror(errno)));
	}

	/* The set of parameters depends on the model, so we accept anything here
	 * and leave the validation to the Parameters constructor */
	po::options_description desc;
	po::parsed_options parsed(&desc);
	try {
		parsed = po::parse_config_file(file, desc, true);
	} catch (po::error& e) {
		throw configuration_error(
				str(format("Error parsing parameter file %s: %s")
					% filename % e.what()));
	}

	const std::string prefix = section + ".";
	overrides_t overrides;

	typedef std::vector< po::basic_option<char> > option_vector;
	for(option_vector::const_iterator i = parsed.options.begin(); i != parsed.options.end(); ++i) {
		if(i->string_key.compare(0, prefix.size(), prefix) != 0 || i->value.empty()) {
			continue;
		}
		const std::string param = i->string_key.substr(prefix.size());
		try {
			overrides[param] = boost::lexical_cast<double>(i->value.front());
		} catch(boost::bad_lexical_cast&) {
			throw configuration_error(
					str(format("Invalid value '%s' for parameter %s in %s")
						% i->value.front() % i->string_key % filename));
		}
	}

	return overrides;
}

}
