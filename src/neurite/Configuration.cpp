/* Copyright 2010 Imperial College London
 * Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include "Configuration.hpp"

#include <cerrno>
#include <cstring>

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/format.hpp>
#include <boost/math/special_functions/fpclassify.hpp>

#include "exception.hpp"

namespace neurite {


Configuration::Configuration() :
	m_dt(0.1),
	m_seed(0),
	m_logging(false),
	m_progressPeriod(0.0)
{
	;
}



Configuration::Configuration(const std::string& name) :
	m_dt(0.1),
	m_seed(0),
	m_logging(false),
	m_progressPeriod(0.0)
{
	using boost::format;
	namespace po = boost::program_options;
	namespace fs = boost::filesystem;

	po::options_description desc("Allowed options");
	desc.add_options()
		("timestep", po::value<double>(), "simulation timestep (ms)")
		("seed", po::value<unsigned>(), "seed for random number generators")
		("logging", po::value<bool>(), "log to stdout")
		("progress", po::value<double>(), "progress reporting period (ms)")
	;

	fs::path filename(name);
	if(!fs::exists(filename)) {
		throw configuration_error(str(format("Could not find configuration file %s") % filename));
	}

	fs::fstream file(filename, std::ios::in);
	if(!file.is_open()) {
		throw configuration_error(
				str(format("Failed to open configuration file %s: %s")
					% filename % strerror(errno)));
	}

	po::variables_map vm;
	try {
		po::store(po::parse_config_file(file, desc, false), vm);
		po::notify(vm);
	} catch (po::error& e) {
		throw configuration_error(
				str(format("Error parsing configuration file %s: %s")
					% filename % e.what()));
	}

	if(vm.count("timestep")) {
		setTimestep(vm["timestep"].as<double>());
	}
	if(vm.count("seed")) {
		setSeed(vm["seed"].as<unsigned>());
	}
	if(vm.count("logging")) {
		m_logging = vm["logging"].as<bool>();
	}
	if(vm.count("progress")) {
		setProgressPeriod(vm["progress"].as<double>());
	}
}



void
Configuration::setTimestep(double dt)
{
	using boost::format;
	if(!(dt > 0.0) || !boost::math::isfinite(dt)) {
		throw configuration_error(str(format("Invalid timestep (%g ms). The timestep must be positive") % dt));
	}
	m_dt = dt;
}



void
Configuration::setProgressPeriod(double period)
{
	using boost::format;
	if(period < 0.0) {
		throw configuration_error(str(format("Invalid progress period (%g ms)") % period));
	}
	m_progressPeriod = period;
}


} // namespace neurite


std::ostream& operator<<(std::ostream& o, neurite::Configuration const& conf)
{
	return o
		<< "dt: " << conf.timestep() << "ms, "
		<< "seed: " << conf.seed() << ", "
		<< "logging: " << (conf.loggingEnabled() ? "on" : "off");
}
