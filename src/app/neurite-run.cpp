/* Copyright 2010 Imperial College London
 * Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

/* Runs a single group of neurons of one model with a constant current input
 * and prints the resulting spike raster.
 */

#include <cstdlib>
#include <iostream>

#include <boost/filesystem/fstream.hpp>
#include <boost/format.hpp>
#include <boost/program_options.hpp>
#include <boost/scoped_ptr.hpp>
#include <boost/shared_ptr.hpp>

#include <neurite.hpp>


boost::shared_ptr<neurite::NeuronGroup>
createNeurons(const std::string& model,
		const neurite::Configuration& conf,
		int size,
		const neurite::Parameters::overrides_t& params)
{
	using namespace neurite;
	typedef boost::shared_ptr<NeuronGroup> ptr;

	if(model == "HodgkinHuxley" || model == "HH") {
		return ptr(new HodgkinHuxley(conf, size, params));
	} else if(model == "Izhikevich") {
		return ptr(new Izhikevich(conf, size, params));
	} else if(model == "HindmarshRose") {
		return ptr(new HindmarshRose(conf, size, params));
	} else if(model == "LIF") {
		return ptr(new LIF(conf, size, params));
	}
	throw configuration_error(str(boost::format("Unknown neuron model '%s'") % model));
}



/* Canonical name, used as section name in the parameter file */
std::string
modelSection(const std::string& model)
{
	return model == "HH" ? "HodgkinHuxley" : model;
}



boost::program_options::options_description
options()
{
	namespace po = boost::program_options;

	po::options_description desc("Allowed options");
	desc.add_options()
		("help,h", "print this message")
		("version", "print version number")
		("model,m", po::value<std::string>()->default_value("HodgkinHuxley"),
				"neuron model: HodgkinHuxley, Izhikevich, HindmarshRose or LIF")
		("size,n", po::value<int>()->default_value(1), "number of neurons")
		("current,i", po::value<double>()->default_value(10.0), "constant input current")
		("duration,t", po::value<double>()->default_value(100.0), "duration of simulation (ms)")
		("dt", po::value<double>(), "simulation time step (ms). Overrides the configuration file")
		("seed", po::value<unsigned>(), "random number seed. Overrides the configuration file")
		("params,p", po::value<std::string>(), ".ini file with parameter overrides, in a section named after the model")
		("config,c", po::value<std::string>(), ".ini file with simulation configuration")
		("output-file,o", po::value<std::string>(), "output file for firing data")
		("verbose,v", po::value<unsigned>()->default_value(0), "Set verbosity level")
	;

	return desc;
}



unsigned long
simulate(neurite::Network& net,
		neurite::NeuronGroup& neurons,
		double duration,
		double current,
		std::ostream& out)
{
	const cycle_t steps = net.stepCount(duration);

	neurite::Network::current_stimulus istim;
	for(nidx_t n=0; n < neurons.size(); ++n) {
		istim.push_back(std::make_pair(n, current));
	}

	unsigned long nfired = 0;
	for(cycle_t s=0; s < steps; ++s) {
		const double t = net.time();
		net.step(neurons, istim);
		const std::vector<unsigned>& fired = neurons.fired();
		for(std::vector<unsigned>::const_iterator fi = fired.begin(); fi != fired.end(); ++fi) {
			out << t << " " << *fi << "\n";
		}
		nfired += fired.size();
	}
	return nfired;
}



int
main(int argc, char* argv[])
{
	namespace po = boost::program_options;

	po::options_description desc = options();
	po::variables_map vm;
	try {
		po::store(po::parse_command_line(argc, argv, desc), vm);
	} catch(boost::program_options::error& e) {
		std::cerr << "Error: " << e.what() << std::endl;
		exit(1);
	}
	po::notify(vm);

	if(vm.count("help") != 0) {
		std::cout << "Usage:\n\t" << argv[0] << " [OPTIONS]\n\n";
		std::cout << desc << std::endl;
		exit(0);
	}

	if(vm.count("version") != 0) {
		std::cout << neurite::version() << std::endl;
		exit(0);
	}

	const std::string model = vm["model"].as<std::string>();
	const unsigned verbose = vm["verbose"].as<unsigned>();

	try {
		boost::scoped_ptr<neurite::Configuration> conf(vm.count("config")
				? new neurite::Configuration(vm["config"].as<std::string>())
				: new neurite::Configuration());
		if(vm.count("dt")) {
			conf->setTimestep(vm["dt"].as<double>());
		}
		if(vm.count("seed")) {
			conf->setSeed(vm["seed"].as<unsigned>());
		}
		if(verbose >= 2) {
			conf->enableLogging();
		}
		if(verbose >= 1) {
			std::cerr << *conf << std::endl;
		}

		neurite::Parameters::overrides_t params;
		if(vm.count("params")) {
			params = neurite::Parameters::load(vm["params"].as<std::string>(), modelSection(model));
		}

		neurite::Network net(*conf);
		neurite::NeuronGroup& neurons =
			net.addNeurons(createNeurons(model, *conf, vm["size"].as<int>(), params));

		const double duration = vm["duration"].as<double>();
		const double current = vm["current"].as<double>();

		unsigned long nfired;
		if(vm.count("output-file")) {
			boost::filesystem::ofstream file(vm["output-file"].as<std::string>());
			if(!file) {
				std::cerr << "Error: could not open output file "
					<< vm["output-file"].as<std::string>() << std::endl;
				return 1;
			}
			nfired = simulate(net, neurons, duration, current, file);
		} else {
			nfired = simulate(net, neurons, duration, current, std::cout);
		}

		std::cout << "Total firings: " << nfired << std::endl;
		if(verbose >= 1) {
			std::cout << "Simulated " << net.time() << "ms in "
				<< net.elapsedWallclock() << "ms wall-clock\n";
		}

	} catch(neurite::exception& e) {
		std::cerr << "Error: " << e.what() << std::endl;
		return e.errorNumber();
	} catch(std::exception& e) {
		std::cerr << "Error: " << e.what() << std::endl;
		return -1;
	}

	return 0;
}
