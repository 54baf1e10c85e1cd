/* Copyright 2010 Imperial College London
 * Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include "utils.hpp"

#include <algorithm>
#include <limits>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/test/unit_test.hpp>


neurite::Configuration
configuration(double dt, unsigned seed)
{
	neurite::Configuration conf;
	conf.setTimestep(dt);
	conf.setSeed(seed);
	return conf;
}



neurite::Parameters::overrides_t
override(const std::string& name, double value)
{
	neurite::Parameters::overrides_t ret;
	ret[name] = value;
	return ret;
}



RunResult
runNeurons(neurite::NeuronGroup& group, unsigned steps, double current)
{
	RunResult result;
	const double dt = group.timestep();
	const size_t size = group.size();

	for(unsigned s=0; s < steps; ++s) {
		const double t = s * dt;
		for(size_t n=0; n < size; ++n) {
			group.addInput(n, current);
		}
		BOOST_REQUIRE_NO_THROW(group.update(t));

		const std::vector<unsigned>& fired = group.fired();
		result.spikes += fired.size();
		if(!fired.empty() && fired.front() == 0) {
			result.times.push_back(t);
		}

		const double* spike = group.spikes();
		const double* V = group.potential();
		for(size_t n=0; n < size; ++n) {
			if(spike[n] != 0.0) {
				result.flags += 1;
			}
			result.vmin = std::min(result.vmin, V[n]);
			result.vmax = std::max(result.vmax, V[n]);
		}
	}
	return result;
}



double
minInterval(const std::vector<double>& times)
{
	double ret = std::numeric_limits<double>::max();
	for(size_t i=1; i < times.size(); ++i) {
		ret = std::min(ret, times[i] - times[i-1]);
	}
	return ret;
}



std::string
writeTempFile(const std::string& content)
{
	namespace fs = boost::filesystem;
	fs::path filename = fs::temp_directory_path() / fs::unique_path("neurite-%%%%-%%%%.ini");
	fs::ofstream file(filename);
	file << content;
	return filename.string();
}
