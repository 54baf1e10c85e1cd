#ifndef NEURITE_TEST_UTILS_HPP
#define NEURITE_TEST_UTILS_HPP

/* Copyright 2010 Imperial College London
 * Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include <string>
#include <vector>

#include <neurite.hpp>

neurite::Configuration
configuration(double dt = 0.01, unsigned seed = 0);


/*! Single-entry parameter override */
neurite::Parameters::overrides_t
override(const std::string& name, double value);


/* Summary of a stand-alone run of a neuron group */
struct RunResult
{
	RunResult() : spikes(0), flags(0), vmin(1e300), vmax(-1e300) {}

	/* number of entries in fired() over the run */
	unsigned spikes;

	/* number of spike flags set over the run */
	unsigned flags;

	/* times at which unit 0 fired */
	std::vector<double> times;

	/* extremes of V over all units and steps */
	double vmin;
	double vmax;
};


/*! Update a group on its own for the given number of steps, with the same
 * current injected into every unit on every step. Step s is run at time
 * s * dt. */
RunResult
runNeurons(neurite::NeuronGroup& group, unsigned steps, double current);


/*! \return smallest interval between consecutive times, or a very large
 * 		number if there are fewer than two */
double
minInterval(const std::vector<double>& times);


/*! Write text to a new file in the temporary directory and return its name */
std::string
writeTempFile(const std::string& content);

#endif
