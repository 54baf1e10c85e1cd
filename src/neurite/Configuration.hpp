#ifndef NEURITE_CONFIGURATION_HPP
#define NEURITE_CONFIGURATION_HPP

//! \file Configuration.hpp

/* Copyright 2010 Imperial College London
 * Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include <ostream>
#include <string>

#include <neurite/config.h>
#include <neurite/types.h>

namespace neurite {

/*! \brief Global simulation configuration
 *
 * A configuration is passed to the groups and to the network when they are
 * created. Both keep their own copy, so modifying a configuration afterwards
 * has no effect on an existing simulation.
 */
class NEURITE_DLL_PUBLIC Configuration
{
	public:

		/*! Default configuration: dt = 0.1ms, seed 0, logging disabled */
		Configuration();

		/*! Load configuration from an .ini file
		 *
		 * Recognised keys are \c timestep, \c seed, \c logging and \c
		 * progress. Missing keys keep their default values.
		 *
		 * \throws neurite::configuration_error if the file cannot be found,
		 * 		read or parsed, or if any value is invalid
		 */
		explicit Configuration(const std::string& filename);

		/*! Set the simulation timestep in milliseconds
		 *
		 * \throws neurite::configuration_error if \a dt is not positive
		 */
		void setTimestep(double dt);

		double timestep() const { return m_dt; }

		/*! Set the seed used for all random number generators */
		void setSeed(unsigned seed) { m_seed = seed; }

		unsigned seed() const { return m_seed; }

		/*! Switch on logging and send output to stdout */
		void enableLogging() { m_logging = true; }

		void disableLogging() { m_logging = false; }

		bool loggingEnabled() const { return m_logging; }

		/*! When logging is enabled, report progress every \a period ms of
		 * simulated time during \a Network::run. A period of 0 disables the
		 * progress reports. */
		void setProgressPeriod(double period);

		double progressPeriod() const { return m_progressPeriod; }

	private:

		double m_dt;
		unsigned m_seed;
		bool m_logging;
		double m_progressPeriod;
};

}


NEURITE_DLL_PUBLIC
std::ostream& operator<<(std::ostream& o, neurite::Configuration const& conf);

#endif
