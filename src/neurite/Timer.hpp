#ifndef NEURITE_TIMER_HPP
#define NEURITE_TIMER_HPP

/* Copyright 2010 Imperial College London
 * Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/numeric/conversion/cast.hpp>

#include <neurite/types.h>

namespace neurite {

/*! \brief Simulation clock measuring both simulated and wall-clock time.
 *
 * Simulated time advances in fixed steps of \a dt. The elapsed simulated time
 * is computed from the step count rather than accumulated, so that long runs
 * do not drift.
 */
class Timer
{
	public:

		explicit Timer(double dt) : m_dt(dt) { reset(); }

		/*! Update internal counters. Should be called for every simulation
		 * step. */
		void step() { m_steps++ ; }

		/*! \return elapsed wall-clock time in milliseconds */
		unsigned long elapsedWallclock() const;

		/*! \return number of steps taken */
		cycle_t elapsedSteps() const { return m_steps; }

		/*! \return current simulation time in milliseconds */
		double time() const { return m_steps * m_dt; }

		/*! Reset internal counters. */
		void reset();

	private:

		boost::posix_time::ptime m_start;

		cycle_t m_steps;

		double m_dt;
};



inline
unsigned long
Timer::elapsedWallclock() const
{
	using namespace boost::posix_time;

	time_duration elapsed = ptime(microsec_clock::local_time()) - m_start;
	return boost::numeric_cast<unsigned long, time_duration::tick_type>(elapsed.total_milliseconds());
}



inline
void
Timer::reset()
{
	using namespace boost::posix_time;
	m_start = ptime(microsec_clock::local_time());
	m_steps = 0;
}

}

#endif
