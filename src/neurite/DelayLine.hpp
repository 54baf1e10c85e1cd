#ifndef NEURITE_DELAY_LINE_HPP
#define NEURITE_DELAY_LINE_HPP

/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include <cstddef>
#include <boost/multi_array.hpp>

#include <neurite/config.h>
#include <neurite/types.h>

namespace neurite {

/*! \brief Fixed-length ring buffer modelling a transmission delay
 *
 * A delay of D whole steps is modelled with D+1 slots, each holding one value
 * per channel. Within a step values are pushed before they are pulled, so that
 * with D=0 a value comes out the same step it went in. A value pushed during
 * step k is returned by pull during step k+D. All slots start out at zero.
 */
class NEURITE_DLL_PUBLIC DelayLine
{
	public :

		/*!
		 * \param delay transmission delay in simulation time units
		 * \param dt simulation time step
		 * \param width number of independent channels
		 *
		 * \throws neurite::delay_line_underrun if the delay or time step is
		 * 		such that the buffer would hold less than one slot
		 */
		DelayLine(double delay, double dt, size_t width = 1);

		/*! \return delay in whole steps */
		unsigned delaySteps() const { return m_capacity - 1; }

		/*! \return number of slots */
		unsigned capacity() const { return m_capacity; }

		/*! \return number of channels */
		size_t width() const { return m_width; }

		/*! Store one value per channel in the slot which is due \a
		 * delaySteps() from now. Any previous content of that slot is
		 * overwritten. */
		void push(const double values[]);

		/*! Push a single value into a one-channel line */
		void push(double value);

		/*! \return value due this step on the given channel */
		double pull(size_t channel = 0) const;

		/*! \return all channels of the slot due this step */
		const double* pullAll() const;

		/*! Move on to the next step. The slot due this step is cleared, so a
		 * value is delivered only once even if nothing is pushed in its place. */
		void advance();

		cycle_t step() const { return m_step; }

	private :

		unsigned m_capacity;

		size_t m_width;

		cycle_t m_step;

		/* The indices here are:
		 *
		 * 1. (outer) slot
		 * 2. (inner) channel
		 */
		typedef boost::multi_array<double, 2> array_type;
		array_type m_slots;

		size_t pushSlot() const { return size_t((m_step + m_capacity - 1) % m_capacity); }
		size_t pullSlot() const { return size_t(m_step % m_capacity); }
};

}

#endif
