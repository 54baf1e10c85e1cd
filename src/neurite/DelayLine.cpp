/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include "DelayLine.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <boost/format.hpp>
#include <boost/math/special_functions/fpclassify.hpp>

#include "exception.hpp"

namespace neurite {


/* Delays which are an exact multiple of the time step should not be rounded
 * up just because the division is slightly inexact */
const double ROUNDING_TOLERANCE = 1e-9;

/* Anything larger is certainly a configuration mistake */
const double MAX_DELAY_STEPS = double(std::numeric_limits<unsigned>::max() / 2);


static
unsigned
delayCapacity(double delay, double dt)
{
	using boost::format;

	if(!boost::math::isfinite(dt) || dt <= 0.0) {
		throw delay_line_underrun(str(format("Invalid time step %g for delay line") % dt));
	}
	if(!boost::math::isfinite(delay) || delay < 0.0) {
		throw delay_line_underrun(str(format("Invalid delay %g: delay line would have no slots") % delay));
	}

	double steps = std::ceil(delay / dt - ROUNDING_TOLERANCE);
	if(steps < 0.0) {
		steps = 0.0;
	}
	if(steps > MAX_DELAY_STEPS) {
		throw configuration_error(str(format("Delay %g is too long for time step %g") % delay % dt));
	}
	return unsigned(steps) + 1;
}



DelayLine::DelayLine(double delay, double dt, size_t width) :
	m_capacity(delayCapacity(delay, dt)),
	m_width(width),
	m_step(0),
	m_slots(boost::extents[m_capacity][width])
{
	std::fill(m_slots.data(), m_slots.data() + m_slots.num_elements(), 0.0);
}



void
DelayLine::push(const double values[])
{
	std::copy(values, values + m_width, m_slots.data() + pushSlot() * m_width);
}



void
DelayLine::push(double value)
{
	assert_or_throw(m_width == 1, "scalar push into a multi-channel delay line");
	m_slots[pushSlot()][0] = value;
}



double
DelayLine::pull(size_t channel) const
{
	using boost::format;
	if(channel >= m_width) {
		throw exception(NEURITE_INVALID_INPUT,
				str(format("Delay line channel %u out of range (width %u)") % channel % m_width));
	}
	return m_slots[pullSlot()][channel];
}



const double*
DelayLine::pullAll() const
{
	return m_slots.data() + pullSlot() * m_width;
}



void
DelayLine::advance()
{
	double* slot = m_slots.data() + pullSlot() * m_width;
	std::fill(slot, slot + m_width, 0.0);
	m_step += 1;
}

}
