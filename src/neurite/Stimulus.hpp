#ifndef NEURITE_STIMULUS_HPP
#define NEURITE_STIMULUS_HPP

/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include <utility>
#include <vector>

#include <neurite/config.h>

namespace neurite {

/*! (value, duration) pair describing one constant segment of a stimulus */
typedef std::pair<double, double> segment_t;

/*! \return per-step current for a piecewise-constant stimulus
 *
 * Each segment is held for round(duration/dt) steps.
 *
 * \throws neurite::configuration_error if dt is not positive, or if any
 * 		duration is negative or any value is not finite
 */
NEURITE_DLL_PUBLIC
std::vector<double>
constantCurrent(const std::vector<segment_t>& segments, double dt);

}

#endif
