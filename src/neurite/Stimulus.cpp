/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include "Stimulus.hpp"

#include <cmath>
#include <boost/format.hpp>
#include <boost/math/special_functions/fpclassify.hpp>

#include "exception.hpp"

namespace neurite {


std::vector<double>
constantCurrent(const std::vector<segment_t>& segments, double dt)
{
	using boost::format;

	if(!(dt > 0.0) || !boost::math::isfinite(dt)) {
		throw configuration_error(str(format("Invalid stimulus time step %g") % dt));
	}

	std::vector<double> currents;
	for(std::vector<segment_t>::const_iterator i = segments.begin(); i != segments.end(); ++i) {
		const double value = i->first;
		const double duration = i->second;
		if(!boost::math::isfinite(value)) {
			throw configuration_error("Non-finite stimulus value");
		}
		if(!(duration >= 0.0) || !boost::math::isfinite(duration)) {
			throw configuration_error(str(format("Invalid stimulus segment duration %g") % duration));
		}
		size_t steps = size_t(std::floor(duration / dt + 0.5));
		currents.insert(currents.end(), steps, value);
	}
	return currents;
}

}
