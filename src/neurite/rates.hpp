#ifndef NEURITE_RATES_HPP
#define NEURITE_RATES_HPP

/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

/*! \file rates.hpp Helpers for rate expressions with removable singularities */

#include <cmath>

namespace neurite {

/*! Width of the neighbourhood around a removable singularity in which the
 * continuous limit is used instead of the naive expression */
const double SINGULARITY_EPSILON = 1e-7;


/*! \return x / (1 - exp(-x)), with the limit 1 at x = 0
 *
 * This is the form taken by the Hodgkin-Huxley alpha_m and alpha_n rates. */
inline
double
linexp(double x)
{
	if(std::fabs(x) < SINGULARITY_EPSILON) {
		/* first-order expansion of the limit */
		return 1.0 + 0.5 * x;
	}
	return x / (1.0 - std::exp(-x));
}


/*! \return (exp(z) - 1) / z, with the limit 1 at z = 0
 *
 * Exponential-Euler step factor: the linear part of the derivative is
 * integrated exactly over a step of length dt via dt * phi(a * dt). */
inline
double
phi(double z)
{
	if(std::fabs(z) < SINGULARITY_EPSILON) {
		return 1.0 + 0.5 * z;
	}
	return std::expm1(z) / z;
}

} // end namespace neurite

#endif
