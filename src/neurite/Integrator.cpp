/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include "Integrator.hpp"

#include <cmath>
#include <boost/format.hpp>
#include <boost/math/special_functions/fpclassify.hpp>

#include "exception.hpp"
#include "rates.hpp"

namespace neurite {


const unsigned Integrator::MAX_DIMENSION;


Integrator::Integrator(unsigned dimension,
		scheme_t scheme,
		double dt,
		const derivative_t& f) :
	m_dimension(dimension),
	m_scheme(scheme),
	m_dt(dt),
	m_derivative(f)
{
	using boost::format;

	if(!(dt > 0.0) || !boost::math::isfinite(dt)) {
		throw numerical_error(str(format("Invalid integration timestep %g. The timestep must be positive") % dt));
	}

	if(dimension == 0 || dimension > MAX_DIMENSION) {
		throw configuration_error(
				str(format("Invalid system dimension %u. Integrator supports 1-%u variables")
					% dimension % MAX_DIMENSION));
	}

	switch(scheme) {
		case NEURITE_EULER :
		case NEURITE_EXPONENTIAL_EULER :
			break;
		default :
			throw configuration_error(str(format("Invalid integration scheme %u") % scheme));
	}

	assert_or_throw(!m_derivative.empty(), "Integrator created without derivative function");
}



void
Integrator::setNoise(const std::vector<double>& sigma)
{
	using boost::format;

	if(sigma.size() != m_dimension) {
		throw configuration_error(
				str(format("Unexpected number of noise amplitudes. Expected %u, found %u")
					% m_dimension % sigma.size()));
	}

	bool any = false;
	for(std::vector<double>::const_iterator i = sigma.begin(); i != sigma.end(); ++i) {
		any = any || *i != 0.0;
	}

	if(any) {
		m_sigma = sigma;
	} else {
		m_sigma.clear();
	}
}



void
Integrator::step(double t, const double y[], const double aux[], double out[], RNG* rng) const
{
	using boost::format;

	double dydt[MAX_DIMENSION];
	double linear[MAX_DIMENSION];
	for(unsigned i=0; i < m_dimension; ++i) {
		linear[i] = 0.0;
	}

	m_derivative(t, y, aux, dydt, linear);

	if(m_scheme == NEURITE_EXPONENTIAL_EULER) {
		for(unsigned i=0; i < m_dimension; ++i) {
			out[i] = y[i] + m_dt * phi(linear[i] * m_dt) * dydt[i];
		}
	} else {
		for(unsigned i=0; i < m_dimension; ++i) {
			out[i] = y[i] + m_dt * dydt[i];
		}
	}

	if(!m_sigma.empty()) {
		assert_or_throw(rng != NULL, "Integrator with noise stepped without random number generator");
		const double sqrtDt = std::sqrt(m_dt);
		for(unsigned i=0; i < m_dimension; ++i) {
			if(m_sigma[i] != 0.0) {
				out[i] += m_sigma[i] * sqrtDt * nrand(rng);
			}
		}
	}

	for(unsigned i=0; i < m_dimension; ++i) {
		if(!boost::math::isfinite(out[i])) {
			throw numerical_error(
					str(format("Non-finite value of state variable %u at t=%gms (previous value %g)")
						% i % t % y[i]));
		}
	}
}


}
