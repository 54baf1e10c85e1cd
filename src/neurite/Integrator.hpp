#ifndef NEURITE_INTEGRATOR_HPP
#define NEURITE_INTEGRATOR_HPP

/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include <vector>
#include <boost/function.hpp>

#include <neurite/config.h>
#include <neurite/types.h>
#include "RNG.hpp"

namespace neurite {

/*! \brief Fixed-step integrator for a small system of coupled ODEs
 *
 * The integrator advances the state of a single unit by one timestep. The
 * system is given by a derivative function which is evaluated once per step.
 * Groups hold one integrator per coupled subsystem (e.g. gating variables and
 * membrane potential) and call \a step for each unit.
 *
 * Two schemes are supported:
 *
 * - NEURITE_EULER: y' = y + dt * f(y)
 * - NEURITE_EXPONENTIAL_EULER: y' = y + dt * phi(a*dt) * f(y), where
 *   a = df/dy is the diagonal linear coefficient reported by the derivative
 *   function and phi(z) = (exp(z)-1)/z. Linear decay is thus solved exactly,
 *   while nonlinear coupling is treated as in the Euler scheme.
 *
 * An optional diffusion term sigma * sqrt(dt) * N(0,1) is added to each
 * variable with non-zero noise amplitude (Euler-Maruyama).
 */
class NEURITE_DLL_PUBLIC Integrator
{
	public :

		/*! Largest supported system dimension */
		static const unsigned MAX_DIMENSION = 8;

		/*! Derivative function
		 *
		 * \param t current time
		 * \param y current state (one value per variable)
		 * \param aux coupling terms supplied by the caller
		 * \param dydt output: derivative of each variable
		 * \param linear output: diagonal linear coefficient df_i/dy_i. This
		 * 		is initialised to zero before each call, and can be left
		 * 		untouched by systems only integrated with the Euler scheme.
		 */
		typedef boost::function<void (double t, const double y[], const double aux[],
				double dydt[], double linear[])> derivative_t;

		/*!
		 * \throws neurite::numerical_error if dt <= 0
		 * \throws neurite::configuration_error for an unknown scheme or an
		 * 		invalid dimension
		 */
		Integrator(unsigned dimension, scheme_t scheme, double dt, const derivative_t& f);

		/*! Set per-variable noise amplitudes
		 *
		 * \pre sigma has one entry per variable
		 */
		void setNoise(const std::vector<double>& sigma);

		bool hasNoise() const { return !m_sigma.empty(); }

		/*! Advance the state by one step
		 *
		 * \param t current time
		 * \param y current state
		 * \param aux coupling terms passed to the derivative function
		 * \param out next state. May not alias \a y.
		 * \param rng generator for the noise term. Required if noise is set.
		 *
		 * \throws neurite::numerical_error if any output is not finite
		 */
		void step(double t, const double y[], const double aux[], double out[], RNG* rng = NULL) const;

		unsigned dimension() const { return m_dimension; }

		scheme_t scheme() const { return m_scheme; }

		double timestep() const { return m_dt; }

	private :

		unsigned m_dimension;

		scheme_t m_scheme;

		double m_dt;

		derivative_t m_derivative;

		/* empty if there is no noise */
		std::vector<double> m_sigma;
};

}

#endif
