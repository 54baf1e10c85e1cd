#ifndef NEURITE_NEURONS_HODGKIN_HUXLEY_HPP
#define NEURITE_NEURONS_HODGKIN_HUXLEY_HPP

/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include <neurite/config.h>
#include <neurite/Integrator.hpp>
#include <neurite/NeuronGroup.hpp>

namespace neurite {

/*! Gating rates of the Hodgkin-Huxley model (V in mV, rates in 1/ms) */
namespace hh {

NEURITE_DLL_PUBLIC double alpha_m(double V);
NEURITE_DLL_PUBLIC double beta_m(double V);
NEURITE_DLL_PUBLIC double alpha_h(double V);
NEURITE_DLL_PUBLIC double beta_h(double V);
NEURITE_DLL_PUBLIC double alpha_n(double V);
NEURITE_DLL_PUBLIC double beta_n(double V);

}


/*! \brief Hodgkin-Huxley squid axon neuron
 *
 * The gating variables are integrated first with the Euler scheme and clipped
 * to [0,1]. The membrane potential is then integrated using the new gating
 * values. A spike is registered on the step V crosses \c V_th from below.
 * There is no reset and no refractory period.
 */
class NEURITE_DLL_PUBLIC HodgkinHuxley : public NeuronGroup
{
	public :

		enum {
			PARAM_V_TH,
			PARAM_C,
			PARAM_E_NA,
			PARAM_E_K,
			PARAM_E_LEAK,
			PARAM_G_NA,
			PARAM_G_K,
			PARAM_G_LEAK,
			PARAM_NOISE,
			PARAM_COUNT
		};

		enum {
			STATE_V,
			STATE_M,
			STATE_H,
			STATE_N,
			STATE_SPIKE,
			STATE_INPUT,
			STATE_COUNT
		};

		HodgkinHuxley(const Configuration& conf,
				int size,
				const Parameters::overrides_t& overrides = Parameters::overrides_t());

		void update(double t);

	private :

		Integrator m_gates;

		Integrator m_potential;

		/* y = (m, h, n), aux = (V) */
		void gateDerivative(double t, const double y[], const double aux[],
				double dydt[], double linear[]) const;

		/* y = (V), aux = (m, h, n, I) */
		void potentialDerivative(double t, const double y[], const double aux[],
				double dydt[], double linear[]) const;
};

}

#endif
