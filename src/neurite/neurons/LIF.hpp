#ifndef NEURITE_NEURONS_LIF_HPP
#define NEURITE_NEURONS_LIF_HPP

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

/*! \brief Leaky integrate-and-fire neuron
 *
 * \f[ \tau dV/dt = -(V - V_{rest}) + R I \f]
 *
 * integrated with the exponential-Euler scheme. On crossing \c V_th the
 * potential is reset to \c V_reset and held there for \c t_refractory.
 */
class NEURITE_DLL_PUBLIC LIF : public NeuronGroup
{
	public :

		enum {
			PARAM_V_REST,
			PARAM_V_RESET,
			PARAM_V_TH,
			PARAM_R,
			PARAM_TAU,
			PARAM_T_REFRACTORY,
			PARAM_COUNT
		};

		enum {
			STATE_V,
			STATE_INPUT,
			STATE_SPIKE,
			STATE_REFRACTORY,
			STATE_T_LAST_SPIKE,
			STATE_COUNT
		};

		LIF(const Configuration& conf,
				int size,
				const Parameters::overrides_t& overrides = Parameters::overrides_t());

		void update(double t);

		bool refractory(nidx_t unit) const;

	private :

		Integrator m_integrator;

		void derivative(double t, const double y[], const double aux[],
				double dydt[], double linear[]) const;
};

}

#endif
