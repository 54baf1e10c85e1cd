#ifndef NEURITE_NEURONS_IZHIKEVICH_HPP
#define NEURITE_NEURONS_IZHIKEVICH_HPP

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

/*! \brief Izhikevich (2003) simple spiking neuron
 *
 * \f[ dV/dt = 0.04 V^2 + 5 V + 140 - u + I \f]
 * \f[ du/dt = a (b V - u) \f]
 *
 * When V crosses \c V_th it is reset to \c c and \c d is added to u. For
 * \c t_refractory after a spike the unit holds its state.
 */
class NEURITE_DLL_PUBLIC Izhikevich : public NeuronGroup
{
	public :

		enum {
			PARAM_A,
			PARAM_B,
			PARAM_C,
			PARAM_D,
			PARAM_T_REFRACTORY,
			PARAM_V_TH,
			PARAM_COUNT
		};

		enum {
			STATE_V,
			STATE_U,
			STATE_INPUT,
			STATE_SPIKE,
			STATE_REFRACTORY,
			STATE_T_LAST_SPIKE,
			STATE_COUNT
		};

		Izhikevich(const Configuration& conf,
				int size,
				const Parameters::overrides_t& overrides = Parameters::overrides_t());

		void update(double t);

		bool refractory(nidx_t unit) const;

	private :

		Integrator m_integrator;

		/* y = (V, u), aux = (I) */
		void derivative(double t, const double y[], const double aux[],
				double dydt[], double linear[]) const;
};

}

#endif
