#ifndef NEURITE_SYNAPSES_NMDA_HPP
#define NEURITE_SYNAPSES_NMDA_HPP

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
#include <neurite/SynapseGroup.hpp>

namespace neurite {

/*! \brief NMDA receptor synapse with magnesium block
 *
 * \f[ dx/dt = -x / \tau_{rise} \f]
 * \f[ ds/dt = -s / \tau_{decay} + a x (1 - s) \f]
 *
 * Spikes increment x. The synaptic conductance is g = g_max s, and the
 * current delivered to the postsynaptic unit is
 *
 * \f[ I = -g (V - E) B(V), \quad B(V) = 1 / (1 + [Mg]/\beta \, e^{-\alpha V}) \f]
 *
 * with B evaluated at the time of delivery.
 */
class NEURITE_DLL_PUBLIC NMDA : public SynapseGroup
{
	public :

		enum {
			PARAM_G_MAX,
			PARAM_E,
			PARAM_ALPHA,
			PARAM_BETA,
			PARAM_CC_MG,
			PARAM_TAU_DECAY,
			PARAM_TAU_RISE,
			PARAM_A,
			PARAM_DELAY,
			PARAM_COUNT
		};

		enum {
			STATE_X,
			STATE_S,
			STATE_G,
			STATE_W,
			STATE_COUNT
		};

		NMDA(const Configuration& conf,
				NeuronGroup& pre,
				NeuronGroup& post,
				const ConnectionMap& connections,
				const Parameters::overrides_t& overrides = Parameters::overrides_t());

		/*! \return fraction of the NMDA conductance not blocked by magnesium
		 * 		at membrane potential V */
		double magnesiumBlock(double V) const;

	protected :

		void intake(sidx_t edge);
		void integrate(double t);
		double contribution(sidx_t edge) const;
		void deliver(nidx_t target, double value);

	private :

		Integrator m_integrator;

		/* y = (x, s) */
		void derivative(double t, const double y[], const double aux[],
				double dydt[], double linear[]) const;
};

}

#endif
