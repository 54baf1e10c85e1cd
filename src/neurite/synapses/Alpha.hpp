#ifndef NEURITE_SYNAPSES_ALPHA_HPP
#define NEURITE_SYNAPSES_ALPHA_HPP

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

/*! \brief Alpha-function synapse
 *
 * \f[ ds/dt = x \f]
 * \f[ dx/dt = (-2 \tau x - s) / \tau^2 \f]
 *
 * Spikes increment x. The output is \c weight * s, delivered as a current or,
 * with \c conductance non-zero, as a conductance with reversal potential \c E.
 */
class NEURITE_DLL_PUBLIC Alpha : public SynapseGroup
{
	public :

		enum {
			PARAM_TAU,
			PARAM_DELAY,
			PARAM_WEIGHT,
			PARAM_E,
			PARAM_CONDUCTANCE,
			PARAM_COUNT
		};

		enum {
			STATE_S,
			STATE_X,
			STATE_W,
			STATE_COUNT
		};

		Alpha(const Configuration& conf,
				NeuronGroup& pre,
				NeuronGroup& post,
				const ConnectionMap& connections,
				const Parameters::overrides_t& overrides = Parameters::overrides_t());

	protected :

		void intake(sidx_t edge);
		void integrate(double t);
		double contribution(sidx_t edge) const;
		void deliver(nidx_t target, double value);

	private :

		Integrator m_integrator;

		void derivative(double t, const double y[], const double aux[],
				double dydt[], double linear[]) const;
};

}

#endif
