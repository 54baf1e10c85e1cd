#ifndef NEURITE_SYNAPSES_VOLTAGE_JUMP_HPP
#define NEURITE_SYNAPSES_VOLTAGE_JUMP_HPP

/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include <neurite/config.h>
#include <neurite/SynapseGroup.hpp>

namespace neurite {

/*! \brief Instantaneous voltage jump synapse
 *
 * A presynaptic spike raises the membrane potential of the postsynaptic unit
 * by \c weight, after the transmission delay. With \c post_refractory set,
 * jumps arriving while the target is refractory are dropped.
 *
 * Unlike the other synapse models the output bypasses the input accumulator
 * and changes V directly.
 */
class NEURITE_DLL_PUBLIC VoltageJump : public SynapseGroup
{
	public :

		enum {
			PARAM_WEIGHT,
			PARAM_DELAY,
			PARAM_POST_REFRACTORY,
			PARAM_COUNT
		};

		enum {
			STATE_S,
			STATE_W,
			STATE_COUNT
		};

		VoltageJump(const Configuration& conf,
				NeuronGroup& pre,
				NeuronGroup& post,
				const ConnectionMap& connections,
				const Parameters::overrides_t& overrides = Parameters::overrides_t());

	protected :

		void prepare();
		void intake(sidx_t edge);
		void integrate(double) { }
		double contribution(sidx_t edge) const;
		void deliver(nidx_t target, double value);
};

}

#endif
