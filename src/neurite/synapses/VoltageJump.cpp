/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include "VoltageJump.hpp"

namespace neurite {


static const char* const VJ_FIELDS[] = { "s", "w" };

static const char* const VJ_PARAM_NAMES[] = { "weight", "delay", "post_refractory" };

static const double VJ_DEFAULTS[] = { 1.0, 0.0, 0.0 };



VoltageJump::VoltageJump(
		const Configuration& conf,
		NeuronGroup& pre,
		NeuronGroup& post,
		const ConnectionMap& connections,
		const Parameters::overrides_t& overrides) :
	SynapseGroup(conf, pre, post, connections, VJ_FIELDS, STATE_COUNT,
			Parameters("VoltageJump", VJ_PARAM_NAMES, VJ_DEFAULTS, PARAM_COUNT, overrides),
			PARAM_DELAY)
{
	initialiseWeights(STATE_W, PARAM_WEIGHT);
}



/* s only reflects spikes from the most recent step */
void
VoltageJump::prepare()
{
	m_state.fill(STATE_S, 0.0);
}



void
VoltageJump::intake(sidx_t edge)
{
	m_state[STATE_S][edge] += 1.0;
}



double
VoltageJump::contribution(sidx_t edge) const
{
	return m_state[STATE_W][edge] * m_state[STATE_S][edge];
}



void
VoltageJump::deliver(nidx_t target, double value)
{
	if(m_params[PARAM_POST_REFRACTORY] != 0.0 && m_post.refractory(target)) {
		return;
	}
	m_post.potential()[target] += value;
}

}
