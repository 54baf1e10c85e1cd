/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include "Alpha.hpp"

#include <boost/bind.hpp>

namespace neurite {


static const char* const ALPHA_FIELDS[] = { "s", "x", "w" };

static const char* const ALPHA_PARAM_NAMES[] = { "tau", "delay", "weight", "E", "conductance" };

static const double ALPHA_DEFAULTS[] = { 2.0, 0.0, 0.2, 0.0, 0.0 };



Alpha::Alpha(
		const Configuration& conf,
		NeuronGroup& pre,
		NeuronGroup& post,
		const ConnectionMap& connections,
		const Parameters::overrides_t& overrides) :
	SynapseGroup(conf, pre, post, connections, ALPHA_FIELDS, STATE_COUNT,
			Parameters("Alpha", ALPHA_PARAM_NAMES, ALPHA_DEFAULTS, PARAM_COUNT, overrides),
			PARAM_DELAY),
	m_integrator(2, NEURITE_EULER, conf.timestep(),
			boost::bind(&Alpha::derivative, this, _1, _2, _3, _4, _5))
{
	m_params.requirePositive(PARAM_TAU);
	initialiseWeights(STATE_W, PARAM_WEIGHT);
}



void
Alpha::derivative(double /* t */,
		const double y[], const double* /* aux */,
		double dydt[], double* /* linear */) const
{
	const double tau = m_params[PARAM_TAU];
	dydt[0] = y[1];
	dydt[1] = (-2.0 * tau * y[1] - y[0]) / (tau * tau);
}



void
Alpha::intake(sidx_t edge)
{
	m_state[STATE_X][edge] += 1.0;
}



void
Alpha::integrate(double t)
{
	double* s = m_state[STATE_S];
	double* x = m_state[STATE_X];
	for(size_t e=0; e < size(); ++e) {
		double y0[2] = { s[e], x[e] };
		double y1[2];
		m_integrator.step(t, y0, NULL, y1);
		s[e] = y1[0];
		x[e] = y1[1];
	}
}



double
Alpha::contribution(sidx_t edge) const
{
	return m_state[STATE_W][edge] * m_state[STATE_S][edge];
}



void
Alpha::deliver(nidx_t target, double value)
{
	if(m_params[PARAM_CONDUCTANCE] != 0.0) {
		const double V = m_post.potential()[target];
		m_post.input()[target] -= value * (V - m_params[PARAM_E]);
	} else {
		SynapseGroup::deliver(target, value);
	}
}

}
