/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include "NMDA.hpp"

#include <cmath>
#include <boost/bind.hpp>

namespace neurite {


static const char* const NMDA_FIELDS[] = { "x", "s", "g", "w" };

static const char* const NMDA_PARAM_NAMES[] = {
	"g_max", "E", "alpha", "beta", "cc_Mg", "tau_decay", "tau_rise", "a", "delay"
};

static const double NMDA_DEFAULTS[] = {
	0.15, 0.0, 0.062, 3.57, 1.2, 100.0, 2.0, 0.5, 0.0
};



NMDA::NMDA(
		const Configuration& conf,
		NeuronGroup& pre,
		NeuronGroup& post,
		const ConnectionMap& connections,
		const Parameters::overrides_t& overrides) :
	SynapseGroup(conf, pre, post, connections, NMDA_FIELDS, STATE_COUNT,
			Parameters("NMDA", NMDA_PARAM_NAMES, NMDA_DEFAULTS, PARAM_COUNT, overrides),
			PARAM_DELAY),
	m_integrator(2, NEURITE_EXPONENTIAL_EULER, conf.timestep(),
			boost::bind(&NMDA::derivative, this, _1, _2, _3, _4, _5))
{
	m_params.requirePositive(PARAM_TAU_DECAY);
	m_params.requirePositive(PARAM_TAU_RISE);
	m_params.requirePositive(PARAM_BETA);
	m_params.requireNonNegative(PARAM_CC_MG);
	initialiseWeights(STATE_W, PARAM_G_MAX);
}



void
NMDA::derivative(double /* t */,
		const double y[], const double* /* aux */,
		double dydt[], double linear[]) const
{
	const double x = y[0];
	const double s = y[1];
	const double a = m_params[PARAM_A];
	const double tau_rise = m_params[PARAM_TAU_RISE];
	const double tau_decay = m_params[PARAM_TAU_DECAY];

	dydt[0] = -x / tau_rise;
	linear[0] = -1.0 / tau_rise;

	dydt[1] = -s / tau_decay + a * x * (1.0 - s);
	linear[1] = -1.0 / tau_decay - a * x;
}



double
NMDA::magnesiumBlock(double V) const
{
	const double ratio = m_params[PARAM_CC_MG] / m_params[PARAM_BETA];
	return 1.0 / (1.0 + ratio * std::exp(-m_params[PARAM_ALPHA] * V));
}



void
NMDA::intake(sidx_t edge)
{
	m_state[STATE_X][edge] += 1.0;
}



void
NMDA::integrate(double t)
{
	double* x = m_state[STATE_X];
	double* s = m_state[STATE_S];
	double* g = m_state[STATE_G];
	const double* w = m_state[STATE_W];

	for(size_t e=0; e < size(); ++e) {
		double y0[2] = { x[e], s[e] };
		double y1[2];
		m_integrator.step(t, y0, NULL, y1);
		x[e] = y1[0];
		s[e] = y1[1];
		g[e] = w[e] * s[e];
	}
}



double
NMDA::contribution(sidx_t edge) const
{
	return m_state[STATE_G][edge];
}



void
NMDA::deliver(nidx_t target, double g)
{
	const double V = m_post.potential()[target];
	m_post.input()[target] -= g * (V - m_params[PARAM_E]) * magnesiumBlock(V);
}

}
