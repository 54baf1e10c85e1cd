/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include "Exponential.hpp"

#include <boost/bind.hpp>

namespace neurite {


static const char* const EXP_FIELDS[] = { "s", "w" };

static const char* const EXP_PARAM_NAMES[] = { "tau", "delay", "weight", "E", "conductance" };

static const double EXP_DEFAULTS[] = { 8.0, 0.0, 0.1, 0.0, 0.0 };



Exponential::Exponential(
		const Configuration& conf,
		NeuronGroup& pre,
		NeuronGroup& post,
		const ConnectionMap& connections,
		const Parameters::overrides_t& overrides) :
	SynapseGroup(conf, pre, post, connections, EXP_FIELDS, STATE_COUNT,
			Parameters("Exponential", EXP_PARAM_NAMES, EXP_DEFAULTS, PARAM_COUNT, overrides),
			PARAM_DELAY),
	m_integrator(1, NEURITE_EXPONENTIAL_EULER, conf.timestep(),
			boost::bind(&Exponential::derivative, this, _1, _2, _3, _4, _5))
{
	m_params.requirePositive(PARAM_TAU);
	initialiseWeights(STATE_W, PARAM_WEIGHT);
}



void
Exponential::derivative(double /* t */,
		const double y[], const double* /* aux */,
		double dydt[], double linear[]) const
{
	const double tau = m_params[PARAM_TAU];
	dydt[0] = -y[0] / tau;
	linear[0] = -1.0 / tau;
}



void
Exponential::intake(sidx_t edge)
{
	m_state[STATE_S][edge] += 1.0;
}



void
Exponential::integrate(double t)
{
	double* s = m_state[STATE_S];
	for(size_t e=0; e < size(); ++e) {
		double s1;
		m_integrator.step(t, &s[e], NULL, &s1);
		s[e] = s1;
	}
}



double
Exponential::contribution(sidx_t edge) const
{
	return m_state[STATE_W][edge] * m_state[STATE_S][edge];
}



void
Exponential::deliver(nidx_t target, double value)
{
	if(m_params[PARAM_CONDUCTANCE] != 0.0) {
		const double V = m_post.potential()[target];
		m_post.input()[target] -= value * (V - m_params[PARAM_E]);
	} else {
		SynapseGroup::deliver(target, value);
	}
}

}
