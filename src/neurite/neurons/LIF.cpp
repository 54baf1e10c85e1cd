/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include "LIF.hpp"

#include <boost/bind.hpp>

namespace neurite {


static const char* const LIF_FIELDS[] = {
	"V", "input", "spike", "refractory", "t_last_spike"
};

static const char* const LIF_PARAM_NAMES[] = {
	"V_rest", "V_reset", "V_th", "R", "tau", "t_refractory"
};

static const double LIF_DEFAULTS[] = { 0.0, -5.0, 20.0, 1.0, 10.0, 5.0 };



LIF::LIF(const Configuration& conf,
		int size,
		const Parameters::overrides_t& overrides) :
	NeuronGroup(conf, size, LIF_FIELDS, STATE_COUNT,
			Parameters("LIF", LIF_PARAM_NAMES, LIF_DEFAULTS, PARAM_COUNT, overrides),
			STATE_V, STATE_INPUT, STATE_SPIKE),
	m_integrator(1, NEURITE_EXPONENTIAL_EULER, conf.timestep(),
			boost::bind(&LIF::derivative, this, _1, _2, _3, _4, _5))
{
	m_params.requirePositive(PARAM_TAU);
	m_params.requireNonNegative(PARAM_T_REFRACTORY);

	initialisePotential(m_params[PARAM_V_REST]);
	m_state.fill(STATE_T_LAST_SPIKE, -1e7);
}



void
LIF::derivative(double /* t */,
		const double y[], const double aux[],
		double dydt[], double linear[]) const
{
	const double tau = m_params[PARAM_TAU];
	dydt[0] = (-(y[0] - m_params[PARAM_V_REST]) + m_params[PARAM_R] * aux[0]) / tau;
	linear[0] = -1.0 / tau;
}



bool
LIF::refractory(nidx_t unit) const
{
	return m_state.get(STATE_REFRACTORY, unit) != 0.0;
}



void
LIF::update(double t)
{
	beginUpdate();

	double* V = m_state[STATE_V];
	const double* V0 = previousPotential();
	double* refractory = m_state[STATE_REFRACTORY];
	double* t_last = m_state[STATE_T_LAST_SPIKE];
	const double* I = m_state[STATE_INPUT];

	const double t_ref = m_params[PARAM_T_REFRACTORY];
	const double V_th = m_params[PARAM_V_TH];

	for(size_t i=0; i < size(); ++i) {

		double V1;
		m_integrator.step(t, &V[i], &I[i], &V1);

		if(inRefractoryPeriod(t, t_last[i], t_ref)) {
			refractory[i] = 1.0;
			continue;
		}

		if(crossed(V0[i], V1, V_th)) {
			V[i] = m_params[PARAM_V_RESET];
			t_last[i] = t;
			refractory[i] = 1.0;
			setFired(i, t);
		} else {
			V[i] = V1;
			refractory[i] = 0.0;
		}
	}

	endUpdate();
}

}
