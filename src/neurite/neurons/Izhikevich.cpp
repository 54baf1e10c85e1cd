/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include "Izhikevich.hpp"

#include <boost/bind.hpp>

namespace neurite {


static const char* const IZ_FIELDS[] = {
	"V", "u", "input", "spike", "refractory", "t_last_spike"
};

static const char* const IZ_PARAM_NAMES[] = {
	"a", "b", "c", "d", "t_refractory", "V_th"
};

static const double IZ_DEFAULTS[] = { 0.02, 0.2, -65.0, 8.0, 0.0, 30.0 };



Izhikevich::Izhikevich(
		const Configuration& conf,
		int size,
		const Parameters::overrides_t& overrides) :
	NeuronGroup(conf, size, IZ_FIELDS, STATE_COUNT,
			Parameters("Izhikevich", IZ_PARAM_NAMES, IZ_DEFAULTS, PARAM_COUNT, overrides),
			STATE_V, STATE_INPUT, STATE_SPIKE),
	m_integrator(2, NEURITE_EULER, conf.timestep(),
			boost::bind(&Izhikevich::derivative, this, _1, _2, _3, _4, _5))
{
	m_params.requireNonNegative(PARAM_T_REFRACTORY);

	initialisePotential(-65.0);
	m_state.fill(STATE_U, 1.0);
	m_state.fill(STATE_T_LAST_SPIKE, -1e7);
}



void
Izhikevich::derivative(double /* t */,
		const double y[], const double aux[],
		double dydt[], double* /* linear */) const
{
	const double V = y[0];
	const double u = y[1];
	dydt[0] = 0.04 * V * V + 5.0 * V + 140.0 - u + aux[0];
	dydt[1] = m_params[PARAM_A] * (m_params[PARAM_B] * V - u);
}



bool
Izhikevich::refractory(nidx_t unit) const
{
	return m_state.get(STATE_REFRACTORY, unit) != 0.0;
}



void
Izhikevich::update(double t)
{
	beginUpdate();

	double* V = m_state[STATE_V];
	const double* V0 = previousPotential();
	double* u = m_state[STATE_U];
	double* refractory = m_state[STATE_REFRACTORY];
	double* t_last = m_state[STATE_T_LAST_SPIKE];
	const double* I = m_state[STATE_INPUT];

	const double t_ref = m_params[PARAM_T_REFRACTORY];
	const double V_th = m_params[PARAM_V_TH];

	for(size_t i=0; i < size(); ++i) {

		double y[2] = { V[i], u[i] };
		double next[2];
		m_integrator.step(t, y, &I[i], next);

		if(inRefractoryPeriod(t, t_last[i], t_ref)) {
			refractory[i] = 1.0;
			continue;
		}

		refractory[i] = 0.0;
		if(crossed(V0[i], next[0], V_th)) {
			V[i] = m_params[PARAM_C];
			u[i] = next[1] + m_params[PARAM_D];
			t_last[i] = t;
			refractory[i] = 1.0;
			setFired(i, t);
		} else {
			V[i] = next[0];
			u[i] = next[1];
		}
	}

	endUpdate();
}

}
