/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include "HindmarshRose.hpp"

#include <boost/bind.hpp>

namespace neurite {


static const char* const HR_FIELDS[] = { "V", "y", "z", "input", "spike" };

static const char* const HR_PARAM_NAMES[] = {
	"a", "b", "c", "d", "r", "s", "V_rest", "V_th"
};

static const double HR_DEFAULTS[] = { 1.0, 3.0, 1.0, 5.0, 0.01, 4.0, -1.6, 1.0 };



HindmarshRose::HindmarshRose(
		const Configuration& conf,
		int size,
		const Parameters::overrides_t& overrides) :
	NeuronGroup(conf, size, HR_FIELDS, STATE_COUNT,
			Parameters("HindmarshRose", HR_PARAM_NAMES, HR_DEFAULTS, PARAM_COUNT, overrides),
			STATE_V, STATE_INPUT, STATE_SPIKE),
	m_integrator(3, NEURITE_EULER, conf.timestep(),
			boost::bind(&HindmarshRose::derivative, this, _1, _2, _3, _4, _5))
{
	initialisePotential(-1.6);
	m_state.fill(STATE_Y, -10.0);
	m_state.fill(STATE_Z, 0.0);
}



void
HindmarshRose::derivative(double /* t */,
		const double y[], const double aux[],
		double dydt[], double* /* linear */) const
{
	const double V = y[0];
	const double a = m_params[PARAM_A];
	const double b = m_params[PARAM_B];
	dydt[0] = y[1] - a * V * V * V + b * V * V - y[2] + aux[0];
	dydt[1] = m_params[PARAM_C] - m_params[PARAM_D] * V * V - y[1];
	dydt[2] = m_params[PARAM_R] * (m_params[PARAM_S] * (V - m_params[PARAM_V_REST]) - y[2]);
}



void
HindmarshRose::update(double t)
{
	beginUpdate();

	double* V = m_state[STATE_V];
	const double* V0 = previousPotential();
	double* y = m_state[STATE_Y];
	double* z = m_state[STATE_Z];
	const double* I = m_state[STATE_INPUT];
	const double V_th = m_params[PARAM_V_TH];

	for(size_t i=0; i < size(); ++i) {
		double y0[3] = { V[i], y[i], z[i] };
		double y1[3];
		m_integrator.step(t, y0, &I[i], y1);
		if(crossed(V0[i], y1[0], V_th)) {
			setFired(i, t);
		}
		V[i] = y1[0];
		y[i] = y1[1];
		z[i] = y1[2];
	}

	endUpdate();
}

}
