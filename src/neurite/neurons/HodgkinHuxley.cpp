/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include "HodgkinHuxley.hpp"

#include <algorithm>
#include <cmath>
#include <boost/bind.hpp>

#include <neurite/rates.hpp>

namespace neurite {

namespace hh {

double
alpha_m(double V)
{
	return linexp((V + 40.0) / 10.0);
}


double
beta_m(double V)
{
	return 4.0 * std::exp(-(V + 65.0) / 18.0);
}


double
alpha_h(double V)
{
	return 0.07 * std::exp(-(V + 65.0) / 20.0);
}


double
beta_h(double V)
{
	return 1.0 / (1.0 + std::exp(-(V + 35.0) / 10.0));
}


double
alpha_n(double V)
{
	return 0.1 * linexp((V + 55.0) / 10.0);
}


double
beta_n(double V)
{
	return 0.125 * std::exp(-(V + 65.0) / 80.0);
}

}



static const char* const HH_FIELDS[] = { "V", "m", "h", "n", "spike", "input" };

static const char* const HH_PARAM_NAMES[] = {
	"V_th", "C", "E_Na", "E_K", "E_leak", "g_Na", "g_K", "g_leak", "noise"
};

static const double HH_DEFAULTS[] = {
	20.0, 1.0, 50.0, -77.0, -54.387, 120.0, 36.0, 0.03, 0.0
};



HodgkinHuxley::HodgkinHuxley(
		const Configuration& conf,
		int size,
		const Parameters::overrides_t& overrides) :
	NeuronGroup(conf, size, HH_FIELDS, STATE_COUNT,
			Parameters("HodgkinHuxley", HH_PARAM_NAMES, HH_DEFAULTS, PARAM_COUNT, overrides),
			STATE_V, STATE_INPUT, STATE_SPIKE),
	m_gates(3, NEURITE_EULER, conf.timestep(),
			boost::bind(&HodgkinHuxley::gateDerivative, this, _1, _2, _3, _4, _5)),
	m_potential(1, NEURITE_EULER, conf.timestep(),
			boost::bind(&HodgkinHuxley::potentialDerivative, this, _1, _2, _3, _4, _5))
{
	m_params.requirePositive(PARAM_C);
	m_params.requireNonNegative(PARAM_G_NA);
	m_params.requireNonNegative(PARAM_G_K);
	m_params.requireNonNegative(PARAM_G_LEAK);
	m_params.requireNonNegative(PARAM_NOISE);

	initialisePotential(-65.0);
	m_state.fill(STATE_M, 0.05);
	m_state.fill(STATE_H, 0.60);
	m_state.fill(STATE_N, 0.32);

	if(m_params[PARAM_NOISE] > 0.0) {
		m_potential.setNoise(std::vector<double>(1, m_params[PARAM_NOISE] / m_params[PARAM_C]));
		initialiseNoise(conf.seed());
	}
}



void
HodgkinHuxley::gateDerivative(double /* t */,
		const double y[], const double aux[],
		double dydt[], double* /* linear */) const
{
	const double V = aux[0];
	dydt[0] = hh::alpha_m(V) * (1.0 - y[0]) - hh::beta_m(V) * y[0];
	dydt[1] = hh::alpha_h(V) * (1.0 - y[1]) - hh::beta_h(V) * y[1];
	dydt[2] = hh::alpha_n(V) * (1.0 - y[2]) - hh::beta_n(V) * y[2];
}



void
HodgkinHuxley::potentialDerivative(double /* t */,
		const double y[], const double aux[],
		double dydt[], double* /* linear */) const
{
	const double V = y[0];
	const double m = aux[0];
	const double h = aux[1];
	const double n = aux[2];
	const double I = aux[3];

	const double I_Na = m_params[PARAM_G_NA] * m * m * m * h * (V - m_params[PARAM_E_NA]);
	const double I_K = m_params[PARAM_G_K] * n * n * n * n * (V - m_params[PARAM_E_K]);
	const double I_leak = m_params[PARAM_G_LEAK] * (V - m_params[PARAM_E_LEAK]);

	dydt[0] = (-I_Na - I_K - I_leak + I) / m_params[PARAM_C];
}



void
HodgkinHuxley::update(double t)
{
	beginUpdate();

	double* V = m_state[STATE_V];
	const double* V0 = previousPotential();
	double* m = m_state[STATE_M];
	double* h = m_state[STATE_H];
	double* n = m_state[STATE_N];
	const double* I = m_state[STATE_INPUT];

	const double V_th = m_params[PARAM_V_TH];
	const bool noisy = m_potential.hasNoise();

	for(size_t i=0; i < size(); ++i) {

		double gates[3] = { m[i], h[i], n[i] };
		double next[3];
		m_gates.step(t, gates, &V[i], next);
		for(unsigned g=0; g < 3; ++g) {
			next[g] = std::min(1.0, std::max(0.0, next[g]));
		}

		double aux[4] = { next[0], next[1], next[2], I[i] };
		double V1;
		m_potential.step(t, &V[i], aux, &V1, noisy ? rng(i) : NULL);

		m[i] = next[0];
		h[i] = next[1];
		n[i] = next[2];

		if(crossed(V0[i], V1, V_th)) {
			setFired(i, t);
		}
		V[i] = V1;
	}

	endUpdate();
}

}
