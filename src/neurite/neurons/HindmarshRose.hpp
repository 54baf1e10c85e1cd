#ifndef NEURITE_NEURONS_HINDMARSH_ROSE_HPP
#define NEURITE_NEURONS_HINDMARSH_ROSE_HPP

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
#include <neurite/NeuronGroup.hpp>

namespace neurite {

/*! \brief Hindmarsh-Rose bursting neuron
 *
 * \f[ dV/dt = y - a V^3 + b V^2 - z + I \f]
 * \f[ dy/dt = c - d V^2 - y \f]
 * \f[ dz/dt = r (s (V - V_{rest}) - z) \f]
 *
 * Spikes are detected as upward crossings of \c V_th. There is no reset.
 */
class NEURITE_DLL_PUBLIC HindmarshRose : public NeuronGroup
{
	public :

		enum {
			PARAM_A,
			PARAM_B,
			PARAM_C,
			PARAM_D,
			PARAM_R,
			PARAM_S,
			PARAM_V_REST,
			PARAM_V_TH,
			PARAM_COUNT
		};

		enum {
			STATE_V,
			STATE_Y,
			STATE_Z,
			STATE_INPUT,
			STATE_SPIKE,
			STATE_COUNT
		};

		HindmarshRose(const Configuration& conf,
				int size,
				const Parameters::overrides_t& overrides = Parameters::overrides_t());

		void update(double t);

	private :

		Integrator m_integrator;

		void derivative(double t, const double y[], const double aux[],
				double dydt[], double linear[]) const;
};

}

#endif
