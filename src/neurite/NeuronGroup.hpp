#ifndef NEURITE_NEURON_GROUP_HPP
#define NEURITE_NEURON_GROUP_HPP

/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include <string>
#include <vector>

#include <boost/noncopyable.hpp>

#include <neurite/config.h>
#include <neurite/types.h>
#include "Configuration.hpp"
#include "Parameters.hpp"
#include "RNG.hpp"
#include "StateVector.hpp"

namespace neurite {

/*! \brief Group of neurons of a single model
 *
 * The group owns the state of all its units and updates them in lockstep.
 * Each model has at least the state variables \c V (membrane potential),
 * \c input (accumulated input current) and \c spike (1 on the step a unit
 * fires, 0 otherwise).
 *
 * Input is accumulated by the caller and by synapse groups before the update,
 * and is consumed and zeroed by the update.
 */
class NEURITE_DLL_PUBLIC NeuronGroup : private boost::noncopyable
{
	public :

		virtual ~NeuronGroup() { }

		/*! Advance all units by one time step
		 *
		 * \param t simulation time at the start of the step
		 *
		 * \throws neurite::numerical_error if integration produces a
		 * 		non-finite value
		 */
		virtual void update(double t) = 0;

		/*! \return true if the unit is currently refractory. Models without a
		 * refractory period always return false. */
		virtual bool refractory(nidx_t unit) const;

		const std::string& model() const { return m_params.model(); }

		/*! \return number of units */
		size_t size() const { return m_state.size(); }

		double timestep() const { return m_dt; }

		/*! Add current to the input accumulator of a single unit
		 *
		 * \throws neurite::exception (NEURITE_INVALID_INPUT) if the unit index
		 * 		is out of range
		 */
		void addInput(nidx_t unit, double current);

		/*! \return the input accumulators of all units */
		double* input() { return m_state[m_inputField]; }

		/*! \return the membrane potential of all units */
		double* potential() { return m_state[m_vField]; }
		const double* potential() const { return m_state[m_vField]; }

		/*! \return spike flags of all units for the last update */
		const double* spikes() const { return m_state[m_spikeField]; }

		/*! \return indices of units which fired during the last update, in
		 * 		increasing order */
		const std::vector<unsigned>& fired() const { return m_fired; }

		StateVector& state() { return m_state; }
		const StateVector& state() const { return m_state; }

		const Parameters& parameters() const { return m_params; }

		/*! \return true if \a next reaches the threshold from below */
		static bool crossed(double prev, double next, double threshold) {
			return prev < threshold && next >= threshold;
		}

	protected :

		/*!
		 * \param conf global configuration, for the time step and seed
		 * \param size number of units
		 * \param fields names of the state variables of the model
		 * \param params parameters of the model
		 * \param vField index of the membrane potential in \a fields
		 * \param inputField index of the input accumulator in \a fields
		 * \param spikeField index of the spike flag in \a fields
		 *
		 * \throws neurite::configuration_error if \a size is negative
		 */
		NeuronGroup(const Configuration& conf,
				int size,
				const char* const fields[], unsigned nfields,
				const Parameters& params,
				unsigned vField, unsigned inputField, unsigned spikeField);

		/*! Clear the spike flags and fired list ahead of an update */
		void beginUpdate();

		/*! Record a spike for a unit during the current update */
		void setFired(nidx_t unit, double t);

		/*! Zero the input accumulators once the update has consumed them and
		 * record the potential for the next threshold test */
		void endUpdate();

		/*! Set the membrane potential of all units ahead of the first update */
		void initialisePotential(double V);

		/*! \return membrane potential of each unit at the end of its last
		 * 		update. Thresholds are tested against this rather than the
		 * 		live \c V, which synapses may have moved since. */
		const double* previousPotential() const {
			return m_vPrev.empty() ? NULL : &m_vPrev[0];
		}

		/*! \return true if a unit which last fired at \a t_last is still
		 * 		refractory at time \a t. The comparison is made in whole
		 * 		steps. */
		bool inRefractoryPeriod(double t, double t_last, double t_ref) const;

		/*! \return per-unit random number generator, for the noise term */
		RNG* rng(nidx_t unit) { return &m_rng[unit]; }

		/*! Allocate the per-unit generators */
		void initialiseNoise(unsigned seed);

		StateVector m_state;

		Parameters m_params;

		double m_dt;

		bool m_logging;

	private :

		unsigned m_vField;
		unsigned m_inputField;
		unsigned m_spikeField;

		std::vector<unsigned> m_fired;

		std::vector<double> m_vPrev;

		/* empty unless the model has a noise term */
		std::vector<RNG> m_rng;
};


/*! \return size as an unsigned value
 *
 * \throws neurite::configuration_error if size is negative */
NEURITE_DLL_PUBLIC size_t checkedGroupSize(const std::string& model, int size);

}

#endif
