#ifndef NEURITE_SYNAPSE_GROUP_HPP
#define NEURITE_SYNAPSE_GROUP_HPP

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
#include "ConnectionMap.hpp"
#include "DelayLine.hpp"
#include "NeuronGroup.hpp"
#include "Parameters.hpp"
#include "StateVector.hpp"

namespace neurite {

/*! \brief Group of synapses of a single model between two neuron groups
 *
 * The state holds one entry per edge of the connection map. Each step
 *
 * 1. every edge leaving a unit which fired in the previous step takes in
 *    the spike (models add to a gating variable, so that several spikes
 *    accumulate),
 * 2. the gating variables are integrated,
 * 3. the per-edge output is summed per postsynaptic unit and pushed through
 *    the delay line,
 * 4. the output due this step is delivered to the postsynaptic group.
 *
 * The pre- and postsynaptic groups must outlive the synapse group.
 */
class NEURITE_DLL_PUBLIC SynapseGroup : private boost::noncopyable
{
	public :

		virtual ~SynapseGroup() { }

		/*! Advance all synapses by one step and deliver their output
		 *
		 * \param t simulation time at the start of the step
		 *
		 * \throws neurite::numerical_error if integration produces a
		 * 		non-finite value
		 */
		void update(double t);

		const std::string& model() const { return m_params.model(); }

		/*! \return number of synapses */
		size_t size() const { return m_state.size(); }

		NeuronGroup& pre() { return m_pre; }
		NeuronGroup& post() { return m_post; }

		const ConnectionMap& connections() const { return m_connections; }

		StateVector& state() { return m_state; }
		const StateVector& state() const { return m_state; }

		const Parameters& parameters() const { return m_params; }

		const DelayLine& delayLine() const { return m_delay; }

	protected :

		/*!
		 * \param conf global configuration, for the time step
		 * \param pre source group
		 * \param post target group
		 * \param connections edges from \a pre to \a post
		 * \param fields names of the per-synapse state variables
		 * \param params parameters of the model
		 * \param delayParam index of the transmission delay in \a params
		 *
		 * \throws neurite::configuration_error if the connection map does not
		 * 		match the group sizes
		 * \throws neurite::delay_line_underrun for an invalid delay
		 */
		SynapseGroup(const Configuration& conf,
				NeuronGroup& pre,
				NeuronGroup& post,
				const ConnectionMap& connections,
				const char* const fields[], unsigned nfields,
				const Parameters& params,
				unsigned delayParam);

		/*! Called at the start of each update, before intake */
		virtual void prepare() { }

		/*! Take in a presynaptic spike on the given edge */
		virtual void intake(sidx_t edge) = 0;

		/*! Integrate the gating variables of all edges */
		virtual void integrate(double t) = 0;

		/*! \return output of the given edge, before the delay */
		virtual double contribution(sidx_t edge) const = 0;

		/*! Deliver delayed output to a postsynaptic unit. The default adds the
		 * value to the input accumulator of the target. */
		virtual void deliver(nidx_t target, double value);

		/*! \return weight of the edge from the connection map if it is
		 * weighted, otherwise the model's default weight parameter */
		double edgeWeight(sidx_t edge, unsigned weightParam) const;

		/*! Set the given state field to the weight of each edge */
		void initialiseWeights(unsigned field, unsigned weightParam);

		NeuronGroup& m_pre;

		NeuronGroup& m_post;

		ConnectionMap m_connections;

		StateVector m_state;

		Parameters m_params;

		double m_dt;

	private :

		DelayLine m_delay;

		/* per postsynaptic unit */
		std::vector<double> m_aggregate;

		static const ConnectionMap&
		checkedConnections(const ConnectionMap& map, const NeuronGroup& pre,
				const NeuronGroup& post, const std::string& model);
};

}

#endif
