#ifndef NEURITE_NETWORK_HPP
#define NEURITE_NETWORK_HPP

/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include <utility>
#include <vector>

#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>

#include <neurite/config.h>
#include <neurite/types.h>
#include "Configuration.hpp"
#include "Monitor.hpp"
#include "NeuronGroup.hpp"
#include "SynapseGroup.hpp"
#include "Timer.hpp"

namespace neurite {

/*! \brief Simulation driver
 *
 * The network owns a set of neuron and synapse groups and advances them in
 * lockstep. Each step
 *
 * 1. external current (stimulus and any registered schedules) is added to the
 *    input of the neuron groups,
 * 2. all synapse groups are updated, in the order they were added. These see
 *    the spikes of the previous step.
 * 3. all neuron groups are updated, in the order they were added,
 * 4. all monitors record,
 * 5. the clock advances.
 *
 * If a group raises a neurite::numerical_error the network is marked as
 * failed. The error is propagated to the caller, and any further attempt to
 * step the network raises a logic error.
 */
class NEURITE_DLL_PUBLIC Network : private boost::noncopyable
{
	public :

		/*! Per-unit external current for a single step */
		typedef std::vector< std::pair<nidx_t, double> > current_stimulus;

		explicit Network(const Configuration& conf);

		/*! Add a neuron group. Returns the group for convenience.
		 *
		 * \throws neurite::configuration_error if the group was already added
		 * 		or was built with a different time step
		 */
		NeuronGroup& addNeurons(boost::shared_ptr<NeuronGroup> group);

		/*! Add a synapse group. Both its source and target groups must already
		 * be part of this network.
		 *
		 * \throws neurite::configuration_error otherwise
		 */
		SynapseGroup& addSynapses(boost::shared_ptr<SynapseGroup> group);

		/*! Add a monitor which records after every step */
		void addMonitor(boost::shared_ptr<Monitor> monitor);

		/*! Apply a per-step current to all units of a group, starting with
		 * the next step and lasting for currents.size() steps
		 *
		 * \throws neurite::configuration_error if the group is not part of
		 * 		the network
		 */
		void addCurrentSchedule(NeuronGroup& group, const std::vector<double>& currents);

		/*! Run a single step without any additional stimulus */
		void step();

		/*! Run a single step, with additional current to some units of one
		 * neuron group
		 *
		 * \throws neurite::exception (NEURITE_INVALID_INPUT) if any unit
		 * 		index is out of range
		 * \throws neurite::numerical_error if any group fails to integrate
		 */
		void step(NeuronGroup& group, const current_stimulus& istim);

		/*! Run for the given duration, i.e. stepCount(duration) steps */
		void run(double duration);

		/*! \return number of steps in \a duration, i.e. round(duration/dt)
		 *
		 * \throws neurite::exception (NEURITE_INVALID_INPUT) if the duration
		 * 		is negative or not finite
		 */
		cycle_t stepCount(double duration) const;

		/*! \return current simulation time */
		double time() const { return m_timer.time(); }

		/*! \return number of steps taken */
		cycle_t steps() const { return m_timer.elapsedSteps(); }

		/*! \return elapsed wall-clock time in milliseconds since creation */
		unsigned long elapsedWallclock() const { return m_timer.elapsedWallclock(); }

		bool failed() const { return m_failed; }

		const Configuration& configuration() const { return m_conf; }

		size_t neuronGroupCount() const { return m_neurons.size(); }

		size_t synapseGroupCount() const { return m_synapses.size(); }

	private :

		Configuration m_conf;

		std::vector< boost::shared_ptr<NeuronGroup> > m_neurons;

		std::vector< boost::shared_ptr<SynapseGroup> > m_synapses;

		std::vector< boost::shared_ptr<Monitor> > m_monitors;

		struct Schedule {
			NeuronGroup* group;
			std::vector<double> currents;
			cycle_t start;
		};

		std::vector<Schedule> m_schedules;

		Timer m_timer;

		bool m_failed;

		bool owns(const NeuronGroup& group) const;

		/* group may be NULL if istim is empty */
		void stepWith(NeuronGroup* group, const current_stimulus& istim);

		void applySchedules();

		void update();
};

}

#endif
