/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include "Network.hpp"

#include <algorithm>
#include <cmath>
#include <boost/format.hpp>
#include <boost/math/special_functions/fpclassify.hpp>

#include "exception.hpp"
#include "log.hpp"

namespace neurite {


Network::Network(const Configuration& conf) :
	m_conf(conf),
	m_timer(conf.timestep()),
	m_failed(false)
{
	LOG(m_conf.loggingEnabled(), "Created network (dt=%gms, seed=%u)",
			m_conf.timestep(), m_conf.seed());
}



bool
Network::owns(const NeuronGroup& group) const
{
	typedef std::vector< boost::shared_ptr<NeuronGroup> >::const_iterator it;
	for(it i = m_neurons.begin(); i != m_neurons.end(); ++i) {
		if(i->get() == &group) {
			return true;
		}
	}
	return false;
}



NeuronGroup&
Network::addNeurons(boost::shared_ptr<NeuronGroup> group)
{
	using boost::format;

	assert_or_throw(group.get() != NULL, "Null neuron group added to network");

	if(owns(*group)) {
		throw configuration_error(
				str(format("%s group added to network twice") % group->model()));
	}

	if(group->timestep() != m_conf.timestep()) {
		throw configuration_error(
				str(format("%s group uses time step %g, but the network uses %g")
					% group->model() % group->timestep() % m_conf.timestep()));
	}

	m_neurons.push_back(group);
	LOG(m_conf.loggingEnabled(), "Added %s group %u with %u units",
			group->model().c_str(), unsigned(m_neurons.size() - 1), unsigned(group->size()));
	return *group;
}



SynapseGroup&
Network::addSynapses(boost::shared_ptr<SynapseGroup> group)
{
	using boost::format;

	assert_or_throw(group.get() != NULL, "Null synapse group added to network");

	if(!owns(group->pre()) || !owns(group->post())) {
		throw configuration_error(
				str(format("%s synapses connect neuron groups which are not part of the network")
					% group->model()));
	}

	m_synapses.push_back(group);
	LOG(m_conf.loggingEnabled(), "Added %s group %u with %u synapses",
			group->model().c_str(), unsigned(m_synapses.size() - 1), unsigned(group->size()));
	return *group;
}



void
Network::addMonitor(boost::shared_ptr<Monitor> monitor)
{
	assert_or_throw(monitor.get() != NULL, "Null monitor added to network");
	m_monitors.push_back(monitor);
}



void
Network::addCurrentSchedule(NeuronGroup& group, const std::vector<double>& currents)
{
	using boost::format;

	if(!owns(group)) {
		throw configuration_error(
				str(format("Current schedule for %s group which is not part of the network")
					% group.model()));
	}

	Schedule s;
	s.group = &group;
	s.currents = currents;
	s.start = steps();
	m_schedules.push_back(s);
}



void
Network::applySchedules()
{
	for(std::vector<Schedule>::const_iterator s = m_schedules.begin(); s != m_schedules.end(); ++s) {
		cycle_t i = steps() - s->start;
		if(i >= s->currents.size()) {
			continue;
		}
		double* input = s->group->input();
		for(size_t n=0; n < s->group->size(); ++n) {
			input[n] += s->currents[i];
		}
	}
}



void
Network::step()
{
	stepWith(NULL, current_stimulus());
}



void
Network::step(NeuronGroup& group, const current_stimulus& istim)
{
	using boost::format;
	if(!owns(group)) {
		throw exception(NEURITE_INVALID_INPUT,
				str(format("Stimulus for %s group which is not part of the network")
					% group.model()));
	}
	stepWith(&group, istim);
}



void
Network::stepWith(NeuronGroup* group, const current_stimulus& istim)
{
	if(m_failed) {
		throw exception(NEURITE_LOGIC_ERROR,
				"Attempt to step a network which has failed. Create a new network to continue");
	}

	if(!istim.empty()) {
		/* Check all indices first so a bad stimulus leaves no partial input */
		for(current_stimulus::const_iterator i = istim.begin(); i != istim.end(); ++i) {
			if(i->first >= group->size()) {
				throw exception(NEURITE_INVALID_INPUT,
						str(boost::format("Stimulus for invalid unit %u of %s group (size %u)")
							% i->first % group->model() % group->size()));
			}
		}
		for(current_stimulus::const_iterator i = istim.begin(); i != istim.end(); ++i) {
			group->addInput(i->first, i->second);
		}
	}
	applySchedules();

	try {
		update();
	} catch(numerical_error& e) {
		m_failed = true;
		LOG(m_conf.loggingEnabled(), "Network failed at t=%gms: %s", time(), e.what());
		throw;
	}
}



void
Network::update()
{
	const double t = time();

	typedef std::vector< boost::shared_ptr<SynapseGroup> >::iterator s_it;
	for(s_it i = m_synapses.begin(); i != m_synapses.end(); ++i) {
		(*i)->update(t);
	}

	typedef std::vector< boost::shared_ptr<NeuronGroup> >::iterator n_it;
	for(n_it i = m_neurons.begin(); i != m_neurons.end(); ++i) {
		(*i)->update(t);
	}

	typedef std::vector< boost::shared_ptr<Monitor> >::iterator m_it;
	for(m_it i = m_monitors.begin(); i != m_monitors.end(); ++i) {
		(*i)->record(t);
	}

	m_timer.step();
}



cycle_t
Network::stepCount(double duration) const
{
	using boost::format;

	if(!(duration >= 0.0) || !boost::math::isfinite(duration)) {
		throw exception(NEURITE_INVALID_INPUT,
				str(format("Invalid simulation duration %g") % duration));
	}
	return cycle_t(std::floor(duration / m_conf.timestep() + 0.5));
}



void
Network::run(double duration)
{
	const cycle_t nsteps = stepCount(duration);
	const double period = m_conf.progressPeriod();
	const cycle_t reportEvery = period > 0.0
		? std::max(cycle_t(1), cycle_t(std::floor(period / m_conf.timestep() + 0.5)))
		: 0;

	LOG(m_conf.loggingEnabled(), "Running for %gms (%llu steps)", duration, nsteps);

	for(cycle_t s=0; s < nsteps; ++s) {
		step();
		if(reportEvery && (s+1) % reportEvery == 0) {
			LOG(m_conf.loggingEnabled(), "t=%gms (%llu steps, %lums wall-clock)",
					time(), steps(), elapsedWallclock());
		}
	}
}

}
