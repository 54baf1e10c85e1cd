/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include "SynapseGroup.hpp"

#include <algorithm>
#include <boost/format.hpp>

#include "exception.hpp"

namespace neurite {


const ConnectionMap&
SynapseGroup::checkedConnections(
		const ConnectionMap& map,
		const NeuronGroup& pre,
		const NeuronGroup& post,
		const std::string& model)
{
	using boost::format;
	if(map.preSize() != pre.size() || map.postSize() != post.size()) {
		throw configuration_error(
				str(format("%s connection map is %ux%u, but connects groups of size %u and %u")
					% model % map.preSize() % map.postSize() % pre.size() % post.size()));
	}
	return map;
}



SynapseGroup::SynapseGroup(
		const Configuration& conf,
		NeuronGroup& pre,
		NeuronGroup& post,
		const ConnectionMap& connections,
		const char* const fields[], unsigned nfields,
		const Parameters& params,
		unsigned delayParam) :
	m_pre(pre),
	m_post(post),
	m_connections(checkedConnections(connections, pre, post, params.model())),
	m_state(fields, nfields, connections.size()),
	m_params(params),
	m_dt(conf.timestep()),
	m_delay(params[delayParam], conf.timestep(), post.size()),
	m_aggregate(post.size(), 0.0)
{ }



double
SynapseGroup::edgeWeight(sidx_t edge, unsigned weightParam) const
{
	return m_connections.weighted() ? m_connections.weight(edge) : m_params[weightParam];
}



void
SynapseGroup::initialiseWeights(unsigned field, unsigned weightParam)
{
	double* w = m_state[field];
	for(sidx_t e=0; e < m_connections.size(); ++e) {
		w[e] = edgeWeight(e, weightParam);
	}
}



void
SynapseGroup::deliver(nidx_t target, double value)
{
	m_post.input()[target] += value;
}



void
SynapseGroup::update(double t)
{
	prepare();

	/* Spikes from the previous step, since neuron groups are updated after
	 * synapse groups */
	const std::vector<unsigned>& fired = m_pre.fired();
	for(std::vector<unsigned>::const_iterator n = fired.begin(); n != fired.end(); ++n) {
		for(sidx_t e = m_connections.begin(*n); e != m_connections.end(*n); ++e) {
			intake(e);
		}
	}

	integrate(t);

	std::fill(m_aggregate.begin(), m_aggregate.end(), 0.0);
	for(sidx_t e=0; e < m_connections.size(); ++e) {
		m_aggregate[m_connections.post(e)] += contribution(e);
	}

	if(!m_aggregate.empty()) {
		m_delay.push(&m_aggregate[0]);
		const double* due = m_delay.pullAll();
		for(nidx_t target=0; target < m_aggregate.size(); ++target) {
			if(due[target] != 0.0) {
				deliver(target, due[target]);
			}
		}
	}

	m_delay.advance();
}

}
