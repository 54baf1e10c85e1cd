/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include "ConnectionMap.hpp"

#include <boost/format.hpp>
#include <boost/math/special_functions/fpclassify.hpp>

#include "exception.hpp"

namespace neurite {


ConnectionMap::ConnectionMap(
		unsigned preSize,
		unsigned postSize,
		const std::vector<edge_t>& edges) :
	m_preSize(preSize),
	m_postSize(postSize),
	m_weighted(false)
{
	init(edges, NULL);
}



ConnectionMap::ConnectionMap(
		unsigned preSize,
		unsigned postSize,
		const std::vector<edge_t>& edges,
		const std::vector<double>& weights) :
	m_preSize(preSize),
	m_postSize(postSize),
	m_weighted(true)
{
	init(edges, &weights);
}



void
ConnectionMap::init(const std::vector<edge_t>& edges, const std::vector<double>* weights)
{
	using boost::format;

	if(weights != NULL && weights->size() != edges.size()) {
		throw configuration_error(
				str(format("Connection map has %u edges but %u weights")
					% edges.size() % weights->size()));
	}

	/* Count edges per source unit first, then place them with a counting
	 * sort, which keeps the insertion order within each source unit */
	m_offset.assign(m_preSize + 1, 0);
	for(std::vector<edge_t>::const_iterator e = edges.begin(); e != edges.end(); ++e) {
		if(e->first >= m_preSize) {
			throw configuration_error(
					str(format("Invalid presynaptic unit %u in connection map (group size %u)")
						% e->first % m_preSize));
		}
		if(e->second >= m_postSize) {
			throw configuration_error(
					str(format("Invalid postsynaptic unit %u in connection map (group size %u)")
						% e->second % m_postSize));
		}
		m_offset[e->first + 1] += 1;
	}

	for(unsigned i=0; i < m_preSize; ++i) {
		m_offset[i+1] += m_offset[i];
	}

	m_pre.resize(edges.size());
	m_post.resize(edges.size());
	if(weights != NULL) {
		m_weight.resize(edges.size());
	}

	std::vector<sidx_t> next(m_offset.begin(), m_offset.end() - 1);
	for(size_t i=0; i < edges.size(); ++i) {
		const edge_t& e = edges[i];
		sidx_t at = next[e.first]++;
		m_pre[at] = e.first;
		m_post[at] = e.second;
		if(weights != NULL) {
			double w = (*weights)[i];
			if(!boost::math::isfinite(w)) {
				throw configuration_error(
						str(format("Non-finite weight for connection %u -> %u") % e.first % e.second));
			}
			m_weight[at] = w;
		}
	}
}



ConnectionMap
ConnectionMap::fromMatrix(const std::vector< std::vector<bool> >& matrix)
{
	using boost::format;

	unsigned preSize = unsigned(matrix.size());
	unsigned postSize = matrix.empty() ? 0 : unsigned(matrix.front().size());

	std::vector<edge_t> edges;
	for(unsigned pre=0; pre < preSize; ++pre) {
		const std::vector<bool>& row = matrix[pre];
		if(row.size() != postSize) {
			throw configuration_error(
					str(format("Connection matrix row %u has length %u (expected %u)")
						% pre % row.size() % postSize));
		}
		for(unsigned post=0; post < postSize; ++post) {
			if(row[post]) {
				edges.push_back(edge_t(pre, post));
			}
		}
	}
	return ConnectionMap(preSize, postSize, edges);
}



ConnectionMap
ConnectionMap::allToAll(unsigned preSize, unsigned postSize, bool includeSelf)
{
	std::vector<edge_t> edges;
	edges.reserve(size_t(preSize) * postSize);
	for(unsigned pre=0; pre < preSize; ++pre) {
		for(unsigned post=0; post < postSize; ++post) {
			if(includeSelf || pre != post) {
				edges.push_back(edge_t(pre, post));
			}
		}
	}
	return ConnectionMap(preSize, postSize, edges);
}



ConnectionMap
ConnectionMap::oneToOne(unsigned n)
{
	std::vector<edge_t> edges;
	edges.reserve(n);
	for(unsigned i=0; i < n; ++i) {
		edges.push_back(edge_t(i, i));
	}
	return ConnectionMap(n, n, edges);
}

}
