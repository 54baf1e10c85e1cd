#ifndef NEURITE_CONNECTION_MAP_HPP
#define NEURITE_CONNECTION_MAP_HPP

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

#include <neurite/config.h>
#include <neurite/types.h>

namespace neurite {

/*! \brief Immutable relation between presynaptic and postsynaptic units
 *
 * Edges are stored sorted by presynaptic unit (keeping the user-specified
 * order within each unit), along with an index into the edge list for each
 * presynaptic unit. Edge indices are therefore stable for the lifetime of the
 * map, and are used by synapse groups to index their own state.
 */
class NEURITE_DLL_PUBLIC ConnectionMap
{
	public :

		typedef std::pair<nidx_t, nidx_t> edge_t;

		/*! Unweighted connections
		 *
		 * \param preSize number of units in the source group
		 * \param postSize number of units in the target group
		 * \param edges (pre, post) pairs
		 *
		 * \throws neurite::configuration_error if any unit index is out of
		 * 		range for its group
		 */
		ConnectionMap(unsigned preSize, unsigned postSize, const std::vector<edge_t>& edges);

		/*! Weighted connections
		 *
		 * \param weights one weight per edge
		 *
		 * \throws neurite::configuration_error if any unit index is out of
		 * 		range, or if the number of weights and edges differ
		 */
		ConnectionMap(unsigned preSize, unsigned postSize,
				const std::vector<edge_t>& edges,
				const std::vector<double>& weights);

		/*! Connections from a dense adjacency matrix, indexed [pre][post]
		 *
		 * \throws neurite::configuration_error if the rows have different
		 * 		lengths
		 */
		static ConnectionMap fromMatrix(const std::vector< std::vector<bool> >& matrix);

		/*! Connect every source unit to every target unit
		 *
		 * \param includeSelf if false, omit edges from i to i
		 */
		static ConnectionMap allToAll(unsigned preSize, unsigned postSize, bool includeSelf = true);

		/*! Connect unit i to unit i for each i in [0, n) */
		static ConnectionMap oneToOne(unsigned n);

		/*! \return number of edges */
		sidx_t size() const { return sidx_t(m_pre.size()); }

		unsigned preSize() const { return m_preSize; }

		unsigned postSize() const { return m_postSize; }

		nidx_t pre(sidx_t edge) const { return m_pre[edge]; }

		nidx_t post(sidx_t edge) const { return m_post[edge]; }

		/*! \return user-specified weight of edge, or 1 for unweighted maps */
		double weight(sidx_t edge) const { return m_weighted ? m_weight[edge] : 1.0; }

		bool weighted() const { return m_weighted; }

		/*! \return index of the first edge leaving the given unit */
		sidx_t begin(nidx_t pre) const { return m_offset[pre]; }

		/*! \return index one past the last edge leaving the given unit */
		sidx_t end(nidx_t pre) const { return m_offset[pre+1]; }

	private :

		unsigned m_preSize;
		unsigned m_postSize;

		std::vector<nidx_t> m_pre;
		std::vector<nidx_t> m_post;
		std::vector<double> m_weight;

		bool m_weighted;

		/* preSize+1 entries, edges of unit i are [offset[i], offset[i+1]) */
		std::vector<sidx_t> m_offset;

		void init(const std::vector<edge_t>& edges, const std::vector<double>* weights);
};

}

#endif
