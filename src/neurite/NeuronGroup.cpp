/* Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include "NeuronGroup.hpp"

#include <algorithm>
#include <cmath>
#include <boost/format.hpp>

#include "exception.hpp"
#include "log.hpp"

namespace neurite {


size_t
checkedGroupSize(const std::string& model, int size)
{
	using boost::format;
	if(size < 0) {
		throw configuration_error(
				str(format("Invalid size %d for %s group. The size must not be negative")
					% size % model));
	}
	return size_t(size);
}



NeuronGroup::NeuronGroup(
		const Configuration& conf,
		int size,
		const char* const fields[], unsigned nfields,
		const Parameters& params,
		unsigned vField, unsigned inputField, unsigned spikeField) :
	m_state(fields, nfields, checkedGroupSize(params.model(), size)),
	m_params(params),
	m_dt(conf.timestep()),
	m_logging(conf.loggingEnabled()),
	m_vField(vField),
	m_inputField(inputField),
	m_spikeField(spikeField)
{
	assert_or_throw(vField < nfields && inputField < nfields && spikeField < nfields,
			"Neuron model field indices out of range");
	m_fired.reserve(m_state.size());
	m_vPrev.resize(m_state.size(), 0.0);
}



bool
NeuronGroup::refractory(nidx_t) const
{
	return false;
}



void
NeuronGroup::addInput(nidx_t unit, double current)
{
	using boost::format;
	if(unit >= m_state.size()) {
		throw exception(NEURITE_INVALID_INPUT,
				str(format("Input to invalid unit %u of %s group (size %u)")
					% unit % model() % m_state.size()));
	}
	m_state[m_inputField][unit] += current;
}



void
NeuronGroup::beginUpdate()
{
	m_fired.clear();
	m_state.fill(m_spikeField, 0.0);
}



void
NeuronGroup::setFired(nidx_t unit, double t)
{
	m_state[m_spikeField][unit] = 1.0;
	m_fired.push_back(unit);
	TRACE("t=%g: %s unit %u fired\n", t, model().c_str(), unit);
}



void
NeuronGroup::endUpdate()
{
	m_state.fill(m_inputField, 0.0);
	const double* V = m_state[m_vField];
	std::copy(V, V + m_state.size(), m_vPrev.begin());
}



void
NeuronGroup::initialisePotential(double V)
{
	m_state.fill(m_vField, V);
	std::fill(m_vPrev.begin(), m_vPrev.end(), V);
}



bool
NeuronGroup::inRefractoryPeriod(double t, double t_last, double t_ref) const
{
	const double elapsed = std::floor((t - t_last) / m_dt + 0.5);
	return elapsed <= std::floor(t_ref / m_dt + 0.5);
}



void
NeuronGroup::initialiseNoise(unsigned seed)
{
	m_rng.resize(m_state.size());
	initialiseRng(seed, m_rng);
}

}
