/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include "DeviceBackend.hpp"

#include "FireCandidateList.hpp"
#include "FireQueue.hpp"
#include "IdManager.hpp"
#include "Neurons.hpp"
#include "Synapses.hpp"

namespace burst {


DeviceBackend::DeviceBackend(const IdManager& ids) :
	m_ids(ids),
	m_stale(true),
	m_synapseRevision(0),
	m_neuronRevision(0),
	m_extent(BURST_MODEL_COUNT, 0)
{
	;
}



void
DeviceBackend::invalidate()
{
	m_stale = true;
}



bool
DeviceBackend::extentsChanged() const
{
	for(unsigned m = 0; m < BURST_MODEL_COUNT; ++m) {
		if(m_extent[m] != m_ids.extent(model_t(m))) {
			return true;
		}
	}
	return false;
}



void
DeviceBackend::processSynapticPropagation(
		const std::vector<nidx_t>& fired,
		const SynapseStorage& synapses,
		FireCandidateList& fcl)
{
	if(!m_layout || m_stale
			|| synapses.revision() != m_synapseRevision
			|| extentsChanged()) {
		m_layout.reset(new DenseLayout(m_ids, synapses));
		uploadSynapses(*m_layout);
		m_synapseRevision = synapses.revision();
		for(unsigned m = 0; m < BURST_MODEL_COUNT; ++m) {
			m_extent[m] = m_ids.extent(model_t(m));
		}
		/* Neuron arrays are re-sent too if the device copy was stale */
		if(m_stale) {
			m_neuronRevision = ~uint64_t(0);
		}
		m_stale = false;
	}

	if(fired.empty() || m_layout->synapseCount() == 0) {
		return;
	}

	m_firedSlots.clear();
	for(std::vector<nidx_t>::const_iterator i = fired.begin(); i != fired.end(); ++i) {
		std::pair<model_t, lidx_t> loc = m_ids.locate(*i);
		m_firedSlots.push_back(m_layout->slot(loc.first, loc.second));
	}

	const size_t ncount = m_layout->neuronCount();
	m_current.resize(ncount);
	m_touched.resize(ncount);
	propagate(m_firedSlots, m_current, m_touched);

	for(uint32_t slot = 0; slot < ncount; ++slot) {
		if(m_touched[slot]) {
			std::pair<model_t, lidx_t> loc = m_layout->fromSlot(slot);
			fcl.accumulate(loc.first, loc.second, float(m_current[slot]));
		}
	}
}



void
DeviceBackend::processNeuralDynamics(
		const FireCandidateList& fcl,
		NeuronStorage& neurons,
		burst_t burst,
		FireQueue& fired)
{
	if(m_stale || neurons.revision() != m_neuronRevision) {
		uploadNeurons(neurons);
		m_neuronRevision = neurons.revision();
	}

	fired.reset(burst);

	for(unsigned m = 0; m < BURST_MODEL_COUNT; ++m) {

		const model_t model = model_t(m);
		const size_t count = neurons.size(model);
		if(count == 0) {
			continue;
		}

		m_input.assign(count, 0.0f);
		m_hasInput.assign(count, 0);
		const FireCandidateList::Bucket& bucket = fcl.bucket(model);
		for(size_t i = 0; i < bucket.size(); ++i) {
			m_input[bucket.local[i]] = bucket.current[i];
			m_hasInput[bucket.local[i]] = 1;
		}

		m_fired.resize(count);
		m_firedPotential.resize(count);
		update(model, burst, m_input, m_hasInput, m_fired, m_firedPotential);

		m_firedFlags.resize(count);
		for(size_t n = 0; n < count; ++n) {
			m_firedFlags[n] = m_fired[n] != 0;
		}
		appendFired(m_ids, neurons, model, m_firedFlags, m_firedPotential, fired);
	}

	/* Every model has been updated. Only now does the host state advance, so
	 * a failure part way leaves the burst free to be run again. */
	for(unsigned m = 0; m < BURST_MODEL_COUNT; ++m) {
		if(neurons.size(model_t(m)) != 0) {
			commitState(model_t(m), neurons);
		}
	}

	/* The host copy of the state is now the same as the device copy */
	m_neuronRevision = neurons.revision();
}

}
