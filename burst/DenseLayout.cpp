/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include "DenseLayout.hpp"

#include <algorithm>
#include <boost/format.hpp>

#include "IdManager.hpp"
#include "Synapses.hpp"
#include "exception.hpp"

namespace burst {


DenseLayout::DenseLayout(
		const IdManager& ids,
		const SynapseStorage& synapses) :
	m_base(BURST_MODEL_COUNT + 1, 0)
{
	for(unsigned m = 0; m < BURST_MODEL_COUNT; ++m) {
		m_base[m+1] = m_base[m] + ids.extent(model_t(m));
	}

	const uint32_t ncount = neuronCount();
	const std::vector<uint8_t>& valid = synapses.validMask();
	const size_t slots = synapses.slots();

	/* Resolve both ends of every live synapse once */
	std::vector<uint32_t> sourceSlot(slots, 0);
	std::vector<uint32_t> targetSlot(slots, 0);
	m_rowStart.assign(ncount + 1, 0);

	for(size_t s = 0; s < slots; ++s) {
		if(!valid[s]) {
			continue;
		}
		std::pair<model_t, lidx_t> src = ids.locate(synapses.source()[s]);
		std::pair<model_t, lidx_t> tgt = ids.locate(synapses.target()[s]);
		sourceSlot[s] = slot(src.first, src.second);
		targetSlot[s] = slot(tgt.first, tgt.second);
		m_rowStart[sourceSlot[s] + 1] += 1;
	}

	for(uint32_t n = 0; n < ncount; ++n) {
		m_rowStart[n+1] += m_rowStart[n];
	}

	const size_t scount = m_rowStart[ncount];
	m_targetSlot.resize(scount);
	m_weight.resize(scount);
	m_psp.resize(scount);
	m_kind.resize(scount);

	std::vector<uint32_t> fill(m_rowStart.begin(), m_rowStart.end() - 1);
	for(size_t s = 0; s < slots; ++s) {
		if(!valid[s]) {
			continue;
		}
		uint32_t pos = fill[sourceSlot[s]]++;
		m_targetSlot[pos] = targetSlot[s];
		m_weight[pos] = synapses.weight()[s];
		m_psp[pos] = synapses.psp()[s];
		m_kind[pos] = synapses.kind()[s];
	}
}



std::pair<model_t, lidx_t>
DenseLayout::fromSlot(uint32_t slot) const
{
	using boost::format;
	for(unsigned m = 0; m < BURST_MODEL_COUNT; ++m) {
		if(slot < m_base[m+1]) {
			return std::make_pair(model_t(m), lidx_t(slot - m_base[m]));
		}
	}
	throw burst::exception(BURST_LOGIC_ERROR,
			str(format("Neuron slot %u out of range (%u slots)") % slot % neuronCount()));
}

} // end namespace burst
