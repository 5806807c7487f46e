#ifndef BURST_DENSE_LAYOUT_HPP
#define BURST_DENSE_LAYOUT_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <cstddef>
#include <utility>
#include <vector>

#include <burst/config.h>
#include "types.h"

namespace burst {

class IdManager;
class SynapseStorage;

/*! \brief Flat device-side addressing of neurons and synapses
 *
 * Neurons get a dense \e slot: the model's base (sum of the sizes of the
 * models before it) plus the local index. Synapses are ordered by source
 * slot (compressed sparse rows) with their targets already converted to
 * slots, so device code never has to resolve a neuron id.
 *
 * Built on the host whenever a GPU backend uploads its persistent data.
 */
class BURST_DLL_PUBLIC DenseLayout
{
	public :

		DenseLayout(const IdManager& ids, const SynapseStorage& synapses);

		uint32_t base(model_t model) const { return m_base[model]; }

		/*! \return number of neuron slots of the model */
		uint32_t count(model_t model) const { return m_base[model+1] - m_base[model]; }

		/*! \return number of neuron slots over all models */
		uint32_t neuronCount() const { return m_base[BURST_MODEL_COUNT]; }

		uint32_t slot(model_t model, lidx_t local) const { return m_base[model] + local; }

		std::pair<model_t, lidx_t> fromSlot(uint32_t slot) const;

		std::size_t synapseCount() const { return m_targetSlot.size(); }

		/* CSR arrays. rowStart has neuronCount()+1 entries. */
		const std::vector<uint32_t>& rowStart() const { return m_rowStart; }
		const std::vector<uint32_t>& targetSlot() const { return m_targetSlot; }
		const std::vector<uint8_t>& weight() const { return m_weight; }
		const std::vector<uint8_t>& psp() const { return m_psp; }
		const std::vector<uint8_t>& kind() const { return m_kind; }

	private :

		std::vector<uint32_t> m_base;

		std::vector<uint32_t> m_rowStart;
		std::vector<uint32_t> m_targetSlot;
		std::vector<uint8_t> m_weight;
		std::vector<uint8_t> m_psp;
		std::vector<uint8_t> m_kind;
};

} // end namespace burst

#endif
