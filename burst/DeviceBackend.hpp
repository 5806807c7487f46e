#ifndef BURST_DEVICE_BACKEND_HPP
#define BURST_DEVICE_BACKEND_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <vector>
#include <boost/scoped_ptr.hpp>

#include <burst/config.h>
#include "ComputeBackend.hpp"
#include "DenseLayout.hpp"

namespace burst {

class NeuronStorage;


/*! \brief Host side of the GPU backends
 *
 * Keeps track of when the device copy of the storage is out of date and
 * moves per-burst data between the fire structures and dense device
 * arrays. Derived classes supply the device primitives.
 *
 * Synaptic current is accumulated on the device as 64-bit integers.
 * Contributions are integral (weight x psp) so the sums are exact and
 * independent of the order in which device threads deliver them.
 */
class BURST_DLL_PUBLIC DeviceBackend : public ComputeBackend
{
	public :

		void processSynapticPropagation(
				const std::vector<nidx_t>& fired,
				const SynapseStorage& synapses,
				FireCandidateList& fcl);

		void processNeuralDynamics(
				const FireCandidateList& fcl,
				NeuronStorage& neurons,
				burst_t burst,
				FireQueue& fired);

		void invalidate();

	protected :

		explicit DeviceBackend(const IdManager& ids);

		const IdManager& ids() const { return m_ids; }

		/*! Replace the device copy of the synapses (CSR arrays of \a layout)
		 * and size the per-slot accumulators for layout.neuronCount() slots */
		virtual void uploadSynapses(const DenseLayout& layout) = 0;

		/*! Replace the device copy of all neuron parameters and state */
		virtual void uploadNeurons(const NeuronStorage& neurons) = 0;

		/*! Deliver the synapses of the fired slots
		 *
		 * \param firedSlots non-empty
		 * \param[out] current summed contribution per slot, as 64-bit integers
		 * \param[out] touched non-zero for slots which received a delivery
		 */
		virtual void propagate(
				const std::vector<uint32_t>& firedSlots,
				std::vector<int64_t>& current,
				std::vector<uint32_t>& touched) = 0;

		/*! Update all neurons of one (non-empty) model
		 *
		 * The new mutable state is downloaded into host staging owned by the
		 * backend. It reaches the neuron storage only through \a commitState.
		 *
		 * \param input dense input per local index
		 * \param hasInput non-zero where the neuron has an FCL entry
		 * \param[out] fired non-zero for neurons which fired
		 * \param[out] firedPotential potential at firing, where \a fired is set
		 */
		virtual void update(model_t model,
				burst_t burst,
				const std::vector<float>& input,
				const std::vector<uint32_t>& hasInput,
				std::vector<uint32_t>& fired,
				std::vector<float>& firedPotential) = 0;

		/*! Copy the state staged by the last \a update of \a model into
		 * \a neurons. Host copies only, so this cannot fail. */
		virtual void commitState(model_t model, NeuronStorage& neurons) = 0;

	private :

		const IdManager& m_ids;

		boost::scoped_ptr<DenseLayout> m_layout;

		bool m_stale;
		uint64_t m_synapseRevision;
		uint64_t m_neuronRevision;
		std::vector<uint32_t> m_extent;

		/* Staging buffers */
		std::vector<uint32_t> m_firedSlots;
		std::vector<int64_t> m_current;
		std::vector<uint32_t> m_touched;
		std::vector<float> m_input;
		std::vector<uint32_t> m_hasInput;
		std::vector<uint32_t> m_fired;
		std::vector<uint8_t> m_firedFlags;
		std::vector<float> m_firedPotential;

		bool extentsChanged() const;
};

}

#endif
