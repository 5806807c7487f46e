#ifndef BURST_CUDA_BACKEND_HPP
#define BURST_CUDA_BACKEND_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <cstddef>
#include <boost/shared_array.hpp>

#include <burst/config.h>
#include <burst/DeviceBackend.hpp>
#include <burst/kernel/lif.h>
#include <burst/kernel/izhikevich.h>

namespace burst {

class ConfigurationImpl;

	namespace cuda {

/*! \brief Backend running both phases as CUDA kernels
 *
 * Parameters and state of each model live in device arrays indexed by
 * local index. Synapses are held in the CSR layout built by DenseLayout.
 */
class BURST_CUDA_DLL_PUBLIC Backend : public DeviceBackend
{
	public :

		/*! \throws burst::BackendUnavailable if there is no suitable device */
		Backend(const IdManager& ids, const ConfigurationImpl& conf);

		backend_t type() const { return BURST_BACKEND_CUDA; }

		std::string description() const;

	private :

		void uploadSynapses(const DenseLayout& layout);

		void uploadNeurons(const NeuronStorage& neurons);

		void propagate(
				const std::vector<uint32_t>& firedSlots,
				std::vector<int64_t>& current,
				std::vector<uint32_t>& touched);

		void update(model_t model,
				burst_t burst,
				const std::vector<float>& input,
				const std::vector<uint32_t>& hasInput,
				std::vector<uint32_t>& fired,
				std::vector<float>& firedPotential);

		void commitState(model_t model, NeuronStorage& neurons);

		unsigned m_device;

		bool m_logging;

		/* Synapses, CSR by source slot */
		boost::shared_array<uint32_t> md_rowStart;
		boost::shared_array<uint32_t> md_targetSlot;
		boost::shared_array<uint8_t> md_weight;
		boost::shared_array<uint8_t> md_psp;
		boost::shared_array<uint8_t> md_kind;
		size_t m_slotCount;
		size_t m_synapseCount;

		/* Per-slot accumulators */
		boost::shared_array<int64_t> md_current;
		boost::shared_array<uint32_t> md_touched;

		boost::shared_array<uint32_t> md_firedSlots;
		size_t m_firedCapacity;

		/* LIF arrays */
		boost::shared_array<float> md_lifThreshold;
		boost::shared_array<float> md_lifThresholdLimit;
		boost::shared_array<float> md_lifLeak;
		boost::shared_array<float> md_lifRest;
		boost::shared_array<float> md_lifExcitability;
		boost::shared_array<uint16_t> md_lifRefractoryPeriod;
		boost::shared_array<uint16_t> md_lifSnoozePeriod;
		boost::shared_array<uint16_t> md_lifConsecutiveFireLimit;
		boost::shared_array<uint8_t> md_lifChargeAccumulation;
		boost::shared_array<uint8_t> md_lifValid;
		boost::shared_array<float> md_lifPotential;
		boost::shared_array<uint16_t> md_lifCountdown;
		boost::shared_array<uint16_t> md_lifFireCount;

		/* Izhikevich arrays */
		boost::shared_array<float> md_izhA;
		boost::shared_array<float> md_izhB;
		boost::shared_array<float> md_izhC;
		boost::shared_array<float> md_izhD;
		boost::shared_array<uint8_t> md_izhValid;
		boost::shared_array<float> md_izhU;
		boost::shared_array<float> md_izhV;

		/* Per-model dynamics buffers, indexed by model */
		boost::shared_array<float> md_input[BURST_MODEL_COUNT];
		boost::shared_array<uint32_t> md_hasInput[BURST_MODEL_COUNT];
		boost::shared_array<uint32_t> md_fired[BURST_MODEL_COUNT];
		boost::shared_array<float> md_firedPotential[BURST_MODEL_COUNT];
		size_t m_modelSize[BURST_MODEL_COUNT];

		/* State downloaded by update, waiting for commitState */
		std::vector<float> h_lifPotential;
		std::vector<uint16_t> h_lifCountdown;
		std::vector<uint16_t> h_lifFireCount;
		std::vector<float> h_izhU;
		std::vector<float> h_izhV;

		lif_params_t lifParams() const;
		lif_state_t lifState() const;
		izhikevich_params_t izhikevichParams() const;
		izhikevich_state_t izhikevichState() const;
};

}	} // end namespaces

#endif
