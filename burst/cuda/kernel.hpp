#ifndef BURST_CUDA_KERNEL_HPP
#define BURST_CUDA_KERNEL_HPP

/*! \file kernel.hpp Prototypes for kernel calls */

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <cuda_runtime.h>

#include <burst/kernel/lif.h>
#include <burst/kernel/izhikevich.h>


/*! Deliver the outgoing synapses of each fired slot
 *
 * \param d_current accumulated current per target slot (zeroed by caller)
 * \param d_touched set to 1 for each target slot receiving a delivery
 */
cudaError_t
propagate(unsigned firedCount,
		const uint32_t* d_fired,
		const uint32_t* d_rowStart,
		const uint32_t* d_targetSlot,
		const uint8_t* d_weight,
		const uint8_t* d_psp,
		const uint8_t* d_kind,
		int64_t* d_current,
		uint32_t* d_touched);


cudaError_t
updateLif(unsigned neuronCount,
		uint32_t idBase,
		uint64_t burst,
		const float* d_input,
		const uint32_t* d_hasInput,
		lif_params_t params,
		lif_state_t state,
		uint32_t* d_fired,
		float* d_firedPotential);


cudaError_t
updateIzhikevich(unsigned neuronCount,
		const float* d_input,
		izhikevich_params_t params,
		izhikevich_state_t state,
		uint32_t* d_fired,
		float* d_firedPotential);

#endif
