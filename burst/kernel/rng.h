#ifndef BURST_KERNEL_RNG_H
#define BURST_KERNEL_RNG_H

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

/*! \file rng.h Stateless random draw for the excitability gate
 *
 * The draw is a pure function of (neuron id, burst), so every backend
 * produces the same sequence without carrying RNG state per neuron. The
 * WGSL shader in wgpu/shaders.cpp implements the same arithmetic.
 */

#include "common.h"

/* PCG output permutation (RXS-M-XS) applied to one LCG step */
BURST_HOST_DEVICE
inline
uint32_t
pcg_hash(uint32_t input)
{
	uint32_t state = input * 747796405u + 2891336453u;
	uint32_t word = ((state >> ((state >> 28u) + 4u)) ^ state) * 277803737u;
	return (word >> 22u) ^ word;
}


/*! \return uniform draw in [0, 1) for the given neuron and burst */
BURST_HOST_DEVICE
inline
float
excitability_draw(uint32_t neuron, uint64_t burst)
{
	uint32_t seed = neuron * 2654435761u + uint32_t(burst) * 1597334677u;
	return float(pcg_hash(seed)) * (1.0f / 4294967296.0f);
}


/*! Excitability gate. 0.999 and above always passes, 0 and below never. */
BURST_HOST_DEVICE
inline
bool
excitability_pass(float excitability, uint32_t neuron, uint64_t burst)
{
	if(excitability >= 0.999f) {
		return true;
	}
	if(excitability <= 0.0f) {
		return false;
	}
	return excitability_draw(neuron, burst) < excitability;
}

#endif
