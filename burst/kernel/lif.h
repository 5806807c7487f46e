#ifndef BURST_KERNEL_LIF_H
#define BURST_KERNEL_LIF_H

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

/*! \file lif.h Leaky integrate-and-fire update of a single neuron
 *
 * Used as-is by the CPU backend and the CUDA kernel. The WGSL shader is a
 * line-by-line transcription of \a lif_update.
 */

#include "common.h"
#include "rng.h"

typedef struct {
	const float* threshold;
	const float* thresholdLimit;      // 0 = no upper bound
	const float* leak;
	const float* rest;
	const float* excitability;
	const uint16_t* refractoryPeriod;
	const uint16_t* snoozePeriod;
	const uint16_t* consecutiveFireLimit; // 0 = unlimited
	const uint8_t* chargeAccumulation;
	const uint8_t* valid;
} lif_params_t;


typedef struct {
	float* potential;
	uint16_t* refractoryCountdown;
	uint16_t* consecutiveFireCount;
} lif_state_t;



/*! Update neuron \a n for one burst
 *
 * A neuron takes part in the burst if it has input, is refractory, or has a
 * potential away from rest. Refractory neurons only count down. Otherwise the
 * input is integrated first
 *
 * 	V' = V + I
 *
 * and the neuron fires if V' is in [threshold, thresholdLimit], the
 * consecutive fire limit is not reached and the excitability draw passes. A
 * neuron which does not fire keeps the leaked potential
 *
 * 	V'' = V' - leak * (V' - V_rest)
 *
 * so that full leak returns it to rest within the same burst. A neuron blocked
 * by the consecutive fire limit keeps V' unleaked. Without charge
 * accumulation V is reset to rest when the burst begins.
 *
 * \param id global neuron id (seeds the excitability draw)
 * \param[out] firedPotential V' for a neuron which fired
 * \return non-zero if the neuron fired
 */
BURST_HOST_DEVICE
inline
int
lif_update(unsigned n, uint32_t id, uint64_t burst,
		float input, int hasInput,
		lif_params_t p, lif_state_t s,
		float* firedPotential)
{
	if(!p.valid[n]) {
		return 0;
	}

	const float rest = p.rest[n];
	float v = s.potential[n];
	uint16_t countdown = s.refractoryCountdown[n];

	if(!hasInput && countdown == 0 && v == rest) {
		return 0;
	}

	if(countdown > 0) {
		countdown -= 1;
		s.refractoryCountdown[n] = countdown;
		if(!p.chargeAccumulation[n]) {
			s.potential[n] = rest;
		}
		return 0;
	}

	if(!p.chargeAccumulation[n]) {
		v = rest;
	}

	float v1 = v + input;

	const float limit = p.thresholdLimit[n];
	int fired = v1 >= p.threshold[n] && (limit <= 0.0f || v1 <= limit);

	if(fired) {
		uint16_t cfLimit = p.consecutiveFireLimit[n];
		if(cfLimit > 0 && s.consecutiveFireCount[n] >= cfLimit) {
			/* blocked for this burst; integrated potential is held */
			s.consecutiveFireCount[n] = 0;
			s.potential[n] = v1;
			return 0;
		}
		fired = excitability_pass(p.excitability[n], id, burst);
	}

	if(fired) {
		*firedPotential = v1;
		s.potential[n] = rest;
		s.refractoryCountdown[n] = uint16_t(p.refractoryPeriod[n] + p.snoozePeriod[n]);
		if(s.consecutiveFireCount[n] < 0xffff) {
			s.consecutiveFireCount[n] += 1;
		}
	} else {
		s.potential[n] = v1 - p.leak[n] * (v1 - rest);
		s.consecutiveFireCount[n] = 0;
	}

	return fired;
}

#endif
