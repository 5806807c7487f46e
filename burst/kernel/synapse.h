#ifndef BURST_KERNEL_SYNAPSE_H
#define BURST_KERNEL_SYNAPSE_H

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include "common.h"

/* Synapse kinds as stored in device arrays (see synapse_kind_t) */
#define BURST_KIND_EXCITATORY 0
#define BURST_KIND_INHIBITORY 1
#define BURST_KIND_MODULATORY 2


/*! Contribution of one synaptic delivery: weight x psp as raw 0-255
 * magnitudes, negated for inhibitory synapses. Modulatory synapses make the
 * target a fire candidate but carry no current.
 *
 * Every backend sums the contributions to a target as a 64-bit integer and
 * converts the total to float once, so the input a neuron sees does not
 * depend on delivery order. 2^47 deliveries of the largest contribution fit
 * in the sum. */
BURST_HOST_DEVICE
inline
int32_t
synaptic_contribution(uint8_t weight, uint8_t psp, uint8_t kind)
{
	int32_t c = int32_t(weight) * int32_t(psp);
	if(kind == BURST_KIND_INHIBITORY) {
		return -c;
	} else if(kind == BURST_KIND_MODULATORY) {
		return 0;
	}
	return c;
}

#endif
