#ifndef BURST_KERNEL_IZHIKEVICH_H
#define BURST_KERNEL_IZHIKEVICH_H

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include "common.h"

#define IZHIKEVICH_SUBSTEPS 4
#define IZHIKEVICH_SUBSTEP_MULT 0.25f

typedef struct {
	const float* a;
	const float* b;
	const float* c;
	const float* d;
	const uint8_t* valid;
} izhikevich_params_t;


typedef struct {
	float* u;
	float* v;
} izhikevich_state_t;



/*! Izhikevich update of neuron \a n with four sub-steps. Every valid neuron
 * is updated each burst since its state is never at rest.
 *
 * \return non-zero if the neuron fired
 */
BURST_HOST_DEVICE
inline
int
izhikevich_update(unsigned n, float input,
		izhikevich_params_t p, izhikevich_state_t s,
		float* firedPotential)
{
	if(!p.valid[n]) {
		return 0;
	}

	float u = s.u[n];
	float v = s.v[n];
	int fired = 0;

	for(unsigned t = 0; t < IZHIKEVICH_SUBSTEPS; ++t) {
		if(!fired) {
			v += IZHIKEVICH_SUBSTEP_MULT * ((0.04f * v + 5.0f) * v + 140.0f - u + input);
			u += IZHIKEVICH_SUBSTEP_MULT * (p.a[n] * (p.b[n] * v - u));
			fired = v >= 30.0f;
		}
	}

	if(fired) {
		*firedPotential = v;
		v = p.c[n];
		u += p.d[n];
	}

	s.u[n] = u;
	s.v[n] = v;
	return fired;
}

#endif
