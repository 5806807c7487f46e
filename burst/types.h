#ifndef BURST_TYPES_H
#define BURST_TYPES_H

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <stdint.h>

typedef uint32_t nidx_t;  // global neuron id
typedef uint32_t lidx_t;  // local index within a model's storage
typedef uint32_t sidx_t;  // synapse id
typedef uint64_t burst_t; // burst (timestep) counter
typedef uint32_t area_t;  // cortical area id


/*! Neuron models. Each model owns one contiguous range of the id space and
 * one structure-of-arrays store. */
enum model_t {
	BURST_MODEL_LIF = 0,
	BURST_MODEL_IZHIKEVICH,
	BURST_MODEL_COUNT
};


enum backend_t {
	BURST_BACKEND_CPU = 0,
	BURST_BACKEND_WGPU,
	BURST_BACKEND_CUDA,
	BURST_BACKEND_COUNT
};


enum synapse_kind_t {
	BURST_SYNAPSE_EXCITATORY = 0,
	BURST_SYNAPSE_INHIBITORY,
	BURST_SYNAPSE_MODULATORY
};


/*! Strategy for resolving the model of a global neuron id */
enum id_lookup_t {
	BURST_ID_LOOKUP_SCAN = 0,
	BURST_ID_LOOKUP_TABLE
};

#endif
