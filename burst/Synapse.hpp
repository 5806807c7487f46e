#ifndef BURST_SYNAPSE_HPP
#define BURST_SYNAPSE_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <burst/types.h>

namespace burst {

struct Synapse
{
	Synapse() : source(0), target(0), weight(0), psp(0), kind(BURST_SYNAPSE_EXCITATORY) {}

	Synapse(nidx_t source, nidx_t target, uint8_t weight, uint8_t psp, synapse_kind_t kind) :
		source(source), target(target), weight(weight), psp(psp), kind(kind) {}

	nidx_t source;
	nidx_t target;
	uint8_t weight;
	uint8_t psp;
	synapse_kind_t kind;
};

}

#endif
