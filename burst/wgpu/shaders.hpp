#ifndef BURST_WGPU_SHADERS_HPP
#define BURST_WGPU_SHADERS_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

namespace burst {
	namespace wgpu {

/* WGSL sources. The arithmetic mirrors kernel/synapse.h, kernel/lif.h,
 * kernel/izhikevich.h and kernel/rng.h. */

extern const char* PROPAGATE_SHADER;
extern const char* LIF_SHADER;
extern const char* IZHIKEVICH_SHADER;

/* Threads per workgroup in every shader */
const unsigned WORKGROUP_SIZE = 256;

}	}

#endif
