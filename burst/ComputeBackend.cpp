/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include "ComputeBackend.hpp"

#include "FireQueue.hpp"
#include "IdManager.hpp"
#include "Neurons.hpp"

namespace burst {


ComputeBackend::~ComputeBackend()
{
	;
}



void
appendFired(const IdManager& ids,
		const NeuronStorage& neurons,
		model_t model,
		const std::vector<uint8_t>& firedFlags,
		const std::vector<float>& potential,
		FireQueue& queue)
{
	const CommonArrays& common = neurons.common(model);
	for(size_t n = 0; n < firedFlags.size(); ++n) {
		if(firedFlags[n]) {
			FiringNeuron f;
			f.id = ids.globalIdx(model, lidx_t(n));
			f.potential = potential[n];
			f.area = common.area[n];
			f.x = common.x[n];
			f.y = common.y[n];
			f.z = common.z[n];
			queue.push(f);
		}
	}
}

} // end namespace burst
