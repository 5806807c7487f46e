#ifndef BURST_COMPUTE_BACKEND_HPP
#define BURST_COMPUTE_BACKEND_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

//! \file ComputeBackend.hpp

#include <string>
#include <vector>
#include <boost/utility.hpp>

#include <burst/config.h>
#include "types.h"

namespace burst {

class IdManager;
class NeuronStorage;
class SynapseStorage;
class FireCandidateList;
class FireQueue;


/*! \class ComputeBackend
 *
 * Strategy interface implemented once per hardware target. A burst calls
 * \a processSynapticPropagation and then \a processNeuralDynamics; the first
 * has fully completed (including any device synchronisation) before the
 * second starts. Both block the calling thread.
 *
 * Either phase may throw burst::ComputationError, after which nothing it
 * produced may be used.
 */
class BURST_DLL_PUBLIC ComputeBackend : private boost::noncopyable
{
	public :

		virtual ~ComputeBackend();

		/*! Phase 1: deliver the synapses of every fired neuron
		 *
		 * For each source in \a fired, add weight x psp (negated for
		 * inhibitory synapses) of each of its outgoing synapses to the
		 * target's entry in \a fcl. Existing entries (such as stimulus) are
		 * added to, not replaced.
		 */
		virtual void processSynapticPropagation(
				const std::vector<nidx_t>& fired,
				const SynapseStorage& synapses,
				FireCandidateList& fcl) = 0;

		/*! Phase 2: update every neuron with input or persistent state
		 *
		 * Model buckets of \a fcl are processed one model at a time. Neuron
		 * state in \a neurons is updated in place, and \a fired is reset and
		 * filled with the neurons which fired, in id order. After a
		 * burst::ComputationError \a neurons is left as it was.
		 */
		virtual void processNeuralDynamics(
				const FireCandidateList& fcl,
				NeuronStorage& neurons,
				burst_t burst,
				FireQueue& fired) = 0;

		virtual backend_t type() const = 0;

		/*! \return human-readable description of the hardware in use */
		virtual std::string description() const = 0;

		/*! Forget any device copy of the storage, forcing a full upload
		 * before the next burst. No-op for host-only backends. */
		virtual void invalidate() { }

	protected :

		ComputeBackend() { }
};



/*! Append neurons flagged in \a firedFlags to \a queue, in local index order
 *
 * \param potential potential at the time of firing, for flagged neurons
 */
void
appendFired(const IdManager& ids,
		const NeuronStorage& neurons,
		model_t model,
		const std::vector<uint8_t>& firedFlags,
		const std::vector<float>& potential,
		FireQueue& queue);

} // end namespace burst

#endif
