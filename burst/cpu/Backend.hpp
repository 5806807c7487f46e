#ifndef BURST_CPU_BACKEND_HPP
#define BURST_CPU_BACKEND_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <cstddef>
#include <vector>

#include <burst/config.h>
#include <burst/ComputeBackend.hpp>

namespace burst {

class ConfigurationImpl;

	namespace cpu {

/*! \brief Host backend, always available
 *
 * Propagation walks the outgoing index of each fired neuron. Dynamics
 * scatters each model bucket of the FCL into a dense input array and runs
 * the shared update function over the model's whole array, optionally split
 * across worker threads.
 */
class BURST_DLL_PUBLIC Backend : public ComputeBackend
{
	public:

		Backend(const IdManager& ids, const ConfigurationImpl& conf);

		void processSynapticPropagation(
				const std::vector<nidx_t>& fired,
				const SynapseStorage& synapses,
				FireCandidateList& fcl);

		void processNeuralDynamics(
				const FireCandidateList& fcl,
				NeuronStorage& neurons,
				burst_t burst,
				FireQueue& fired);

		backend_t type() const { return BURST_BACKEND_CPU; }

		std::string description() const;

		/*! Update neurons [start, end) of one model for the current burst */
		void updateRange(model_t model, size_t start, size_t end);

	private:

		const IdManager& m_ids;

		unsigned m_threadCount;

		/* Dense per-model input, all zero between bursts */
		std::vector<float> m_input[BURST_MODEL_COUNT];
		std::vector<uint8_t> m_hasInput[BURST_MODEL_COUNT];

		std::vector<uint8_t> m_fired[BURST_MODEL_COUNT];
		std::vector<float> m_firedPotential[BURST_MODEL_COUNT];

		/* Context of the burst in progress */
		NeuronStorage* m_neurons;
		burst_t m_burst;

		void updateModel(model_t model, size_t count);
};

}	} // end namespaces

#endif
