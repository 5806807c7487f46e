#ifndef BURST_WGPU_BACKEND_HPP
#define BURST_WGPU_BACKEND_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <cstddef>
#include <boost/scoped_ptr.hpp>

#include <burst/config.h>
#include <burst/DeviceBackend.hpp>

#include "Context.hpp"

namespace burst {

class ConfigurationImpl;

	namespace wgpu {

/* Host mirrors of the WGSL structs in shaders.cpp */

struct Meta
{
	uint32_t count;
	uint32_t idBase;
	uint32_t burstLo;
	uint32_t pad;
};

struct GpuSynapse
{
	uint32_t target;
	uint32_t packed;
};

struct LifParams
{
	float threshold;
	float thresholdLimit;
	float leak;
	float rest;
	float excitability;
	uint32_t refractory;
	uint32_t snooze;
	uint32_t fireLimit;
	uint32_t flags;
};

struct LifState
{
	float potential;
	uint32_t countdown;
	uint32_t fireCount;
};

struct IzhikevichParams
{
	float a, b, c, d;
	uint32_t valid;
};

struct IzhikevichState
{
	float u, v;
};

struct NeuronInput
{
	float value;
	uint32_t has;
};

struct NeuronOutput
{
	uint32_t fired;
	float potential;
};



/*! \brief Backend running both phases as WebGPU compute shaders
 *
 * WGSL has no 8 or 16-bit storage types, so parameters are widened and
 * packed into one struct per neuron on upload. The size of the synapse
 * array is bounded by the adapter's storage binding limit.
 */
class BURST_WGPU_DLL_PUBLIC Backend : public DeviceBackend
{
	public :

		/*! \throws burst::BackendUnavailable if there is no usable adapter */
		Backend(const IdManager& ids, const ConfigurationImpl& conf);

		~Backend();

		backend_t type() const { return BURST_BACKEND_WGPU; }

		std::string description() const;

	private :

		void uploadSynapses(const DenseLayout& layout);

		void uploadNeurons(const NeuronStorage& neurons);

		void propagate(
				const std::vector<uint32_t>& firedSlots,
				std::vector<int64_t>& current,
				std::vector<uint32_t>& touched);

		void update(model_t model,
				burst_t burst,
				const std::vector<float>& input,
				const std::vector<uint32_t>& hasInput,
				std::vector<uint32_t>& fired,
				std::vector<float>& firedPotential);

		void commitState(model_t model, NeuronStorage& neurons);

		/* Declared first: every other device object refers to it */
		boost::scoped_ptr<Context> m_ctx;

		bool m_logging;

		boost::scoped_ptr<Pipeline> m_propagate;
		boost::scoped_ptr<Pipeline> m_lif;
		boost::scoped_ptr<Pipeline> m_izhikevich;

		boost::scoped_ptr<Buffer> m_meta;

		boost::scoped_ptr<Buffer> m_rowStart;
		boost::scoped_ptr<Buffer> m_synapses;
		boost::scoped_ptr<Buffer> m_current;
		boost::scoped_ptr<Buffer> m_touched;
		boost::scoped_ptr<Buffer> m_firedSlots;
		size_t m_slotCount;

		boost::scoped_ptr<Buffer> m_params[BURST_MODEL_COUNT];
		boost::scoped_ptr<Buffer> m_state[BURST_MODEL_COUNT];
		boost::scoped_ptr<Buffer> m_input[BURST_MODEL_COUNT];
		boost::scoped_ptr<Buffer> m_output[BURST_MODEL_COUNT];
		size_t m_modelSize[BURST_MODEL_COUNT];

		/* Staging */
		std::vector<NeuronInput> h_input;
		std::vector<NeuronOutput> h_output;
		std::vector<LifState> h_lifState;
		std::vector<IzhikevichState> h_izhikevichState;

		void setMeta(uint32_t count, uint32_t idBase, burst_t burst);
};

}	} // end namespaces

#endif
