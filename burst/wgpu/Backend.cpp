/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include "Backend.hpp"

#include <iostream>
#include <boost/format.hpp>

#include <burst/ConfigurationImpl.hpp>
#include <burst/IdManager.hpp>
#include <burst/Neurons.hpp>
#include <burst/exception.hpp>

#include "shaders.hpp"

namespace burst {
	namespace wgpu {


Backend::Backend(const IdManager& ids, const ConfigurationImpl& conf) :
	DeviceBackend(ids),
	m_ctx(new Context()),
	m_logging(conf.loggingEnabled()),
	m_slotCount(0)
{
	m_propagate.reset(new Pipeline(*m_ctx, PROPAGATE_SHADER, "propagate"));
	m_lif.reset(new Pipeline(*m_ctx, LIF_SHADER, "lif update"));
	m_izhikevich.reset(new Pipeline(*m_ctx, IZHIKEVICH_SHADER, "izhikevich update"));
	m_meta.reset(new Buffer(*m_ctx, sizeof(Meta), "dispatch parameters", true));
	for(unsigned m = 0; m < BURST_MODEL_COUNT; ++m) {
		m_modelSize[m] = 0;
	}
}



Backend::~Backend()
{
	/* Device objects before the context */
	m_meta.reset();
	m_rowStart.reset();
	m_synapses.reset();
	m_current.reset();
	m_touched.reset();
	m_firedSlots.reset();
	for(unsigned m = 0; m < BURST_MODEL_COUNT; ++m) {
		m_params[m].reset();
		m_state[m].reset();
		m_input[m].reset();
		m_output[m].reset();
	}
	m_propagate.reset();
	m_lif.reset();
	m_izhikevich.reset();
}



std::string
Backend::description() const
{
	return str(boost::format("WGPU (%s)") % m_ctx->adapterName());
}



void
Backend::setMeta(uint32_t count, uint32_t idBase, burst_t burst)
{
	Meta meta;
	meta.count = count;
	meta.idBase = idBase;
	meta.burstLo = uint32_t(burst);
	meta.pad = 0;
	m_meta->write(&meta, sizeof(meta));
}



void
Backend::uploadSynapses(const DenseLayout& layout)
{
	m_slotCount = layout.neuronCount();
	const size_t scount = layout.synapseCount();

	std::vector<GpuSynapse> synapses(scount);
	for(size_t s = 0; s < scount; ++s) {
		synapses[s].target = layout.targetSlot()[s];
		synapses[s].packed = uint32_t(layout.weight()[s])
			| uint32_t(layout.psp()[s]) << 8
			| uint32_t(layout.kind()[s]) << 16;
	}

	m_rowStart.reset(new Buffer(*m_ctx, layout.rowStart().size() * sizeof(uint32_t), "synapse row start"));
	m_rowStart->write(layout.rowStart());
	m_synapses.reset(new Buffer(*m_ctx, scount * sizeof(GpuSynapse), "synapses"));
	m_synapses->write(synapses);
	/* lo, hi word pairs read back as little-endian int64 */
	m_current.reset(new Buffer(*m_ctx, m_slotCount * sizeof(int64_t), "slot current"));
	m_touched.reset(new Buffer(*m_ctx, m_slotCount * sizeof(uint32_t), "slot delivery flags"));
	m_firedSlots.reset(new Buffer(*m_ctx, m_slotCount * sizeof(uint32_t), "fired slots"));

	if(m_logging) {
		std::cout << "burst: WGPU upload of " << scount << " synapses over "
			<< m_slotCount << " neuron slots" << std::endl;
	}
}



void
Backend::uploadNeurons(const NeuronStorage& neurons)
{
	const LifNeurons& lif = neurons.lif();
	const size_t lcount = lif.size();
	if(lcount > 0) {
		std::vector<LifParams> params(lcount);
		h_lifState.resize(lcount);
		for(size_t n = 0; n < lcount; ++n) {
			LifParams& p = params[n];
			p.threshold = lif.threshold[n];
			p.thresholdLimit = lif.thresholdLimit[n];
			p.leak = lif.leak[n];
			p.rest = lif.rest[n];
			p.excitability = lif.excitability[n];
			p.refractory = lif.refractoryPeriod[n];
			p.snooze = lif.snoozePeriod[n];
			p.fireLimit = lif.consecutiveFireLimit[n];
			p.flags = (lif.chargeAccumulation[n] ? 1u : 0u) | (lif.valid[n] ? 2u : 0u);
			h_lifState[n].potential = lif.potential[n];
			h_lifState[n].countdown = lif.refractoryCountdown[n];
			h_lifState[n].fireCount = lif.consecutiveFireCount[n];
		}
		m_params[BURST_MODEL_LIF].reset(new Buffer(*m_ctx, lcount * sizeof(LifParams), "lif parameters"));
		m_params[BURST_MODEL_LIF]->write(params);
		m_state[BURST_MODEL_LIF].reset(new Buffer(*m_ctx, lcount * sizeof(LifState), "lif state"));
		m_state[BURST_MODEL_LIF]->write(h_lifState);
	}

	const IzhikevichNeurons& izh = neurons.izhikevich();
	const size_t icount = izh.size();
	if(icount > 0) {
		std::vector<IzhikevichParams> params(icount);
		h_izhikevichState.resize(icount);
		for(size_t n = 0; n < icount; ++n) {
			params[n].a = izh.a[n];
			params[n].b = izh.b[n];
			params[n].c = izh.c[n];
			params[n].d = izh.d[n];
			params[n].valid = izh.valid[n];
			h_izhikevichState[n].u = izh.u[n];
			h_izhikevichState[n].v = izh.v[n];
		}
		m_params[BURST_MODEL_IZHIKEVICH].reset(new Buffer(*m_ctx, icount * sizeof(IzhikevichParams), "izhikevich parameters"));
		m_params[BURST_MODEL_IZHIKEVICH]->write(params);
		m_state[BURST_MODEL_IZHIKEVICH].reset(new Buffer(*m_ctx, icount * sizeof(IzhikevichState), "izhikevich state"));
		m_state[BURST_MODEL_IZHIKEVICH]->write(h_izhikevichState);
	}

	for(unsigned m = 0; m < BURST_MODEL_COUNT; ++m) {
		size_t count = neurons.size(model_t(m));
		if(count != m_modelSize[m] && count > 0) {
			m_input[m].reset(new Buffer(*m_ctx, count * sizeof(NeuronInput), "neuron input"));
			m_output[m].reset(new Buffer(*m_ctx, count * sizeof(NeuronOutput), "neuron output"));
		}
		m_modelSize[m] = count;
	}

	if(m_logging) {
		std::cout << "burst: WGPU upload of " << lcount << " LIF and "
			<< icount << " Izhikevich neuron slots" << std::endl;
	}
}



void
Backend::propagate(
		const std::vector<uint32_t>& firedSlots,
		std::vector<int64_t>& current,
		std::vector<uint32_t>& touched)
{
	setMeta(uint32_t(firedSlots.size()), 0, 0);
	m_firedSlots->write(firedSlots);
	m_current->clear();
	m_touched->clear();

	std::vector<Buffer*> bindings;
	bindings.push_back(m_meta.get());
	bindings.push_back(m_firedSlots.get());
	bindings.push_back(m_rowStart.get());
	bindings.push_back(m_synapses.get());
	bindings.push_back(m_current.get());
	bindings.push_back(m_touched.get());
	m_propagate->dispatch(unsigned(firedSlots.size()), bindings);

	m_current->read(current, m_slotCount);
	m_touched->read(touched, m_slotCount);
}



void
Backend::update(model_t model,
		burst_t burst,
		const std::vector<float>& input,
		const std::vector<uint32_t>& hasInput,
		std::vector<uint32_t>& fired,
		std::vector<float>& firedPotential)
{
	const size_t count = m_modelSize[model];

	h_input.resize(count);
	for(size_t n = 0; n < count; ++n) {
		h_input[n].value = input[n];
		h_input[n].has = hasInput[n];
	}
	m_input[model]->write(h_input);
	setMeta(uint32_t(count), ids().globalIdx(model, 0), burst);

	std::vector<Buffer*> bindings;
	bindings.push_back(m_meta.get());
	bindings.push_back(m_params[model].get());
	bindings.push_back(m_state[model].get());
	bindings.push_back(m_input[model].get());
	bindings.push_back(m_output[model].get());

	switch(model) {
		case BURST_MODEL_LIF : {
			m_lif->dispatch(unsigned(count), bindings);
			m_state[model]->read(h_lifState, count);
			break;
		}
		case BURST_MODEL_IZHIKEVICH : {
			m_izhikevich->dispatch(unsigned(count), bindings);
			m_state[model]->read(h_izhikevichState, count);
			break;
		}
		default :
			throw burst::exception(BURST_LOGIC_ERROR, "unknown neuron model");
	}

	h_output.resize(count);
	m_output[model]->read(h_output, count);
	for(size_t n = 0; n < count; ++n) {
		fired[n] = h_output[n].fired;
		firedPotential[n] = h_output[n].potential;
	}
}



void
Backend::commitState(model_t model, NeuronStorage& neurons)
{
	const size_t count = m_modelSize[model];
	switch(model) {
		case BURST_MODEL_LIF : {
			LifNeurons& lif = neurons.lif();
			for(size_t n = 0; n < count; ++n) {
				lif.potential[n] = h_lifState[n].potential;
				lif.refractoryCountdown[n] = uint16_t(h_lifState[n].countdown);
				lif.consecutiveFireCount[n] = uint16_t(h_lifState[n].fireCount);
			}
			break;
		}
		case BURST_MODEL_IZHIKEVICH : {
			IzhikevichNeurons& izh = neurons.izhikevich();
			for(size_t n = 0; n < count; ++n) {
				izh.u[n] = h_izhikevichState[n].u;
				izh.v[n] = h_izhikevichState[n].v;
			}
			break;
		}
		default :
			break;
	}
}

}	} // end namespaces
