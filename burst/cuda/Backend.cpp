/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include "Backend.hpp"

#include <algorithm>
#include <iostream>
#include <boost/format.hpp>

#include <burst/ConfigurationImpl.hpp>
#include <burst/IdManager.hpp>
#include <burst/Neurons.hpp>

#include "device_memory.hpp"
#include "devices.hpp"
#include "except.hpp"
#include "kernel.hpp"

namespace burst {
	namespace cuda {


Backend::Backend(const IdManager& ids, const ConfigurationImpl& conf) :
	DeviceBackend(ids),
	m_device(chooseDevice(conf.cudaDevice())),
	m_logging(conf.loggingEnabled()),
	m_slotCount(0),
	m_synapseCount(0),
	m_firedCapacity(0)
{
	for(unsigned m = 0; m < BURST_MODEL_COUNT; ++m) {
		m_modelSize[m] = 0;
	}
}



std::string
Backend::description() const
{
	return str(boost::format("CUDA device %u (%s)") % m_device % deviceDescription(m_device));
}



void
Backend::uploadSynapses(const DenseLayout& layout)
{
	m_slotCount = layout.neuronCount();
	m_synapseCount = layout.synapseCount();

	md_rowStart = d_upload(layout.rowStart(), "synapse row start");
	if(m_synapseCount > 0) {
		md_targetSlot = d_upload(layout.targetSlot(), "synapse targets");
		md_weight = d_upload(layout.weight(), "synapse weights");
		md_psp = d_upload(layout.psp(), "synapse psp");
		md_kind = d_upload(layout.kind(), "synapse kinds");
	}

	if(m_slotCount > 0) {
		md_current = d_array<int64_t>(m_slotCount, "slot current");
		md_touched = d_array<uint32_t>(m_slotCount, "slot delivery flags");
	}

	if(m_logging) {
		std::cout << "burst: CUDA upload of " << m_synapseCount << " synapses over "
			<< m_slotCount << " neuron slots" << std::endl;
	}
}



void
Backend::uploadNeurons(const NeuronStorage& neurons)
{
	const LifNeurons& lif = neurons.lif();
	if(lif.size() > 0) {
		md_lifThreshold = d_upload(lif.threshold, "lif threshold");
		md_lifThresholdLimit = d_upload(lif.thresholdLimit, "lif threshold limit");
		md_lifLeak = d_upload(lif.leak, "lif leak");
		md_lifRest = d_upload(lif.rest, "lif resting potential");
		md_lifExcitability = d_upload(lif.excitability, "lif excitability");
		md_lifRefractoryPeriod = d_upload(lif.refractoryPeriod, "lif refractory period");
		md_lifSnoozePeriod = d_upload(lif.snoozePeriod, "lif snooze period");
		md_lifConsecutiveFireLimit = d_upload(lif.consecutiveFireLimit, "lif fire limit");
		md_lifChargeAccumulation = d_upload(lif.chargeAccumulation, "lif charge accumulation");
		md_lifValid = d_upload(lif.valid, "lif valid");
		md_lifPotential = d_upload(lif.potential, "lif potential");
		md_lifCountdown = d_upload(lif.refractoryCountdown, "lif refractory countdown");
		md_lifFireCount = d_upload(lif.consecutiveFireCount, "lif fire count");
	}

	const IzhikevichNeurons& izh = neurons.izhikevich();
	if(izh.size() > 0) {
		md_izhA = d_upload(izh.a, "izhikevich a");
		md_izhB = d_upload(izh.b, "izhikevich b");
		md_izhC = d_upload(izh.c, "izhikevich c");
		md_izhD = d_upload(izh.d, "izhikevich d");
		md_izhValid = d_upload(izh.valid, "izhikevich valid");
		md_izhU = d_upload(izh.u, "izhikevich u");
		md_izhV = d_upload(izh.v, "izhikevich v");
	}

	for(unsigned m = 0; m < BURST_MODEL_COUNT; ++m) {
		size_t count = neurons.size(model_t(m));
		if(count != m_modelSize[m] && count > 0) {
			md_input[m] = d_array<float>(count, "input");
			md_hasInput[m] = d_array<uint32_t>(count, "input flags");
			md_fired[m] = d_array<uint32_t>(count, "fired flags");
			md_firedPotential[m] = d_array<float>(count, "fired potential");
		}
		m_modelSize[m] = count;
	}

	if(m_logging) {
		std::cout << "burst: CUDA upload of " << lif.size() << " LIF and "
			<< izh.size() << " Izhikevich neuron slots" << std::endl;
	}
}



void
Backend::propagate(
		const std::vector<uint32_t>& firedSlots,
		std::vector<int64_t>& current,
		std::vector<uint32_t>& touched)
{
	if(firedSlots.size() > m_firedCapacity) {
		md_firedSlots = d_array<uint32_t>(firedSlots.size(), "fired slots");
		m_firedCapacity = firedSlots.size();
	}
	memcpyToDevice(md_firedSlots.get(), firedSlots);
	d_memset(md_current.get(), 0, m_slotCount * sizeof(int64_t));
	d_memset(md_touched.get(), 0, m_slotCount * sizeof(uint32_t));

	cudaError_t err = ::propagate(unsigned(firedSlots.size()),
			md_firedSlots.get(), md_rowStart.get(), md_targetSlot.get(),
			md_weight.get(), md_psp.get(), md_kind.get(),
			md_current.get(), md_touched.get());
	if(err != cudaSuccess) {
		throw KernelInvocationError("propagate", err);
	}
	CUDA_SAFE_CALL(cudaDeviceSynchronize());

	memcpyFromDevice(current, md_current.get(), m_slotCount);
	memcpyFromDevice(touched, md_touched.get(), m_slotCount);
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
	memcpyToDevice(md_input[model].get(), input);
	memcpyToDevice(md_hasInput[model].get(), hasInput);

	cudaError_t err = cudaSuccess;
	switch(model) {
		case BURST_MODEL_LIF :
			err = updateLif(unsigned(count),
					ids().globalIdx(model, 0), burst,
					md_input[model].get(), md_hasInput[model].get(),
					lifParams(), lifState(),
					md_fired[model].get(), md_firedPotential[model].get());
			break;
		case BURST_MODEL_IZHIKEVICH :
			err = updateIzhikevich(unsigned(count),
					md_input[model].get(),
					izhikevichParams(), izhikevichState(),
					md_fired[model].get(), md_firedPotential[model].get());
			break;
		default :
			throw burst::exception(BURST_LOGIC_ERROR, "unknown neuron model");
	}
	if(err != cudaSuccess) {
		throw KernelInvocationError("neuron update", err);
	}
	CUDA_SAFE_CALL(cudaDeviceSynchronize());

	memcpyFromDevice(fired, md_fired[model].get(), count);
	memcpyFromDevice(firedPotential, md_firedPotential[model].get(), count);

	switch(model) {
		case BURST_MODEL_LIF :
			h_lifPotential.resize(count);
			h_lifCountdown.resize(count);
			h_lifFireCount.resize(count);
			memcpyFromDevice(h_lifPotential, md_lifPotential.get(), count);
			memcpyFromDevice(h_lifCountdown, md_lifCountdown.get(), count);
			memcpyFromDevice(h_lifFireCount, md_lifFireCount.get(), count);
			break;
		case BURST_MODEL_IZHIKEVICH :
			h_izhU.resize(count);
			h_izhV.resize(count);
			memcpyFromDevice(h_izhU, md_izhU.get(), count);
			memcpyFromDevice(h_izhV, md_izhV.get(), count);
			break;
		default :
			break;
	}
}



void
Backend::commitState(model_t model, NeuronStorage& neurons)
{
	switch(model) {
		case BURST_MODEL_LIF : {
			LifNeurons& lif = neurons.lif();
			std::copy(h_lifPotential.begin(), h_lifPotential.end(), lif.potential.begin());
			std::copy(h_lifCountdown.begin(), h_lifCountdown.end(), lif.refractoryCountdown.begin());
			std::copy(h_lifFireCount.begin(), h_lifFireCount.end(), lif.consecutiveFireCount.begin());
			break;
		}
		case BURST_MODEL_IZHIKEVICH : {
			IzhikevichNeurons& izh = neurons.izhikevich();
			std::copy(h_izhU.begin(), h_izhU.end(), izh.u.begin());
			std::copy(h_izhV.begin(), h_izhV.end(), izh.v.begin());
			break;
		}
		default :
			break;
	}
}



lif_params_t
Backend::lifParams() const
{
	lif_params_t p;
	p.threshold = md_lifThreshold.get();
	p.thresholdLimit = md_lifThresholdLimit.get();
	p.leak = md_lifLeak.get();
	p.rest = md_lifRest.get();
	p.excitability = md_lifExcitability.get();
	p.refractoryPeriod = md_lifRefractoryPeriod.get();
	p.snoozePeriod = md_lifSnoozePeriod.get();
	p.consecutiveFireLimit = md_lifConsecutiveFireLimit.get();
	p.chargeAccumulation = md_lifChargeAccumulation.get();
	p.valid = md_lifValid.get();
	return p;
}



lif_state_t
Backend::lifState() const
{
	lif_state_t s;
	s.potential = md_lifPotential.get();
	s.refractoryCountdown = md_lifCountdown.get();
	s.consecutiveFireCount = md_lifFireCount.get();
	return s;
}



izhikevich_params_t
Backend::izhikevichParams() const
{
	izhikevich_params_t p;
	p.a = md_izhA.get();
	p.b = md_izhB.get();
	p.c = md_izhC.get();
	p.d = md_izhD.get();
	p.valid = md_izhValid.get();
	return p;
}



izhikevich_state_t
Backend::izhikevichState() const
{
	izhikevich_state_t s;
	s.u = md_izhU.get();
	s.v = md_izhV.get();
	return s;
}

}	} // end namespaces
