/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include "Npu.hpp"

#include <iostream>
#include <boost/format.hpp>

#include "ComputeBackend.hpp"
#include "Configuration.hpp"
#include "FireCandidateList.hpp"
#include "Plugin.hpp"
#include "backends.hpp"
#include "exception.hpp"

namespace burst {


namespace {

const ConfigurationImpl&
verified(const ConfigurationImpl& conf)
{
	conf.verify();
	return conf;
}



std::vector<uint32_t>
modelCeilings(const ConfigurationImpl& conf, uint32_t neuronCapacity)
{
	if(neuronCapacity == 0) {
		throw ConfigurationError("NPU neuron capacity must be non-zero");
	}
	std::vector<uint32_t> ceilings(BURST_MODEL_COUNT);
	for(unsigned m = 0; m < BURST_MODEL_COUNT; ++m) {
		uint32_t c = conf.modelCeiling(model_t(m));
		ceilings[m] = c == 0 ? neuronCapacity : c;
	}
	return ceilings;
}



size_t
nonZeroSynapseCapacity(uint32_t capacity)
{
	if(capacity == 0) {
		throw ConfigurationError("NPU synapse capacity must be non-zero");
	}
	return capacity;
}


}



Npu::Npu(uint32_t neuronCapacity,
		uint32_t synapseCapacity,
		size_t fireLedgerWindow,
		const Configuration& conf) :
	m_conf(verified(*conf.m_impl)),
	m_neuronCapacity(neuronCapacity),
	m_ids(modelCeilings(m_conf, neuronCapacity), m_conf.idLookup()),
	m_synapses(nonZeroSynapseCapacity(synapseCapacity)),
	m_ledger(fireLedgerWindow),
	m_fcl(new FireCandidateList(m_ids)),
	m_workFcl(new FireCandidateList(m_ids)),
	m_state(IDLE)
{
	if(m_conf.loggingEnabled()) {
		std::cout << "burst: NPU with capacity for " << neuronCapacity
			<< " neurons and " << synapseCapacity << " synapses, ledger window "
			<< fireLedgerWindow << std::endl;
	}
}



Npu::~Npu()
{
	/* The backend must go before the plugin which holds its code */
	m_backend.reset();
	m_plugin.reset();
}



nidx_t
Npu::allocate(model_t model)
{
	using boost::format;
	if(m_ids.liveCount() >= m_neuronCapacity) {
		throw CapacityExceeded(str(format("NPU neuron capacity (%u) reached") % m_neuronCapacity));
	}
	return m_ids.allocate(model);
}



nidx_t
Npu::addNeuron(const LifNeuron& neuron)
{
	nidx_t id = allocate(BURST_MODEL_LIF);
	m_neurons.set(m_ids.localIdx(BURST_MODEL_LIF, id), neuron);
	m_ledger.trackDefault(neuron.area);
	return id;
}



nidx_t
Npu::addNeuron(const IzhikevichNeuron& neuron)
{
	nidx_t id = allocate(BURST_MODEL_IZHIKEVICH);
	m_neurons.set(m_ids.localIdx(BURST_MODEL_IZHIKEVICH, id), neuron);
	m_ledger.trackDefault(neuron.area);
	return id;
}



void
Npu::checkLive(nidx_t neuron) const
{
	using boost::format;
	if(!m_ids.isAllocated(neuron)) {
		throw InvalidReference(str(format("neuron %u is not allocated") % neuron));
	}
}



sidx_t
Npu::addSynapse(nidx_t source, nidx_t target,
		uint8_t weight, uint8_t psp, synapse_kind_t kind)
{
	checkLive(source);
	checkLive(target);
	if(kind != BURST_SYNAPSE_EXCITATORY && kind != BURST_SYNAPSE_INHIBITORY && kind != BURST_SYNAPSE_MODULATORY) {
		throw exception(BURST_INVALID_INPUT,
				str(boost::format("invalid synapse kind %d") % int(kind)));
	}
	Synapse s;
	s.source = source;
	s.target = target;
	s.weight = weight;
	s.psp = psp;
	s.kind = kind;
	return m_synapses.add(s);
}



void
Npu::removeNeuron(nidx_t neuron)
{
	checkLive(neuron);

	/* Copies, since removal edits the index being walked */
	std::vector<sidx_t> outgoing = m_synapses.outgoing(neuron);
	for(std::vector<sidx_t>::const_iterator i = outgoing.begin(); i != outgoing.end(); ++i) {
		m_synapses.remove(*i);
	}
	std::vector<sidx_t> incoming = m_synapses.incoming(neuron);
	for(std::vector<sidx_t>::const_iterator i = incoming.begin(); i != incoming.end(); ++i) {
		/* self-connections were removed with the outgoing set */
		if(m_synapses.valid(*i)) {
			m_synapses.remove(*i);
		}
	}

	std::pair<model_t, lidx_t> loc = m_ids.locate(neuron);
	m_neurons.invalidate(loc.first, loc.second);
	m_ids.deallocate(neuron);

	/* The id may be recycled before the next burst propagates from this queue */
	m_fired.erase(neuron);

	std::vector< std::pair<nidx_t, float> >::iterator i = m_stimulus.begin();
	while(i != m_stimulus.end()) {
		if(i->first == neuron) {
			i = m_stimulus.erase(i);
		} else {
			++i;
		}
	}
}



size_t
Npu::removeCorticalArea(area_t area)
{
	std::vector<nidx_t> members;
	for(unsigned m = 0; m < BURST_MODEL_COUNT; ++m) {
		model_t model = model_t(m);
		const CommonArrays& common = m_neurons.common(model);
		for(size_t n = 0; n < common.size(); ++n) {
			if(common.valid[n] && common.area[n] == area) {
				members.push_back(m_ids.globalIdx(model, lidx_t(n)));
			}
		}
	}
	for(std::vector<nidx_t>::const_iterator i = members.begin(); i != members.end(); ++i) {
		removeNeuron(*i);
	}
	return members.size();
}



void
Npu::removeSynapse(sidx_t synapse)
{
	m_synapses.remove(synapse);
}



void
Npu::updateSynapseWeight(sidx_t synapse, uint8_t weight)
{
	m_synapses.setWeight(synapse, weight);
}



void
Npu::injectStimulus(nidx_t neuron, float potential)
{
	checkLive(neuron);
	m_stimulus.push_back(std::make_pair(neuron, potential));
}



void
Npu::injectStimulusBatch(const std::vector<nidx_t>& neurons,
		const std::vector<float>& potentials)
{
	using boost::format;
	if(neurons.size() != potentials.size()) {
		throw exception(BURST_INVALID_INPUT,
				str(format("stimulus batch has %u neurons but %u potentials")
					% neurons.size() % potentials.size()));
	}
	for(std::vector<nidx_t>::const_iterator i = neurons.begin(); i != neurons.end(); ++i) {
		checkLive(*i);
	}
	for(size_t i = 0; i < neurons.size(); ++i) {
		m_stimulus.push_back(std::make_pair(neurons[i], potentials[i]));
	}
}



void
Npu::ensureBackend()
{
	if(m_backend) {
		return;
	}

	if(!m_hardware) {
		m_hardware = probeHardware();
	}

	uint64_t neurons = m_ids.liveCount();
	double rate = neurons == 0 ? 0.0 : double(m_fired.size()) / double(neurons);
	BackendDecision decision =
		selectBackend(neurons, m_synapses.size(), rate, *m_hardware, m_conf);

	if(m_conf.loggingEnabled()) {
		std::cout << "burst: selected " << backendName(decision.backend)
			<< " backend: " << decision.reason << std::endl;
	}

	/* Fall back CUDA -> WGPU -> CPU when a non-forced choice cannot be built */
	for(int b = decision.backend; b >= 0; --b) {
		backend_t backend = backend_t(b);
		if(backend == BURST_BACKEND_WGPU && !decision.forced && !m_hardware->wgpu) {
			continue;
		}
		try {
			boost::shared_ptr<Plugin> plugin;
			ComputeBackend* created = createBackend(backend, m_ids, m_conf, plugin);
			m_plugin = plugin;
			m_backend.reset(created);
			if(backend != decision.backend) {
				decision.backend = backend;
				decision.estimatedSpeedup = 1.0;
				decision.reason += str(boost::format(" (fell back to %s)") % backendName(backend));
			}
			m_decision = decision;
			if(m_conf.loggingEnabled()) {
				std::cout << "burst: using " << m_backend->description() << std::endl;
			}
			return;
		} catch(BackendUnavailable& e) {
			if(decision.forced || backend == BURST_BACKEND_CPU) {
				throw;
			}
			if(m_conf.loggingEnabled()) {
				std::cout << "burst: " << backendName(backend)
					<< " backend unavailable, falling back: " << e.what() << std::endl;
			}
		}
	}
}



const FireQueue&
Npu::processBurst(burst_t burst)
{
	using boost::format;

	boost::optional<burst_t> last = m_ledger.lastTimestep();
	if(last && burst <= *last) {
		throw exception(BURST_INVALID_INPUT,
				str(format("burst %u does not follow the last processed burst %u")
					% burst % *last));
	}

	BurstTimings timings;
	Timer clock;
	FireQueue fired;

	try {
		ensureBackend();
		timings.select = clock.lap();

		m_state = INJECTING;
		FireCandidateList& fcl = *m_workFcl;
		fcl.clear();
		for(std::vector< std::pair<nidx_t, float> >::const_iterator i = m_stimulus.begin();
				i != m_stimulus.end(); ++i) {
			fcl.accumulate(i->first, i->second);
		}
		timings.inject = clock.lap();

		m_state = PROPAGATING;
		m_backend->processSynapticPropagation(m_fired.ids(), m_synapses, fcl);
		timings.propagate = clock.lap();

		m_state = DYNAMICS;
		m_backend->processNeuralDynamics(fcl, m_neurons, burst, fired);
		timings.dynamics = clock.lap();

		m_state = ARCHIVING;
		m_ledger.archive(burst, fired);
		timings.archive = clock.lap();

	} catch(ComputationError&) {
		m_state = IDLE;
		if(m_backend) {
			m_backend->invalidate();
		}
		throw;
	} catch(burst::exception&) {
		m_state = IDLE;
		throw;
	}

	/* Commit. Nothing below can fail. */
	m_fcl.swap(m_workFcl);
	std::swap(m_fired, fired);
	m_stimulus.clear();
	m_timer.step();
	m_timings = timings;
	m_state = IDLE;
	return m_fired;
}



void
Npu::reselectBackend()
{
	m_backend.reset();
	m_plugin.reset();
	m_decision.reset();
	m_hardware.reset();
}



boost::optional<backend_t>
Npu::backendType() const
{
	if(!m_backend) {
		return boost::optional<backend_t>();
	}
	return boost::optional<backend_t>(m_backend->type());
}



const FireLedger::frames_t&
Npu::getFireLedgerHistory(area_t area) const
{
	return m_ledger.history(area);
}



std::vector<CompressedSet>
Npu::getDenseWindow(area_t area, burst_t end, size_t depth) const
{
	return m_ledger.denseWindow(area, end, depth);
}



void
Npu::trackArea(area_t area, size_t window)
{
	m_ledger.track(area, window);
}



void
Npu::untrackArea(area_t area)
{
	m_ledger.untrack(area);
}



const std::vector<sidx_t>&
Npu::outgoingSynapses(nidx_t neuron) const
{
	checkLive(neuron);
	return m_synapses.outgoing(neuron);
}



const std::vector<sidx_t>&
Npu::incomingSynapses(nidx_t neuron) const
{
	checkLive(neuron);
	return m_synapses.incoming(neuron);
}



Synapse
Npu::synapse(sidx_t synapse) const
{
	return m_synapses.get(synapse);
}



float
Npu::membranePotential(nidx_t neuron) const
{
	checkLive(neuron);
	std::pair<model_t, lidx_t> loc = m_ids.locate(neuron);
	return m_neurons.membranePotential(loc.first, loc.second);
}



unsigned
Npu::refractoryCountdown(nidx_t neuron) const
{
	checkLive(neuron);
	std::pair<model_t, lidx_t> loc = m_ids.locate(neuron);
	if(loc.first != BURST_MODEL_LIF) {
		return 0;
	}
	return m_neurons.lif().refractoryCountdown[loc.second];
}



model_t
Npu::modelType(nidx_t neuron) const
{
	checkLive(neuron);
	return m_ids.modelType(neuron);
}



area_t
Npu::corticalArea(nidx_t neuron) const
{
	checkLive(neuron);
	std::pair<model_t, lidx_t> loc = m_ids.locate(neuron);
	return m_neurons.area(loc.first, loc.second);
}



burst_t
Npu::burstCount() const
{
	boost::optional<burst_t> last = m_ledger.lastTimestep();
	return last ? *last : 0;
}



const FireCandidateList&
Npu::lastFireCandidateList() const
{
	return *m_fcl;
}

} // end namespace burst
