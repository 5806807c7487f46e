#include <iostream>
#include <vector>
#include <boost/test/unit_test.hpp>

#include <burst.hpp>
#include <burst/FireCandidateList.hpp>

#include "utils.hpp"


/* Build-time and query behaviour of the NPU. These run on the CPU backend
 * only; the dynamics suites cover the other backends. */


BOOST_AUTO_TEST_SUITE(npu)


BOOST_AUTO_TEST_CASE(zero_capacity)
{
	BOOST_REQUIRE_THROW(burst::Npu(0, 10, 8, configuration(BURST_BACKEND_CPU)), burst::ConfigurationError);
	BOOST_REQUIRE_THROW(burst::Npu(10, 0, 8, configuration(BURST_BACKEND_CPU)), burst::ConfigurationError);
	BOOST_REQUIRE_THROW(burst::Npu(10, 10, 0, configuration(BURST_BACKEND_CPU)), burst::exception);
}



BOOST_AUTO_TEST_CASE(invalid_configuration)
{
	burst::Configuration conf;
	conf.setGpuMinFiringRate(2.0);
	BOOST_REQUIRE_THROW(burst::Npu(10, 10, 8, conf), burst::ConfigurationError);
}



BOOST_AUTO_TEST_CASE(id_ranges)
{
	burst::Npu npu(100, 10, 8, configuration(BURST_BACKEND_CPU));

	nidx_t l0 = npu.addNeuron(lifNeuron(1.0f));
	nidx_t l1 = npu.addNeuron(lifNeuron(1.0f));
	nidx_t i0 = npu.addNeuron(izhikevichNeuron());

	BOOST_REQUIRE_EQUAL(l0, 0U);
	BOOST_REQUIRE_EQUAL(l1, 1U);
	/* Izhikevich ids start after the LIF range */
	BOOST_REQUIRE_EQUAL(i0, 100U);

	BOOST_REQUIRE_EQUAL(npu.modelType(l1), BURST_MODEL_LIF);
	BOOST_REQUIRE_EQUAL(npu.modelType(i0), BURST_MODEL_IZHIKEVICH);
	BOOST_REQUIRE_EQUAL(npu.neuronCount(), 3U);
	BOOST_REQUIRE_EQUAL(npu.refractoryCountdown(i0), 0U);
}



BOOST_AUTO_TEST_CASE(neuron_capacity)
{
	burst::Npu npu(2, 10, 8, configuration(BURST_BACKEND_CPU));
	npu.addNeuron(lifNeuron(1.0f));
	npu.addNeuron(izhikevichNeuron());
	BOOST_REQUIRE_THROW(npu.addNeuron(lifNeuron(1.0f)), burst::CapacityExceeded);
	BOOST_REQUIRE_EQUAL(npu.neuronCount(), 2U);
}



BOOST_AUTO_TEST_CASE(model_ceiling)
{
	burst::Configuration conf = configuration(BURST_BACKEND_CPU);
	conf.setModelCeiling(BURST_MODEL_LIF, 1);
	burst::Npu npu(10, 10, 8, conf);
	npu.addNeuron(lifNeuron(1.0f));
	BOOST_REQUIRE_THROW(npu.addNeuron(lifNeuron(1.0f)), burst::CapacityExceeded);
	npu.addNeuron(izhikevichNeuron());
}



BOOST_AUTO_TEST_CASE(synapse_capacity)
{
	burst::Npu npu(2, 1, 8, configuration(BURST_BACKEND_CPU));
	nidx_t a = npu.addNeuron(lifNeuron(1.0f));
	nidx_t b = npu.addNeuron(lifNeuron(1.0f));
	npu.addSynapse(a, b, 1, 1, BURST_SYNAPSE_EXCITATORY);
	BOOST_REQUIRE_THROW(npu.addSynapse(b, a, 1, 1, BURST_SYNAPSE_EXCITATORY), burst::CapacityExceeded);
	BOOST_REQUIRE_EQUAL(npu.synapseCount(), 1U);
}



BOOST_AUTO_TEST_CASE(invalid_references)
{
	burst::Npu npu(10, 10, 8, configuration(BURST_BACKEND_CPU));
	nidx_t a = npu.addNeuron(lifNeuron(1.0f));

	BOOST_REQUIRE_THROW(npu.addSynapse(a, 5, 1, 1, BURST_SYNAPSE_EXCITATORY), burst::InvalidReference);
	BOOST_REQUIRE_THROW(npu.addSynapse(5, a, 1, 1, BURST_SYNAPSE_EXCITATORY), burst::InvalidReference);
	BOOST_REQUIRE_THROW(npu.injectStimulus(5, 1.0f), burst::InvalidReference);
	BOOST_REQUIRE_THROW(npu.membranePotential(5), burst::InvalidReference);
	BOOST_REQUIRE_THROW(npu.removeNeuron(5), burst::InvalidReference);
	BOOST_REQUIRE_THROW(npu.removeSynapse(0), burst::InvalidReference);
	BOOST_REQUIRE_THROW(npu.updateSynapseWeight(0, 1), burst::InvalidReference);
	BOOST_REQUIRE_THROW(npu.synapse(0), burst::InvalidReference);

	try {
		npu.addSynapse(a, a, 1, 1, synapse_kind_t(7));
		BOOST_FAIL("invalid synapse kind accepted");
	} catch(burst::exception& e) {
		BOOST_REQUIRE_EQUAL(e.errorNumber(), BURST_INVALID_INPUT);
	}
}



BOOST_AUTO_TEST_CASE(synapse_queries)
{
	burst::Npu npu(10, 10, 8, configuration(BURST_BACKEND_CPU));
	nidx_t a = npu.addNeuron(lifNeuron(1.0f));
	nidx_t b = npu.addNeuron(lifNeuron(1.0f));
	nidx_t c = npu.addNeuron(izhikevichNeuron());

	sidx_t ab = npu.addSynapse(a, b, 10, 20, BURST_SYNAPSE_EXCITATORY);
	sidx_t ac = npu.addSynapse(a, c, 30, 40, BURST_SYNAPSE_INHIBITORY);
	sidx_t cb = npu.addSynapse(c, b, 50, 60, BURST_SYNAPSE_MODULATORY);

	BOOST_REQUIRE_EQUAL(npu.outgoingSynapses(a).size(), 2U);
	BOOST_REQUIRE_EQUAL(npu.incomingSynapses(b).size(), 2U);
	BOOST_REQUIRE(npu.outgoingSynapses(b).empty());

	burst::Synapse s = npu.synapse(ac);
	BOOST_REQUIRE_EQUAL(s.source, a);
	BOOST_REQUIRE_EQUAL(s.target, c);
	BOOST_REQUIRE_EQUAL(s.weight, 30);
	BOOST_REQUIRE_EQUAL(s.psp, 40);
	BOOST_REQUIRE_EQUAL(s.kind, BURST_SYNAPSE_INHIBITORY);
	BOOST_REQUIRE_EQUAL(npu.synapse(cb).kind, BURST_SYNAPSE_MODULATORY);

	npu.updateSynapseWeight(ab, 99);
	BOOST_REQUIRE_EQUAL(npu.synapse(ab).weight, 99);

	npu.removeSynapse(ab);
	BOOST_REQUIRE_EQUAL(npu.synapseCount(), 2U);
	BOOST_REQUIRE_EQUAL(npu.outgoingSynapses(a).size(), 1U);
	BOOST_REQUIRE_THROW(npu.synapse(ab), burst::InvalidReference);
}



/* Weight updates take effect in the next propagation */
BOOST_AUTO_TEST_CASE(weight_update)
{
	burst::Npu npu(4, 4, 8, configuration(BURST_BACKEND_CPU));
	nidx_t a = npu.addNeuron(lifNeuron(1.0f));
	nidx_t b = npu.addNeuron(lifNeuron(1000.0f));
	sidx_t s = npu.addSynapse(a, b, 10, 10, BURST_SYNAPSE_EXCITATORY);

	npu.injectStimulus(a, 1.0f);
	npu.processBurst(1);
	BOOST_REQUIRE(npu.processBurst(2).empty());
	BOOST_REQUIRE_EQUAL(npu.membranePotential(b), 100.0f);

	npu.updateSynapseWeight(s, 100);
	npu.injectStimulus(a, 1.0f);
	npu.processBurst(3);
	BOOST_REQUIRE(npu.processBurst(4).contains(b));
}



BOOST_AUTO_TEST_CASE(neuron_removal)
{
	burst::Npu npu(4, 10, 8, configuration(BURST_BACKEND_CPU));
	nidx_t a = npu.addNeuron(lifNeuron(1.0f));
	nidx_t b = npu.addNeuron(lifNeuron(1.0f));
	nidx_t c = npu.addNeuron(lifNeuron(1.0f));
	npu.addSynapse(a, b, 1, 1, BURST_SYNAPSE_EXCITATORY);
	npu.addSynapse(b, c, 1, 1, BURST_SYNAPSE_EXCITATORY);
	npu.addSynapse(c, a, 1, 1, BURST_SYNAPSE_EXCITATORY);

	/* staged stimulus for a removed neuron is dropped */
	npu.injectStimulus(b, 5.0f);
	npu.removeNeuron(b);

	BOOST_REQUIRE_EQUAL(npu.neuronCount(), 2U);
	BOOST_REQUIRE_EQUAL(npu.synapseCount(), 1U);
	BOOST_REQUIRE(npu.outgoingSynapses(a).empty());
	BOOST_REQUIRE(npu.incomingSynapses(c).empty());
	BOOST_REQUIRE_THROW(npu.membranePotential(b), burst::InvalidReference);
	BOOST_REQUIRE_THROW(npu.removeNeuron(b), burst::InvalidReference);

	BOOST_REQUIRE(npu.processBurst(1).empty());

	/* The freed id is handed out again and starts fresh */
	burst::LifNeuron fresh = lifNeuron(3.0f);
	fresh.membranePotential = 2.0f;
	nidx_t d = npu.addNeuron(fresh);
	BOOST_REQUIRE_EQUAL(d, b);
	BOOST_REQUIRE_EQUAL(npu.membranePotential(d), 2.0f);
	BOOST_REQUIRE(npu.incomingSynapses(d).empty());

	npu.injectStimulus(d, 1.0f);
	BOOST_REQUIRE(npu.processBurst(2).contains(d));
}



/* A neuron removed after it fired does not spike again through a neuron which
 * is given its recycled id */
BOOST_AUTO_TEST_CASE(removal_after_firing)
{
	burst::Npu npu(4, 10, 8, configuration(BURST_BACKEND_CPU));
	nidx_t a = npu.addNeuron(lifNeuron(1.0f));
	nidx_t b = npu.addNeuron(lifNeuron(100.0f));

	npu.injectStimulus(a, 1.0f);
	BOOST_REQUIRE(npu.processBurst(1).contains(a));

	npu.removeNeuron(a);
	BOOST_REQUIRE(!npu.lastFireQueue().contains(a));

	nidx_t recycled = npu.addNeuron(lifNeuron(1.0f));
	BOOST_REQUIRE_EQUAL(recycled, a);
	npu.addSynapse(recycled, b, 10, 10, BURST_SYNAPSE_EXCITATORY);

	const burst::FireQueue& fired = npu.processBurst(2);
	BOOST_REQUIRE(fired.empty());
	BOOST_REQUIRE(!npu.lastFireCandidateList().get(b));
	BOOST_REQUIRE_EQUAL(npu.membranePotential(b), 0.0f);
}



/* Same through area removal */
BOOST_AUTO_TEST_CASE(area_removal_after_firing)
{
	burst::Npu npu(4, 10, 8, configuration(BURST_BACKEND_CPU));
	nidx_t a = npu.addNeuron(lifNeuron(1.0f, 3));
	nidx_t b = npu.addNeuron(lifNeuron(100.0f, 1));

	npu.injectStimulus(a, 1.0f);
	BOOST_REQUIRE(npu.processBurst(1).contains(a));
	BOOST_REQUIRE_EQUAL(npu.removeCorticalArea(3), 1U);

	nidx_t recycled = npu.addNeuron(lifNeuron(1.0f, 3));
	BOOST_REQUIRE_EQUAL(recycled, a);
	npu.addSynapse(recycled, b, 10, 10, BURST_SYNAPSE_EXCITATORY);

	BOOST_REQUIRE(npu.processBurst(2).empty());
	BOOST_REQUIRE(!npu.lastFireCandidateList().get(b));
}



BOOST_AUTO_TEST_CASE(area_removal)
{
	burst::Npu npu(10, 10, 8, configuration(BURST_BACKEND_CPU));
	nidx_t a = npu.addNeuron(lifNeuron(1.0f, 1));
	nidx_t b = npu.addNeuron(lifNeuron(1.0f, 2));
	nidx_t c = npu.addNeuron(lifNeuron(1.0f, 2));
	nidx_t d = npu.addNeuron(izhikevichNeuron(2));
	npu.addSynapse(a, b, 1, 1, BURST_SYNAPSE_EXCITATORY);
	npu.addSynapse(c, a, 1, 1, BURST_SYNAPSE_EXCITATORY);

	BOOST_REQUIRE_EQUAL(npu.corticalArea(b), 2U);
	BOOST_REQUIRE_EQUAL(npu.removeCorticalArea(2), 3U);
	BOOST_REQUIRE_EQUAL(npu.removeCorticalArea(2), 0U);
	BOOST_REQUIRE_EQUAL(npu.neuronCount(), 1U);
	BOOST_REQUIRE_EQUAL(npu.synapseCount(), 0U);
	BOOST_REQUIRE_THROW(npu.modelType(d), burst::InvalidReference);
	BOOST_REQUIRE_EQUAL(npu.corticalArea(a), 1U);
}



BOOST_AUTO_TEST_CASE(non_monotonic_burst)
{
	burst::Npu npu(4, 4, 8, configuration(BURST_BACKEND_CPU));
	nidx_t n = npu.addNeuron(lifNeuron(1.0f));

	BOOST_REQUIRE_EQUAL(npu.burstCount(), 0U);
	npu.processBurst(5);
	BOOST_REQUIRE_EQUAL(npu.burstCount(), 5U);

	npu.injectStimulus(n, 1.0f);
	try {
		npu.processBurst(5);
		BOOST_FAIL("repeated burst accepted");
	} catch(burst::exception& e) {
		BOOST_REQUIRE_EQUAL(e.errorNumber(), BURST_INVALID_INPUT);
	}
	BOOST_REQUIRE_THROW(npu.processBurst(3), burst::exception);
	BOOST_REQUIRE_EQUAL(npu.state(), burst::Npu::IDLE);

	/* The rejected burst left the stimulus staged */
	BOOST_REQUIRE(npu.processBurst(6).contains(n));
	BOOST_REQUIRE_EQUAL(npu.timer().elapsedBursts(), 2U);
}



/* Successive laps split the time since reset */
BOOST_AUTO_TEST_CASE(timer_lap)
{
	burst::Timer timer;
#ifdef BURST_TIMING_ENABLED
	while(timer.elapsedWallclock() < 2000) { }
	unsigned long first = timer.lap();
	BOOST_REQUIRE(first >= 2000);
	unsigned long second = timer.lap();
	BOOST_REQUIRE(first + second <= timer.elapsedWallclock());

	/* reset restarts the lap as well */
	timer.reset();
	unsigned long third = timer.lap();
	BOOST_REQUIRE(third <= timer.elapsedWallclock());
	BOOST_REQUIRE(third < first);
#else
	BOOST_REQUIRE_EQUAL(timer.lap(), 0UL);
#endif
}



BOOST_AUTO_TEST_CASE(batch_injection)
{
	burst::Npu npu(4, 4, 8, configuration(BURST_BACKEND_CPU));
	nidx_t a = npu.addNeuron(lifNeuron(1.0f));
	nidx_t b = npu.addNeuron(lifNeuron(1.0f));

	std::vector<nidx_t> ids;
	std::vector<float> values;
	ids.push_back(a);
	values.push_back(1.0f);
	ids.push_back(3);
	values.push_back(1.0f);

	/* Nothing is staged if any id is bad */
	BOOST_REQUIRE_THROW(npu.injectStimulusBatch(ids, values), burst::InvalidReference);
	BOOST_REQUIRE(npu.processBurst(1).empty());

	values.pop_back();
	try {
		npu.injectStimulusBatch(ids, values);
		BOOST_FAIL("mismatched batch accepted");
	} catch(burst::exception& e) {
		BOOST_REQUIRE_EQUAL(e.errorNumber(), BURST_INVALID_INPUT);
	}

	ids[1] = b;
	values.push_back(0.5f);
	npu.injectStimulusBatch(ids, values);
	const burst::FireQueue& fired = npu.processBurst(2);
	BOOST_REQUIRE_EQUAL(fired.size(), 1U);
	BOOST_REQUIRE(fired.contains(a));
	BOOST_REQUIRE_EQUAL(npu.membranePotential(b), 0.5f);
}



BOOST_AUTO_TEST_CASE(fire_queue_metadata)
{
	burst::Npu npu(4, 4, 8, configuration(BURST_BACKEND_CPU));
	burst::LifNeuron neuron = lifNeuron(1.0f, 7);
	neuron.x = 1;
	neuron.y = 2;
	neuron.z = 3;
	nidx_t n = npu.addNeuron(neuron);

	npu.injectStimulus(n, 1.5f);
	const burst::FireQueue& fired = npu.processBurst(1);
	BOOST_REQUIRE_EQUAL(fired.size(), 1U);
	const burst::FiringNeuron& f = fired.neurons()[0];
	BOOST_REQUIRE_EQUAL(f.id, n);
	BOOST_REQUIRE_EQUAL(f.potential, 1.5f);
	BOOST_REQUIRE_EQUAL(f.area, 7U);
	BOOST_REQUIRE_EQUAL(f.x, 1U);
	BOOST_REQUIRE_EQUAL(f.y, 2U);
	BOOST_REQUIRE_EQUAL(f.z, 3U);
	BOOST_REQUIRE_EQUAL(&fired, &npu.lastFireQueue());
}



BOOST_AUTO_TEST_CASE(fire_history)
{
	burst::Npu npu(4, 4, 4, configuration(BURST_BACKEND_CPU));
	nidx_t n = npu.addNeuron(lifNeuron(1.0f, 3));
	nidx_t m = npu.addNeuron(lifNeuron(1.0f, 4));

	for(burst_t b = 1; b <= 6; ++b) {
		if(b % 2) {
			npu.injectStimulus(n, 1.0f);
		}
		npu.injectStimulus(m, 1.0f);
		npu.processBurst(b);
	}

	/* Area history is bounded by the default window */
	const burst::FireLedger::frames_t& history = npu.getFireLedgerHistory(3);
	BOOST_REQUIRE_EQUAL(history.size(), 4U);
	BOOST_REQUIRE_EQUAL(history.front().timestep, 3U);
	BOOST_REQUIRE_EQUAL(history.back().timestep, 6U);

	std::vector<burst::CompressedSet> window = npu.getDenseWindow(3, 5, 3);
	BOOST_REQUIRE_EQUAL(window.size(), 3U);
	BOOST_REQUIRE(window[0].contains(n));
	BOOST_REQUIRE(window[1].empty());
	BOOST_REQUIRE(window[2].contains(n));
	BOOST_REQUIRE(!window[2].contains(m));

	BOOST_REQUIRE_THROW(npu.getDenseWindow(3, 6, 5), burst::exception);
	BOOST_REQUIRE_THROW(npu.getDenseWindow(3, 2, 1), burst::exception);
	BOOST_REQUIRE_THROW(npu.getDenseWindow(3, 7, 1), burst::exception);
	BOOST_REQUIRE_THROW(npu.getFireLedgerHistory(9), burst::InvalidReference);

	npu.untrackArea(4);
	BOOST_REQUIRE_THROW(npu.getFireLedgerHistory(4), burst::InvalidReference);

	npu.trackArea(9, 16);
	npu.processBurst(7);
	BOOST_REQUIRE_EQUAL(npu.getFireLedgerHistory(9).size(), 1U);
	BOOST_REQUIRE_EQUAL(npu.getFireLedgerHistory(9).capacity(), 16U);
}



BOOST_AUTO_TEST_CASE(backend_decision)
{
	burst::Npu forced(4, 4, 8, configuration(BURST_BACKEND_CPU));
	BOOST_REQUIRE(!forced.backendDecision());
	forced.addNeuron(lifNeuron(1.0f));
	forced.processBurst(1);
	BOOST_REQUIRE(forced.backendDecision());
	BOOST_REQUIRE(forced.backendDecision()->forced);
	BOOST_REQUIRE_EQUAL(forced.backendDecision()->backend, BURST_BACKEND_CPU);
	BOOST_REQUIRE_EQUAL(forced.backendType().get(), BURST_BACKEND_CPU);

	/* A small network stays on the CPU whatever the hardware */
	burst::Npu automatic(4, 4, 8, burst::Configuration());
	automatic.addNeuron(lifNeuron(1.0f));
	automatic.processBurst(1);
	BOOST_REQUIRE(!automatic.backendDecision()->forced);
	BOOST_REQUIRE_EQUAL(automatic.backendType().get(), BURST_BACKEND_CPU);
	BOOST_REQUIRE_EQUAL(automatic.backendDecision()->estimatedSpeedup, 1.0);

	automatic.reselectBackend();
	automatic.processBurst(2);
	BOOST_REQUIRE_EQUAL(automatic.backendType().get(), BURST_BACKEND_CPU);
}



/* With no device present a forced GPU backend is an error rather than a
 * silent fallback */
BOOST_AUTO_TEST_CASE(forced_unavailable)
{
	if(burst::deviceCount(BURST_BACKEND_CUDA) > 0) {
		std::cout << "WARNING: skipped test forced_unavailable: CUDA device present\n";
		return;
	}
	burst::Npu npu(4, 4, 8, configuration(BURST_BACKEND_CUDA));
	npu.addNeuron(lifNeuron(1.0f));
	BOOST_REQUIRE_THROW(npu.processBurst(1), burst::BackendUnavailable);
	BOOST_REQUIRE_EQUAL(npu.state(), burst::Npu::IDLE);
	BOOST_REQUIRE_EQUAL(npu.burstCount(), 0U);
}


BOOST_AUTO_TEST_SUITE_END()
