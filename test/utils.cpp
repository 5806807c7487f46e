#include <algorithm>
#include <iostream>
#include <vector>

#include <boost/test/unit_test.hpp>
#include <boost/random.hpp>
#include <burst.hpp>

#include "utils.hpp"


burst::Configuration
configuration(backend_t backend)
{
	burst::Configuration conf;
	switch(backend) {
		case BURST_BACKEND_CPU: conf.forceCpuBackend(); break;
		case BURST_BACKEND_WGPU: conf.forceWgpuBackend(); break;
		case BURST_BACKEND_CUDA: conf.forceCudaBackend(); break;
		default: BOOST_REQUIRE(false);
	}
	return conf;
}



bool
backendAvailable(backend_t backend, const char* test)
{
	if(burst::deviceCount(backend) == 0) {
		std::cout << "WARNING: skipped test " << test << " on "
			<< burst::backendName(backend) << " backend: no device available\n";
		return false;
	}
	return true;
}



burst::LifNeuron
lifNeuron(float threshold, area_t area)
{
	burst::LifNeuron n;
	n.threshold = threshold;
	n.leak = 0.0f;
	n.restingPotential = 0.0f;
	n.membranePotential = 0.0f;
	n.excitability = 1.0f;
	n.chargeAccumulation = true;
	n.area = area;
	return n;
}



burst::IzhikevichNeuron
izhikevichNeuron(area_t area)
{
	burst::IzhikevichNeuron n;
	n.a = 0.02f;
	n.b = 0.2f;
	n.c = -65.0f;
	n.d = 8.0f;
	n.v = -65.0f;
	n.u = n.b * n.v;
	n.area = area;
	return n;
}



typedef boost::mt19937 rng_t;
typedef boost::variate_generator<rng_t&, boost::uniform_int<> > uirng_t;


firing_t
runRandomNetwork(backend_t backend,
		unsigned ncount,
		unsigned scount,
		unsigned bursts,
		unsigned seed,
		unsigned cpuThreads)
{
	rng_t rng(seed);
	uirng_t target(rng, boost::uniform_int<>(0, ncount-1));
	uirng_t weight(rng, boost::uniform_int<>(0, 255));

	burst::Configuration conf = configuration(backend);
	conf.setCpuThreadCount(cpuThreads);
	burst::Npu npu(ncount, ncount * scount, 8, conf);

	std::vector<nidx_t> ids;
	for(unsigned n = 0; n < ncount; ++n) {
		/* Parameters chosen so that every update is exact in single precision */
		burst::LifNeuron neuron = lifNeuron(20000.0f + float(weight()) * 80.0f, n % 4);
		neuron.leak = 0.5f;
		neuron.refractoryPeriod = 1;
		neuron.consecutiveFireLimit = 3;
		neuron.excitability = n % 2 ? 1.0f : 0.5f;
		ids.push_back(npu.addNeuron(neuron));
	}

	for(unsigned n = 0; n < ncount; ++n) {
		for(unsigned s = 0; s < scount; ++s) {
			synapse_kind_t kind = s % 5 == 0 ? BURST_SYNAPSE_INHIBITORY : BURST_SYNAPSE_EXCITATORY;
			npu.addSynapse(ids.at(n), ids.at(target()), uint8_t(weight()), uint8_t(weight()), kind);
		}
	}

	firing_t firing;
	for(unsigned b = 1; b <= bursts; ++b) {
		for(unsigned i = 0; i < ncount / 10; ++i) {
			npu.injectStimulus(ids.at(target()), 30000.0f);
		}
		std::vector<nidx_t> fired = npu.processBurst(b).ids();
		std::sort(fired.begin(), fired.end());
		firing.push_back(fired);
	}
	return firing;
}



void
compareFiring(const firing_t& f1, const firing_t& f2)
{
	BOOST_REQUIRE_EQUAL(f1.size(), f2.size());
	for(size_t b = 0; b < f1.size(); ++b) {
		BOOST_REQUIRE_EQUAL(f1[b].size(), f2[b].size());
		for(size_t i = 0; i < f1[b].size(); ++i) {
			BOOST_CHECK_EQUAL(f1[b][i], f2[b][i]);
			if(f1[b][i] != f2[b][i]) {
				// no point continuing after first divergence
				BOOST_FAIL("firing diverges in burst " << b+1);
			}
		}
	}
}
