#ifndef BURST_TEST_UTILS_HPP
#define BURST_TEST_UTILS_HPP

#include <utility>
#include <vector>

#include <burst.hpp>

/* Configuration with the given backend forced */
burst::Configuration
configuration(backend_t backend);

/* Return true if the backend can be used on this host. Prints a warning
 * naming the test otherwise */
bool
backendAvailable(backend_t backend, const char* test);

/* A LIF neuron with no leak, no refractory period and certain firing */
burst::LifNeuron
lifNeuron(float threshold, area_t area = 0);

/* Regular-spiking Izhikevich neuron */
burst::IzhikevichNeuron
izhikevichNeuron(area_t area = 0);


/* Fired neuron ids for each burst of a run */
typedef std::vector< std::vector<nidx_t> > firing_t;

/* Build a random network of \a ncount LIF neurons with \a scount outgoing
 * synapses each, then run it for \a bursts bursts with random stimulus. The
 * same seed gives the same network and stimulus on every backend. */
firing_t
runRandomNetwork(backend_t backend,
		unsigned ncount,
		unsigned scount,
		unsigned bursts,
		unsigned seed,
		unsigned cpuThreads = 1);

void
compareFiring(const firing_t& f1, const firing_t& f2);

#endif
