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

#ifdef BURST_CPU_MULTITHREADED
#include <boost/thread.hpp>
#endif
#include <boost/format.hpp>
#include <boost/unordered_map.hpp>

#include <burst/ConfigurationImpl.hpp>
#include <burst/FireCandidateList.hpp>
#include <burst/FireQueue.hpp>
#include <burst/IdManager.hpp>
#include <burst/Neurons.hpp>
#include <burst/Synapses.hpp>
#include <burst/exception.hpp>
#include <burst/kernel/synapse.h>

#include "Worker.hpp"

#ifdef BURST_CPU_DEBUG_TRACE

#include <cstdio>
#include <cstdlib>

#define LOG(...) fprintf(stdout, __VA_ARGS__);

#else

#define LOG(...)

#endif


namespace burst {
	namespace cpu {


Backend::Backend(const IdManager& ids, const ConfigurationImpl& conf) :
	m_ids(ids),
	m_threadCount(conf.cpuThreadCount()),
	m_neurons(NULL),
	m_burst(0)
{
#ifndef BURST_CPU_MULTITHREADED
	if(m_threadCount > 1) {
		throw ConfigurationError("burst compiled without multithreading support");
	}
#endif
}



std::string
Backend::description() const
{
	return str(boost::format("CPU (%u thread%s)") % m_threadCount % (m_threadCount == 1 ? "" : "s"));
}



void
Backend::processSynapticPropagation(
		const std::vector<nidx_t>& fired,
		const SynapseStorage& synapses,
		FireCandidateList& fcl)
{
	const std::vector<nidx_t>& target = synapses.target();
	const std::vector<uint8_t>& weight = synapses.weight();
	const std::vector<uint8_t>& psp = synapses.psp();
	const std::vector<uint8_t>& kind = synapses.kind();

	/* Exact integer sum per target, in order of first delivery */
	boost::unordered_map<nidx_t, size_t> slot;
	std::vector<nidx_t> touched;
	std::vector<int64_t> sum;

	for(std::vector<nidx_t>::const_iterator source = fired.begin();
			source != fired.end(); ++source) {
		const std::vector<sidx_t>& outgoing = synapses.outgoing(*source);
		for(std::vector<sidx_t>::const_iterator s = outgoing.begin();
				s != outgoing.end(); ++s) {
			int32_t c = synaptic_contribution(weight[*s], psp[*s], kind[*s]);
			LOG("b%lu: n%u -> n%u (%d)\n", (unsigned long) m_burst, *source, target[*s], c);
			std::pair<boost::unordered_map<nidx_t, size_t>::iterator, bool> i =
				slot.insert(std::make_pair(target[*s], touched.size()));
			if(i.second) {
				touched.push_back(target[*s]);
				sum.push_back(c);
			} else {
				sum[i.first->second] += c;
			}
		}
	}

	for(size_t i = 0; i < touched.size(); ++i) {
		fcl.accumulate(touched[i], float(sum[i]));
	}
}



void
Backend::processNeuralDynamics(
		const FireCandidateList& fcl,
		NeuronStorage& neurons,
		burst_t burst,
		FireQueue& fired)
{
	m_neurons = &neurons;
	m_burst = burst;
	fired.reset(burst);

	for(unsigned m = 0; m < BURST_MODEL_COUNT; ++m) {

		const model_t model = model_t(m);
		const size_t count = neurons.size(model);

		std::vector<float>& input = m_input[m];
		std::vector<uint8_t>& hasInput = m_hasInput[m];
		input.resize(count, 0.0f);
		hasInput.resize(count, 0);
		m_fired[m].resize(count, 0);
		m_firedPotential[m].resize(count, 0.0f);

		if(count == 0) {
			continue;
		}

		const FireCandidateList::Bucket& bucket = fcl.bucket(model);
		for(size_t i = 0; i < bucket.size(); ++i) {
			input[bucket.local[i]] = bucket.current[i];
			hasInput[bucket.local[i]] = 1;
		}

		updateModel(model, count);

		/* Restore the all-zero invariant */
		for(size_t i = 0; i < bucket.size(); ++i) {
			input[bucket.local[i]] = 0.0f;
			hasInput[bucket.local[i]] = 0;
		}

		appendFired(m_ids, neurons, model, m_fired[m], m_firedPotential[m], fired);
	}

	m_neurons = NULL;
}



void
Backend::updateModel(model_t model, size_t count)
{
#ifdef BURST_CPU_MULTITHREADED
	if(m_threadCount > 1 && count >= m_threadCount) {
		/* Creating threads per burst rather than keeping a pool was not found
		 * to make a measurable difference */
		size_t jobSize = (count + m_threadCount - 1) / m_threadCount;
		boost::thread_group threads;
		for(unsigned t = 0; t < m_threadCount; ++t) {
			threads.create_thread(Worker(t, jobSize, count, model, this));
		}
		threads.join_all();
		return;
	}
#endif
	updateRange(model, 0, count);
}



void
Backend::updateRange(model_t model, size_t start, size_t end)
{
	const float* input = &m_input[model][0];
	const uint8_t* hasInput = &m_hasInput[model][0];
	uint8_t* fired = &m_fired[model][0];
	float* potential = &m_firedPotential[model][0];

	switch(model) {

		case BURST_MODEL_LIF : {
			LifNeurons& lif = m_neurons->lif();
			lif_params_t p = lif.params();
			lif_state_t s = lif.state();
			for(size_t n = start; n < end; ++n) {
				nidx_t id = m_ids.globalIdx(model, lidx_t(n));
				fired[n] = uint8_t(lif_update(unsigned(n), id, m_burst,
							input[n], hasInput[n], p, s, &potential[n]));
				if(fired[n]) {
					LOG("b%lu: n%u fired\n", (unsigned long) m_burst, id);
				}
			}
			break;
		}

		case BURST_MODEL_IZHIKEVICH : {
			IzhikevichNeurons& izh = m_neurons->izhikevich();
			izhikevich_params_t p = izh.params();
			izhikevich_state_t s = izh.state();
			for(size_t n = start; n < end; ++n) {
				fired[n] = uint8_t(izhikevich_update(unsigned(n), input[n], p, s, &potential[n]));
			}
			break;
		}

		default :
			break;
	}
}

}	} // end namespaces
