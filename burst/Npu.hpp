#ifndef BURST_NPU_HPP
#define BURST_NPU_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

//! \file Npu.hpp

#include <cstddef>
#include <utility>
#include <vector>

#include <boost/optional.hpp>
#include <boost/scoped_ptr.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/utility.hpp>

#include <burst/config.h>
#include "types.h"
#include "BackendSelector.hpp"
#include "CompressedSet.hpp"
#include "ConfigurationImpl.hpp"
#include "FireLedger.hpp"
#include "FireQueue.hpp"
#include "IdManager.hpp"
#include "Neuron.hpp"
#include "Neurons.hpp"
#include "Synapse.hpp"
#include "Synapses.hpp"
#include "Timer.hpp"

namespace burst {

class ComputeBackend;
class Configuration;
class FireCandidateList;
class Plugin;


/*! Durations of the phases of the last completed burst, in microseconds.
 * All zero unless compiled with timing support. */
struct BurstTimings
{
	BurstTimings() : select(0), inject(0), propagate(0), dynamics(0), archive(0) {}
	unsigned long select;
	unsigned long inject;
	unsigned long propagate;
	unsigned long dynamics;
	unsigned long archive;
};



/*! \class Npu
 *
 * \brief Burst engine for one population of spiking neurons
 *
 * The NPU owns the neuron and synapse storage, the id space, the fire
 * structures and a compute backend. Each call to \a processBurst runs
 *
 * 	Idle -> Injecting -> Propagating -> Dynamics -> Archiving -> Idle
 *
 * to completion, or fails leaving the NPU as it was before the call: staged
 * stimulus, the previous fire queue and the ledger are untouched and the
 * burst can be re-run. Neuron state may have advanced when a backend fails
 * part way through dynamics, see \a ComputeBackend.
 *
 * An NPU instance is not thread-safe. Distinct instances share no state.
 */
class BURST_DLL_PUBLIC Npu : private boost::noncopyable
{
	public :

		enum State {
			IDLE,
			INJECTING,
			PROPAGATING,
			DYNAMICS,
			ARCHIVING
		};

		/*!
		 * \param neuronCapacity maximum number of live neurons
		 * \param synapseCapacity maximum number of live synapses
		 * \param fireLedgerWindow bursts of history kept per cortical area
		 *
		 * \throws burst::ConfigurationError for zero capacities or window,
		 * 		or an invalid configuration
		 */
		Npu(uint32_t neuronCapacity,
				uint32_t synapseCapacity,
				size_t fireLedgerWindow,
				const Configuration& conf);

		~Npu();

		/*! \name Construction */
		//@{

		/*! \throws burst::CapacityExceeded if the LIF range or the NPU is full */
		nidx_t addNeuron(const LifNeuron& neuron);

		/*! \throws burst::CapacityExceeded if the Izhikevich range or the NPU is full */
		nidx_t addNeuron(const IzhikevichNeuron& neuron);

		/*! \throws burst::InvalidReference if either end is not a live neuron
		 *  \throws burst::CapacityExceeded if the synapse storage is full */
		sidx_t addSynapse(nidx_t source, nidx_t target,
				uint8_t weight, uint8_t psp, synapse_kind_t kind);

		/*! Deallocate the neuron and every synapse touching it. Its staged
		 * stimulus and its entry in the last fire queue are dropped.
		 *
		 * \throws burst::InvalidReference if the neuron is not live */
		void removeNeuron(nidx_t neuron);

		/*! Remove every neuron of the area
		 *
		 * \return number of neurons removed */
		size_t removeCorticalArea(area_t area);

		void removeSynapse(sidx_t synapse);

		void updateSynapseWeight(sidx_t synapse, uint8_t weight);

		//@}

		/*! \name Simulation */
		//@{

		/*! Add input to a neuron for the next burst. Repeated injections
		 * into the same neuron add up.
		 *
		 * \throws burst::InvalidReference if the neuron is not live */
		void injectStimulus(nidx_t neuron, float potential);

		/*! Inject into several neurons. Nothing is staged if any id is invalid.
		 *
		 * \throws burst::InvalidReference
		 * \throws burst::exception (BURST_INVALID_INPUT) for vectors of different length */
		void injectStimulusBatch(const std::vector<nidx_t>& neurons,
				const std::vector<float>& potentials);

		/*! Run one burst
		 *
		 * \return the neurons which fired in this burst, valid until the
		 * 		next successful call
		 *
		 * \throws burst::exception (BURST_INVALID_INPUT) if \a burst is not
		 * 		later than the last processed burst
		 * \throws burst::BackendUnavailable if a forced backend cannot be used
		 * \throws burst::ComputationError if the backend fails
		 */
		const FireQueue& processBurst(burst_t burst);

		/*! Discard the backend so that the next burst selects one anew */
		void reselectBackend();

		//@}

		/*! \name Firing history */
		//@{

		/*! \throws burst::InvalidReference if the area is not tracked */
		const FireLedger::frames_t& getFireLedgerHistory(area_t area) const;

		/*! \see FireLedger::denseWindow */
		std::vector<CompressedSet> getDenseWindow(area_t area, burst_t end, size_t depth) const;

		/*! Track an area with a window other than the NPU default */
		void trackArea(area_t area, size_t window);

		void untrackArea(area_t area);

		const FireLedger& fireLedger() const { return m_ledger; }

		//@}

		/*! \name Queries */
		//@{

		const std::vector<sidx_t>& outgoingSynapses(nidx_t neuron) const;
		const std::vector<sidx_t>& incomingSynapses(nidx_t neuron) const;
		Synapse synapse(sidx_t synapse) const;

		float membranePotential(nidx_t neuron) const;

		/*! \return remaining refractory bursts, 0 for models without refractoriness */
		unsigned refractoryCountdown(nidx_t neuron) const;

		model_t modelType(nidx_t neuron) const;
		area_t corticalArea(nidx_t neuron) const;

		uint64_t neuronCount() const { return m_ids.liveCount(); }
		size_t synapseCount() const { return m_synapses.size(); }

		/*! \return last successfully processed burst, 0 before the first */
		burst_t burstCount() const;

		const FireQueue& lastFireQueue() const { return m_fired; }

		/*! \return input delivered in the last successful burst */
		const FireCandidateList& lastFireCandidateList() const;

		const IdManager& ids() const { return m_ids; }
		const NeuronStorage& neurons() const { return m_neurons; }
		const SynapseStorage& synapses() const { return m_synapses; }

		/*! \return the decision behind the current backend, if one is selected */
		boost::optional<BackendDecision> backendDecision() const { return m_decision; }

		/*! \return type of the current backend, if one is selected */
		boost::optional<backend_t> backendType() const;

		State state() const { return m_state; }

		const Timer& timer() const { return m_timer; }

		const BurstTimings& lastBurstTimings() const { return m_timings; }

		//@}

	private :

		ConfigurationImpl m_conf;

		uint32_t m_neuronCapacity;

		IdManager m_ids;
		NeuronStorage m_neurons;
		SynapseStorage m_synapses;

		FireLedger m_ledger;

		/* Stimulus for the next burst, in order of injection */
		std::vector< std::pair<nidx_t, float> > m_stimulus;

		/* Input of the last completed burst and scratch space for the next */
		boost::scoped_ptr<FireCandidateList> m_fcl;
		boost::scoped_ptr<FireCandidateList> m_workFcl;

		FireQueue m_fired;

		/* The plugin holds the backend's code, so the backend is declared
		 * after it and destroyed first */
		boost::shared_ptr<Plugin> m_plugin;
		boost::scoped_ptr<ComputeBackend> m_backend;
		boost::optional<BackendDecision> m_decision;
		boost::optional<HardwareAvailability> m_hardware;

		State m_state;

		Timer m_timer;
		BurstTimings m_timings;

		nidx_t allocate(model_t model);

		void checkLive(nidx_t neuron) const;

		void ensureBackend();
};

} // end namespace burst

#endif
