#ifndef BURST_CONFIGURATION_IMPL_HPP
#define BURST_CONFIGURATION_IMPL_HPP

//! \file ConfigurationImpl.hpp

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <ostream>
#include <string>
#include <boost/optional.hpp>

#include <burst/config.h>
#include "types.h"
#include "SpeedupModel.hpp"

namespace burst {

/*! \brief Backend configuration of a single NPU instance
 *
 * Passed explicitly at construction, so several NPUs with different
 * thresholds can coexist in one process. Nothing here is validated until
 * \a verify is called. */
class BURST_DLL_PUBLIC ConfigurationImpl
{
	public:

		ConfigurationImpl();

		/*! Switch on logging and send output to stdout */
		void enableLogging() { m_logging = true; }

		void disableLogging() { m_logging = false; }
		bool loggingEnabled() const { return m_logging; }

		void setCpuThreadCount(unsigned threads) { m_cpuThreadCount = threads; }
		unsigned cpuThreadCount() const { return m_cpuThreadCount; }

		/*! Use a specific CUDA device. A negative value lets the backend
		 * choose. */
		void setCudaDevice(int device) { m_cudaDevice = device; }
		int cudaDevice() const { return m_cudaDevice; }

		/* Force flags. More than one set is a configuration error */
		void setForceCpu(bool f) { m_forceCpu = f; }
		void setForceWgpu(bool f) { m_forceWgpu = f; }
		void setForceCuda(bool f) { m_forceCuda = f; }
		bool forceCpu() const { return m_forceCpu; }
		bool forceWgpu() const { return m_forceWgpu; }
		bool forceCuda() const { return m_forceCuda; }

		/*! \return the forced backend, if any */
		boost::optional<backend_t> forcedBackend() const;

		void setGpuThresholds(uint64_t neurons, uint64_t synapses);
		uint64_t gpuNeuronThreshold() const { return m_gpuNeuronThreshold; }
		uint64_t gpuSynapseThreshold() const { return m_gpuSynapseThreshold; }

		void setCudaThresholds(uint64_t neurons, uint64_t synapses);
		uint64_t cudaNeuronThreshold() const { return m_cudaNeuronThreshold; }
		uint64_t cudaSynapseThreshold() const { return m_cudaSynapseThreshold; }

		void setGpuMinFiringRate(double rate) { m_gpuMinFiringRate = rate; }
		double gpuMinFiringRate() const { return m_gpuMinFiringRate; }

		void setSpeedupModel(const SpeedupModel& m) { m_speedup = m; }
		const SpeedupModel& speedupModel() const { return m_speedup; }

		void setIdLookup(id_lookup_t mode) { m_idLookup = mode; }
		id_lookup_t idLookup() const { return m_idLookup; }

		/*! Set the maximum number of ids the given model may allocate. A value
		 * of zero means the NPU neuron capacity is used. */
		void setModelCeiling(model_t model, uint32_t ceiling);

		/*! \return configured ceiling for the model or zero if unset */
		uint32_t modelCeiling(model_t model) const;

		/*! Load options from an ini-style file
		 *
		 * \throws burst::ConfigurationError if the file cannot be read, has
		 * 		unknown keys or malformed values
		 */
		void loadFile(const std::string& filename);

		/*! Check internal consistency
		 *
		 * \throws burst::ConfigurationError
		 */
		void verify() const;

	private:

		bool m_logging;

		bool m_forceCpu;
		bool m_forceWgpu;
		bool m_forceCuda;

		uint64_t m_gpuNeuronThreshold;
		uint64_t m_gpuSynapseThreshold;
		uint64_t m_cudaNeuronThreshold;
		uint64_t m_cudaSynapseThreshold;
		double m_gpuMinFiringRate;

		SpeedupModel m_speedup;

		id_lookup_t m_idLookup;
		uint32_t m_modelCeiling[BURST_MODEL_COUNT];

		/* CPU-specific */
		unsigned m_cpuThreadCount;

		/* CUDA-specific */
		int m_cudaDevice;
};


/*! \return human-readable backend name */
BURST_DLL_PUBLIC const char* backendName(backend_t);

}


BURST_DLL_PUBLIC
std::ostream& operator<<(std::ostream& o, burst::ConfigurationImpl const& conf);

#endif
