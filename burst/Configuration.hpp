#ifndef BURST_CONFIGURATION_HPP
#define BURST_CONFIGURATION_HPP

//! \file Configuration.hpp

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

#include <burst/config.h>
#include <burst/types.h>
#include <burst/SpeedupModel.hpp>


namespace burst {
	class Configuration;
}


BURST_DLL_PUBLIC
std::ostream& operator<<(std::ostream& o, burst::Configuration const& conf);


namespace burst {

	class ConfigurationImpl;
	class Npu;

/*! \brief Backend configuration supplied to an NPU at construction
 *
 * Holds the backend selection thresholds and force flags, the speedup model
 * constants, id-routing options and backend-specific tuning. */
class BURST_DLL_PUBLIC Configuration
{
	public:

		Configuration();

		Configuration(const Configuration&);

		Configuration& operator=(const Configuration&);

		/*! Load settings from an ini-style file on top of the defaults
		 *
		 * \throws burst::ConfigurationError
		 */
		explicit Configuration(const std::string& filename);

		~Configuration();

		/*! Switch on logging and send output to stdout */
		void enableLogging(); 

		void disableLogging();
		bool loggingEnabled() const;

		/*! Use the CPU backend regardless of network size */
		void forceCpuBackend();

		/*! Require the WGPU backend. Construction of the first burst fails
		 * with burst::BackendUnavailable if no compatible adapter exists. */
		void forceWgpuBackend();

		/*! Require the CUDA backend, optionally on a specific device. A negative
		 * device lets the backend choose. */
		void forceCudaBackend(int device = -1);

		/*! Remove any force flag and let the selector decide */
		void setAutomaticBackend();

		void setCudaDevice(int device);

		/*! Neuron and synapse counts at which the WGPU backend is preferred */
		void setGpuThresholds(uint64_t neurons, uint64_t synapses);

		/*! Neuron and synapse counts at which the CUDA backend is preferred */
		void setCudaThresholds(uint64_t neurons, uint64_t synapses);

		void setGpuMinFiringRate(double rate);

		void setSpeedupModel(const SpeedupModel&);

		void setIdLookup(id_lookup_t mode);

		/*! Maximum number of ids the given model may ever hold */
		void setModelCeiling(model_t model, uint32_t ceiling);

		void setCpuThreadCount(unsigned threads);
		unsigned cpuThreadCount() const;

	private:

		friend class burst::Npu;
		friend std::ostream& ::operator<<(std::ostream& o, Configuration const&);

		ConfigurationImpl* m_impl;
};

} // end namespace burst

#endif
