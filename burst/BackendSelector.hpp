#ifndef BURST_BACKEND_SELECTOR_HPP
#define BURST_BACKEND_SELECTOR_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <string>

#include <burst/config.h>
#include "types.h"
#include "SpeedupModel.hpp"

namespace burst {

class ConfigurationImpl;

/*! Which accelerators can be used on this host */
struct HardwareAvailability
{
	HardwareAvailability() : cuda(false), wgpu(false) {}
	HardwareAvailability(bool cuda, bool wgpu) : cuda(cuda), wgpu(wgpu) {}

	bool cuda;
	bool wgpu;
};



struct BackendDecision
{
	backend_t backend;
	bool forced;
	double estimatedSpeedup; // over the CPU, 1.0 for the CPU itself
	std::string reason;
};



/*! \brief Choose a backend for a network of the given size
 *
 * A pure function of its arguments. A force flag wins outright. Otherwise
 * CUDA is preferred once the neuron or synapse count reaches the CUDA
 * threshold and a device is present, then WGPU at its (higher) thresholds,
 * and the CPU in every other case. A GPU whose estimated speedup does not
 * exceed SpeedupModel::requiredSpeedup is passed over.
 *
 * \throws burst::BackendUnavailable if a forced backend is not available
 */
BURST_DLL_PUBLIC
BackendDecision
selectBackend(uint64_t neuronCount,
		uint64_t synapseCount,
		double firingRate,
		const HardwareAvailability& hw,
		const ConfigurationImpl& conf);


/*! \return estimated speedup of \a backend over the CPU for one burst,
 * clamped to the model's [minSpeedup, maxSpeedup] */
BURST_DLL_PUBLIC
double
estimateSpeedup(backend_t backend,
		uint64_t neuronCount,
		uint64_t synapseCount,
		double firingRate,
		const SpeedupModel& model);

} // end namespace burst

#endif
