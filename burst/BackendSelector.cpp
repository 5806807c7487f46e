/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include "BackendSelector.hpp"

#include <algorithm>
#include <string>
#include <boost/format.hpp>

#include "ConfigurationImpl.hpp"
#include "exception.hpp"

namespace burst {


double
estimateSpeedup(backend_t backend,
		uint64_t neuronCount,
		uint64_t synapseCount,
		double firingRate,
		const SpeedupModel& m)
{
	if(backend == BURST_BACKEND_CPU) {
		return 1.0;
	}

	const double n = double(neuronCount);
	const double ops = double(synapseCount) * firingRate * m.opsPerSynapse + n * m.opsPerNeuron;

	/* Per burst: potentials and thresholds in, fired bitmask and fired ids out */
	const double transferBytes = n * 8.0 + n * 0.125 + n * firingRate * 4.0;

	double tflops, bandwidth, overheadUs;
	if(backend == BURST_BACKEND_CUDA) {
		tflops = m.cudaTflops;
		bandwidth = m.cudaBandwidthGBs;
		overheadUs = m.cudaOverheadUs;
	} else {
		tflops = m.wgpuTflops;
		bandwidth = m.wgpuBandwidthGBs;
		overheadUs = m.wgpuOverheadUs;
	}

	const double cpuTime = ops / (m.cpuGflops * 1e9);
	const double gpuTime = ops / (tflops * 1e12)
		+ transferBytes / (bandwidth * 1e9)
		+ overheadUs * 1e-6;

	double speedup = gpuTime > 0.0 ? cpuTime / gpuTime : m.maxSpeedup;
	return std::max(m.minSpeedup, std::min(m.maxSpeedup, speedup));
}



BackendDecision
decision(backend_t backend, bool forced, double speedup, const std::string& reason)
{
	BackendDecision d;
	d.backend = backend;
	d.forced = forced;
	d.estimatedSpeedup = speedup;
	d.reason = reason;
	return d;
}



BackendDecision
selectBackend(uint64_t neurons,
		uint64_t synapses,
		double firingRate,
		const HardwareAvailability& hw,
		const ConfigurationImpl& conf)
{
	using boost::format;

	const SpeedupModel& model = conf.speedupModel();
	const double rate = std::max(firingRate, conf.gpuMinFiringRate());

	boost::optional<backend_t> forced = conf.forcedBackend();
	if(forced) {
		switch(*forced) {
			case BURST_BACKEND_CUDA :
				if(!hw.cuda) {
					throw BackendUnavailable("CUDA backend forced but no CUDA device is available");
				}
				break;
			case BURST_BACKEND_WGPU :
				if(!hw.wgpu) {
					throw BackendUnavailable("WGPU backend forced but no compatible GPU adapter is available");
				}
				break;
			default :
				break;
		}
		return decision(*forced, true,
				estimateSpeedup(*forced, neurons, synapses, rate, model),
				str(format("%s backend forced by configuration") % backendName(*forced)));
	}

	/* Each GPU is tried in turn once its size threshold is reached, and taken
	 * only if the estimate promises enough gain */
	std::string rejected;

	if(hw.cuda && (neurons >= conf.cudaNeuronThreshold() || synapses >= conf.cudaSynapseThreshold())) {
		double speedup = estimateSpeedup(BURST_BACKEND_CUDA, neurons, synapses, rate, model);
		if(speedup > model.requiredSpeedup) {
			return decision(BURST_BACKEND_CUDA, false, speedup,
					str(format("%u neurons / %u synapses reach the CUDA threshold (%u / %u), estimated speedup %.2f")
						% neurons % synapses % conf.cudaNeuronThreshold() % conf.cudaSynapseThreshold() % speedup));
		}
		rejected += str(format("; CUDA estimated speedup %.2f does not exceed %.2f")
				% speedup % model.requiredSpeedup);
	}

	if(hw.wgpu && (neurons >= conf.gpuNeuronThreshold() || synapses >= conf.gpuSynapseThreshold())) {
		double speedup = estimateSpeedup(BURST_BACKEND_WGPU, neurons, synapses, rate, model);
		if(speedup > model.requiredSpeedup) {
			return decision(BURST_BACKEND_WGPU, false, speedup,
					str(format("%u neurons / %u synapses reach the WGPU threshold (%u / %u), estimated speedup %.2f")
						% neurons % synapses % conf.gpuNeuronThreshold() % conf.gpuSynapseThreshold() % speedup));
		}
		rejected += str(format("; WGPU estimated speedup %.2f does not exceed %.2f")
				% speedup % model.requiredSpeedup);
	}

	return decision(BURST_BACKEND_CPU, false, 1.0,
			str(format("%u neurons / %u synapses below GPU thresholds or no GPU available%s")
				% neurons % synapses % rejected));
}

} // end namespace burst
