/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include "ConfigurationImpl.hpp"

#include <cmath>
#include <limits>
#include <boost/format.hpp>
#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

#include "exception.hpp"

namespace burst {


ConfigurationImpl::ConfigurationImpl() :
	m_logging(false),
	m_forceCpu(false),
	m_forceWgpu(false),
	m_forceCuda(false),
	m_gpuNeuronThreshold(500000),
	m_gpuSynapseThreshold(50000000),
	m_cudaNeuronThreshold(100000),
	m_cudaSynapseThreshold(10000000),
	m_gpuMinFiringRate(0.005),
	m_idLookup(BURST_ID_LOOKUP_SCAN),
	m_cpuThreadCount(1),
	m_cudaDevice(-1)
{
	for(unsigned m = 0; m < BURST_MODEL_COUNT; ++m) {
		m_modelCeiling[m] = 0;
	}
}



boost::optional<backend_t>
ConfigurationImpl::forcedBackend() const
{
	if(m_forceCuda) {
		return boost::optional<backend_t>(BURST_BACKEND_CUDA);
	} else if(m_forceWgpu) {
		return boost::optional<backend_t>(BURST_BACKEND_WGPU);
	} else if(m_forceCpu) {
		return boost::optional<backend_t>(BURST_BACKEND_CPU);
	}
	return boost::optional<backend_t>();
}



void
ConfigurationImpl::setGpuThresholds(uint64_t neurons, uint64_t synapses)
{
	m_gpuNeuronThreshold = neurons;
	m_gpuSynapseThreshold = synapses;
}



void
ConfigurationImpl::setCudaThresholds(uint64_t neurons, uint64_t synapses)
{
	m_cudaNeuronThreshold = neurons;
	m_cudaSynapseThreshold = synapses;
}



void
ConfigurationImpl::setModelCeiling(model_t model, uint32_t ceiling)
{
	using boost::format;
	if(model >= BURST_MODEL_COUNT) {
		throw ConfigurationError(str(format("Invalid neuron model %u") % model));
	}
	m_modelCeiling[model] = ceiling;
}



uint32_t
ConfigurationImpl::modelCeiling(model_t model) const
{
	return model < BURST_MODEL_COUNT ? m_modelCeiling[model] : 0;
}



namespace {

void
checkRate(double value, const char* name)
{
	using boost::format;
	if(!(value > 0.0) || std::isinf(value)) {
		throw ConfigurationError(str(format("%s must be a positive finite number (got %f)")
					% name % value));
	}
}

}


void
ConfigurationImpl::verify() const
{
	using boost::format;

	unsigned forced = unsigned(m_forceCpu) + unsigned(m_forceWgpu) + unsigned(m_forceCuda);
	if(forced > 1) {
		throw ConfigurationError("At most one backend can be forced");
	}

	if(m_cudaNeuronThreshold > m_gpuNeuronThreshold) {
		throw ConfigurationError(
				str(format("CUDA neuron threshold (%u) must not exceed the WGPU neuron threshold (%u)")
					% m_cudaNeuronThreshold % m_gpuNeuronThreshold));
	}

	if(!(m_gpuMinFiringRate >= 0.0 && m_gpuMinFiringRate <= 1.0)) {
		throw ConfigurationError(
				str(format("GPU minimum firing rate must be in [0,1] (got %f)") % m_gpuMinFiringRate));
	}

	checkRate(m_speedup.cpuGflops, "CPU GFLOPS");
	checkRate(m_speedup.wgpuTflops, "WGPU TFLOPS");
	checkRate(m_speedup.wgpuBandwidthGBs, "WGPU bandwidth");
	checkRate(m_speedup.cudaTflops, "CUDA TFLOPS");
	checkRate(m_speedup.cudaBandwidthGBs, "CUDA bandwidth");
	checkRate(m_speedup.opsPerSynapse, "operations per synapse");
	checkRate(m_speedup.opsPerNeuron, "operations per neuron");
	checkRate(m_speedup.minSpeedup, "minimum speedup");
	if(!(m_speedup.requiredSpeedup >= 0.0) || std::isinf(m_speedup.requiredSpeedup)) {
		throw ConfigurationError("Required GPU speedup must be finite and not negative");
	}
	if(!(m_speedup.wgpuOverheadUs >= 0.0) || !(m_speedup.cudaOverheadUs >= 0.0)) {
		throw ConfigurationError("Per-burst GPU overhead must be non-negative");
	}
	if(!(m_speedup.maxSpeedup >= m_speedup.minSpeedup) || std::isinf(m_speedup.maxSpeedup)) {
		throw ConfigurationError("Maximum speedup must be finite and not below the minimum speedup");
	}

	if(m_cpuThreadCount == 0) {
		throw ConfigurationError("CPU thread count must be at least one");
	}

	uint64_t total = 0;
	for(unsigned m = 0; m < BURST_MODEL_COUNT; ++m) {
		total += m_modelCeiling[m];
	}
	if(total > uint64_t(std::numeric_limits<uint32_t>::max())) {
		throw ConfigurationError(
				str(format("Model range ceilings (total %u) exceed the 32-bit neuron id space") % total));
	}
}



namespace {

backend_t
parseBackend(const std::string& name)
{
	if(name == "cpu") {
		return BURST_BACKEND_CPU;
	} else if(name == "wgpu") {
		return BURST_BACKEND_WGPU;
	} else if(name == "cuda") {
		return BURST_BACKEND_CUDA;
	}
	throw ConfigurationError(str(boost::format("Unknown backend '%s'") % name));
}

}


void
ConfigurationImpl::loadFile(const std::string& name)
{
	using boost::format;
	namespace po = boost::program_options;
	namespace fs = boost::filesystem;

	po::options_description desc("Allowed options");
	desc.add_options()
		("logging.enabled", po::value<bool>(), "write progress to stdout")
		("backend.force", po::value<std::string>(), "cpu, wgpu, cuda or none")
		("backend.gpu_neuron_threshold", po::value<uint64_t>(), "neuron count above which WGPU is preferred")
		("backend.gpu_synapse_threshold", po::value<uint64_t>(), "synapse count above which WGPU is preferred")
		("backend.cuda_neuron_threshold", po::value<uint64_t>(), "neuron count above which CUDA is preferred")
		("backend.cuda_synapse_threshold", po::value<uint64_t>(), "synapse count above which CUDA is preferred")
		("backend.gpu_min_firing_rate", po::value<double>(), "lowest firing rate assumed by the speedup estimate")
		("speedup.cpu_gflops", po::value<double>(), "")
		("speedup.wgpu_tflops", po::value<double>(), "")
		("speedup.wgpu_bandwidth_gbs", po::value<double>(), "")
		("speedup.wgpu_overhead_us", po::value<double>(), "")
		("speedup.cuda_tflops", po::value<double>(), "")
		("speedup.cuda_bandwidth_gbs", po::value<double>(), "")
		("speedup.cuda_overhead_us", po::value<double>(), "")
		("speedup.ops_per_synapse", po::value<double>(), "")
		("speedup.ops_per_neuron", po::value<double>(), "")
		("speedup.required", po::value<double>(), "estimated speedup a GPU must exceed to be chosen automatically")
		("ids.lookup", po::value<std::string>(), "scan or table")
		("ids.lif_ceiling", po::value<uint32_t>(), "maximum LIF neuron ids")
		("ids.izhikevich_ceiling", po::value<uint32_t>(), "maximum Izhikevich neuron ids")
		("cpu.threads", po::value<unsigned>(), "number of CPU worker threads")
		("cuda.device", po::value<int>(), "CUDA device ordinal, -1 for automatic")
	;

	fs::path filename(name);
	if(!fs::exists(filename)) {
		throw ConfigurationError(str(format("Configuration file %s does not exist") % filename));
	}

	fs::ifstream file(filename);

	try {
		po::variables_map vm;
		po::store(po::parse_config_file(file, desc), vm);
		po::notify(vm);

		if(vm.count("logging.enabled")) {
			m_logging = vm["logging.enabled"].as<bool>();
		}
		if(vm.count("backend.force")) {
			const std::string force = vm["backend.force"].as<std::string>();
			m_forceCpu = m_forceWgpu = m_forceCuda = false;
			if(force != "none") {
				switch(parseBackend(force)) {
					case BURST_BACKEND_CPU: m_forceCpu = true; break;
					case BURST_BACKEND_WGPU: m_forceWgpu = true; break;
					case BURST_BACKEND_CUDA: m_forceCuda = true; break;
					default: break;
				}
			}
		}
		if(vm.count("backend.gpu_neuron_threshold")) {
			m_gpuNeuronThreshold = vm["backend.gpu_neuron_threshold"].as<uint64_t>();
		}
		if(vm.count("backend.gpu_synapse_threshold")) {
			m_gpuSynapseThreshold = vm["backend.gpu_synapse_threshold"].as<uint64_t>();
		}
		if(vm.count("backend.cuda_neuron_threshold")) {
			m_cudaNeuronThreshold = vm["backend.cuda_neuron_threshold"].as<uint64_t>();
		}
		if(vm.count("backend.cuda_synapse_threshold")) {
			m_cudaSynapseThreshold = vm["backend.cuda_synapse_threshold"].as<uint64_t>();
		}
		if(vm.count("backend.gpu_min_firing_rate")) {
			m_gpuMinFiringRate = vm["backend.gpu_min_firing_rate"].as<double>();
		}

		/* Speedup constants */
		if(vm.count("speedup.cpu_gflops")) m_speedup.cpuGflops = vm["speedup.cpu_gflops"].as<double>();
		if(vm.count("speedup.wgpu_tflops")) m_speedup.wgpuTflops = vm["speedup.wgpu_tflops"].as<double>();
		if(vm.count("speedup.wgpu_bandwidth_gbs")) m_speedup.wgpuBandwidthGBs = vm["speedup.wgpu_bandwidth_gbs"].as<double>();
		if(vm.count("speedup.wgpu_overhead_us")) m_speedup.wgpuOverheadUs = vm["speedup.wgpu_overhead_us"].as<double>();
		if(vm.count("speedup.cuda_tflops")) m_speedup.cudaTflops = vm["speedup.cuda_tflops"].as<double>();
		if(vm.count("speedup.cuda_bandwidth_gbs")) m_speedup.cudaBandwidthGBs = vm["speedup.cuda_bandwidth_gbs"].as<double>();
		if(vm.count("speedup.cuda_overhead_us")) m_speedup.cudaOverheadUs = vm["speedup.cuda_overhead_us"].as<double>();
		if(vm.count("speedup.ops_per_synapse")) m_speedup.opsPerSynapse = vm["speedup.ops_per_synapse"].as<double>();
		if(vm.count("speedup.ops_per_neuron")) m_speedup.opsPerNeuron = vm["speedup.ops_per_neuron"].as<double>();
		if(vm.count("speedup.required")) m_speedup.requiredSpeedup = vm["speedup.required"].as<double>();

		if(vm.count("ids.lookup")) {
			const std::string lookup = vm["ids.lookup"].as<std::string>();
			if(lookup == "scan") {
				m_idLookup = BURST_ID_LOOKUP_SCAN;
			} else if(lookup == "table") {
				m_idLookup = BURST_ID_LOOKUP_TABLE;
			} else {
				throw ConfigurationError(str(format("Unknown id lookup mode '%s' in %s")
							% lookup % filename));
			}
		}
		if(vm.count("ids.lif_ceiling")) {
			m_modelCeiling[BURST_MODEL_LIF] = vm["ids.lif_ceiling"].as<uint32_t>();
		}
		if(vm.count("ids.izhikevich_ceiling")) {
			m_modelCeiling[BURST_MODEL_IZHIKEVICH] = vm["ids.izhikevich_ceiling"].as<uint32_t>();
		}
		if(vm.count("cpu.threads")) {
			m_cpuThreadCount = vm["cpu.threads"].as<unsigned>();
		}
		if(vm.count("cuda.device")) {
			m_cudaDevice = vm["cuda.device"].as<int>();
		}
	} catch (po::error& e) {
		throw ConfigurationError(
				str(format("Error parsing configuration file %s: %s") % filename % e.what()));
	}
}



const char*
backendName(backend_t backend)
{
	switch(backend) {
		case BURST_BACKEND_CPU: return "CPU";
		case BURST_BACKEND_WGPU: return "WGPU";
		case BURST_BACKEND_CUDA: return "CUDA";
		default: return "unknown";
	}
}

}


std::ostream&
operator<<(std::ostream& o, burst::ConfigurationImpl const& conf)
{
	boost::optional<backend_t> forced = conf.forcedBackend();
	o << "backend: " << (forced ? burst::backendName(*forced) : "auto")
		<< ", CUDA thresholds: " << conf.cudaNeuronThreshold() << "n/" << conf.cudaSynapseThreshold() << "s"
		<< ", WGPU thresholds: " << conf.gpuNeuronThreshold() << "n/" << conf.gpuSynapseThreshold() << "s"
		<< ", id lookup: " << (conf.idLookup() == BURST_ID_LOOKUP_TABLE ? "table" : "scan")
		<< ", CPU threads: " << conf.cpuThreadCount();
	return o;
}
