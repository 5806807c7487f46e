/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include "backends.hpp"

#include <boost/format.hpp>

#include "ConfigurationImpl.hpp"
#include "Plugin.hpp"
#include "exception.hpp"
#include "cpu/Backend.hpp"

namespace burst {


const char*
pluginName(backend_t backend)
{
	switch(backend) {
		case BURST_BACKEND_CUDA : return "burst_cuda";
		case BURST_BACKEND_WGPU : return "burst_wgpu";
		default : return NULL;
	}
}



namespace {

/* Prefix of the entry points exported by a plugin */
const char*
symbolPrefix(backend_t backend)
{
	switch(backend) {
		case BURST_BACKEND_CUDA : return "burst_cuda_";
		case BURST_BACKEND_WGPU : return "burst_wgpu_";
		default :
			throw exception(BURST_LOGIC_ERROR,
					str(boost::format("backend %s has no plugin") % backendName(backend)));
	}
}



bool
compiledIn(backend_t backend)
{
	switch(backend) {
		case BURST_BACKEND_CPU : return true;
#ifdef BURST_CUDA_ENABLED
		case BURST_BACKEND_CUDA : return true;
#endif
#ifdef BURST_WGPU_ENABLED
		case BURST_BACKEND_WGPU : return true;
#endif
		default : return false;
	}
}



void*
entryPoint(const Plugin& plugin, backend_t backend, const char* name)
{
	return plugin.function(std::string(symbolPrefix(backend)) + name);
}



boost::shared_ptr<Plugin>
loadPlugin(backend_t backend)
{
	using boost::format;
	if(!compiledIn(backend)) {
		throw BackendUnavailable(str(format("burst compiled without %s support")
					% backendName(backend)));
	}
	return boost::shared_ptr<Plugin>(new Plugin(pluginName(backend)));
}

}



unsigned
deviceCount(backend_t backend)
{
	if(backend == BURST_BACKEND_CPU) {
		return 1;
	}
	try {
		boost::shared_ptr<Plugin> plugin = loadPlugin(backend);
		backend_device_count_t* fn =
			(backend_device_count_t*) entryPoint(*plugin, backend, "device_count");
		return fn();
	} catch(BackendUnavailable&) {
		return 0;
	}
}



HardwareAvailability
probeHardware()
{
	return HardwareAvailability(
			deviceCount(BURST_BACKEND_CUDA) > 0,
			deviceCount(BURST_BACKEND_WGPU) > 0);
}



ComputeBackend*
createBackend(backend_t backend,
		const IdManager& ids,
		const ConfigurationImpl& conf,
		boost::shared_ptr<Plugin>& plugin)
{
	using boost::format;

	switch(backend) {
		case BURST_BACKEND_CPU :
			plugin.reset();
			return new cpu::Backend(ids, conf);
		case BURST_BACKEND_CUDA :
		case BURST_BACKEND_WGPU : {
			boost::shared_ptr<Plugin> lib = loadPlugin(backend);
			backend_create_t* ctor = (backend_create_t*) entryPoint(*lib, backend, "backend");
			ComputeBackend* ret = ctor(&ids, &conf);
			if(ret == NULL) {
				backend_last_error_t* err =
					(backend_last_error_t*) entryPoint(*lib, backend, "last_error");
				backend_last_error_unavailable_t* unavailable =
					(backend_last_error_unavailable_t*) entryPoint(*lib, backend, "last_error_unavailable");
				std::string msg = str(format("%s backend: %s") % backendName(backend) % err());
				if(unavailable()) {
					throw BackendUnavailable(msg);
				}
				throw ComputationError(msg);
			}
			plugin = lib;
			return ret;
		}
		default :
			throw exception(BURST_LOGIC_ERROR, "unknown backend");
	}
}

}
