/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

/* Entry points of the WGPU plugin, looked up by name from the base library.
 * Exceptions do not cross this boundary; failures are reported through
 * burst_wgpu_last_error. */

#include <string>

#include <burst/config.h>
#include <burst/backends.hpp>
#include <burst/exception.hpp>

#include "Backend.hpp"
#include "Context.hpp"

namespace {

std::string g_lastError;
int g_lastErrorUnavailable = 0;

std::string g_adapterName;

void
setError(const burst::exception& e)
{
	g_lastError = e.what();
	g_lastErrorUnavailable = e.errorNumber() == BURST_BACKEND_UNAVAILABLE;
}


/* wgpu-native exposes one adapter per instance through this interface, so
 * the backend is either usable (one device) or not (none) */
unsigned
probeAdapter()
{
	burst::wgpu::Context ctx;
	g_adapterName = ctx.adapterName();
	return 1;
}

}


extern "C" {

BURST_WGPU_DLL_PUBLIC
unsigned
burst_wgpu_device_count()
{
	try {
		return probeAdapter();
	} catch(burst::exception& e) {
		setError(e);
		return 0;
	}
}



BURST_WGPU_DLL_PUBLIC
const char*
burst_wgpu_device_description(unsigned device)
{
	try {
		if(device != 0 || probeAdapter() == 0) {
			throw burst::BackendUnavailable("Invalid WGPU device");
		}
		return g_adapterName.c_str();
	} catch(burst::exception& e) {
		setError(e);
		return NULL;
	}
}



BURST_WGPU_DLL_PUBLIC
burst::ComputeBackend*
burst_wgpu_backend(const burst::IdManager* ids, const burst::ConfigurationImpl* conf)
{
	try {
		return new burst::wgpu::Backend(*ids, *conf);
	} catch(burst::exception& e) {
		setError(e);
		return NULL;
	}
}



BURST_WGPU_DLL_PUBLIC
const char*
burst_wgpu_last_error()
{
	return g_lastError.c_str();
}



BURST_WGPU_DLL_PUBLIC
int
burst_wgpu_last_error_unavailable()
{
	return g_lastErrorUnavailable;
}

}
