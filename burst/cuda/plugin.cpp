/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

/* Entry points of the CUDA plugin, looked up by name from the base library.
 * Exceptions do not cross this boundary; failures are reported through
 * burst_cuda_last_error. */

#include <string>

#include <burst/config.h>
#include <burst/backends.hpp>
#include <burst/exception.hpp>

#include "Backend.hpp"
#include "devices.hpp"

namespace {

std::string g_lastError;
int g_lastErrorUnavailable = 0;

void
setError(const burst::exception& e)
{
	g_lastError = e.what();
	g_lastErrorUnavailable = e.errorNumber() == BURST_BACKEND_UNAVAILABLE;
}

}


extern "C" {

BURST_CUDA_DLL_PUBLIC
unsigned
burst_cuda_device_count()
{
	try {
		return burst::cuda::deviceCount();
	} catch(burst::exception& e) {
		setError(e);
		return 0;
	}
}



BURST_CUDA_DLL_PUBLIC
const char*
burst_cuda_device_description(unsigned device)
{
	try {
		return burst::cuda::deviceDescription(device);
	} catch(burst::exception& e) {
		setError(e);
		return NULL;
	}
}



BURST_CUDA_DLL_PUBLIC
burst::ComputeBackend*
burst_cuda_backend(const burst::IdManager* ids, const burst::ConfigurationImpl* conf)
{
	try {
		return new burst::cuda::Backend(*ids, *conf);
	} catch(burst::exception& e) {
		setError(e);
		return NULL;
	}
}



BURST_CUDA_DLL_PUBLIC
const char*
burst_cuda_last_error()
{
	return g_lastError.c_str();
}



BURST_CUDA_DLL_PUBLIC
int
burst_cuda_last_error_unavailable()
{
	return g_lastErrorUnavailable;
}

}
