/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <cuda_runtime.h>

#include "device_memory.hpp"
#include "except.hpp"

namespace burst {
	namespace cuda {


void
safeCall(cudaError_t err)
{
	if(cudaSuccess != err) {
		throw burst::ComputationError(cudaGetErrorString(err));
	}
}



void
d_malloc(void** d_ptr, size_t sz, const char* name)
{
	cudaError_t err = cudaMalloc(d_ptr, sz);
	if(cudaSuccess != err) {
		throw DeviceAllocationException(name, sz, err);
	}
}



void
d_free(void* arr)
{
	/* Called from shared_array destructors, so must not throw. A failure
	 * here means the context is already gone. */
	cudaFree(arr);
}



void
memcpyBytesToDevice(void* dst, const void* src, size_t count)
{
	safeCall(cudaMemcpy(dst, src, count, cudaMemcpyHostToDevice));
}



void
memcpyBytesFromDevice(void* dst, const void* src, size_t count)
{
	safeCall(cudaMemcpy(dst, src, count, cudaMemcpyDeviceToHost));
}



void
d_memset(void* d_ptr, int value, size_t count)
{
	safeCall(cudaMemset(d_ptr, value, count));
}

} 	} // end namespaces
