#ifndef BURST_CUDA_EXCEPT_HPP
#define BURST_CUDA_EXCEPT_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <cstddef>
#include <sstream>
#include <cuda_runtime.h>
#include <boost/format.hpp>

#include <burst/exception.hpp>

namespace burst {
	namespace cuda {

class DeviceAllocationException : public burst::ComputationError
{
	public :

		DeviceAllocationException(const char* structname,
				size_t bytes,
				cudaError err) :
			burst::ComputationError(
					str(boost::format("Failed to allocate %uB for %s.\nCuda error: %s\n")
						% bytes % structname % cudaGetErrorString(err)))
		{}
};


class KernelInvocationError : public burst::ComputationError
{
	public :

		KernelInvocationError(const char* kernel, cudaError_t status) :
			burst::ComputationError(
					str(boost::format("Cuda error in %s kernel: %s")
						% kernel % cudaGetErrorString(status))) {}
};

	} // end namespace cuda
} // end namespace burst


#define CUDA_SAFE_CALL(call) {                                             \
    cudaError err = call;                                                  \
    if(cudaSuccess != err) {                                               \
        std::ostringstream msg;                                            \
        msg << "Cuda error in file " << __FILE__ << " in line "            \
            << __LINE__ << ": " << cudaGetErrorString(err);                \
        throw burst::ComputationError(msg.str());                          \
    } }

#endif
