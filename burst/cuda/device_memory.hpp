#ifndef BURST_CUDA_DEVICE_MEMORY_HPP
#define BURST_CUDA_DEVICE_MEMORY_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

/*! \file device_memory.hpp Device memory methods
 *
 * These are wrappers for CUDA device memory methods, with appropriate error
 * handling. This wrapper also serves to reduce cuda_runtime header
 * dependencies.
 */

#include <cstddef>
#include <vector>
#include <boost/shared_array.hpp>

#include <burst/exception.hpp>

namespace burst {
	namespace cuda {

void
d_malloc(void** d_ptr, size_t sz, const char* name);

void
d_free(void*);


/*! Allocate memory block and put in smart pointer
 *
 * \param len length in /words/
 * \param name name of data structure (for error reporting)
 */
template<typename T>
boost::shared_array<T>
d_array(size_t len, const char* name)
{
	void* d_ptr = NULL;
	d_malloc(&d_ptr, len * sizeof(T), name);
	return boost::shared_array<T>(static_cast<T*>(d_ptr), d_free);
}


void
memcpyBytesToDevice(void* dst, const void* src, size_t count);


template<typename T>
void
memcpyToDevice(T* dst, const std::vector<T>& vec)
{
	if(vec.empty()) {
		throw burst::exception(BURST_LOGIC_ERROR, "cannot copy empty vector to device");
	}
	memcpyBytesToDevice((void*)dst, (const void*)&vec[0], vec.size() * sizeof(T));
}


/*! Allocate a device array holding a copy of \a vec */
template<typename T>
boost::shared_array<T>
d_upload(const std::vector<T>& vec, const char* name)
{
	boost::shared_array<T> d_arr = d_array<T>(vec.size(), name);
	memcpyToDevice(d_arr.get(), vec);
	return d_arr;
}


void
memcpyBytesFromDevice(void* dst, const void* src, size_t bytes);


/* \param count
 * 		Number of elements to copy from device into vector
 */
template<typename T>
void
memcpyFromDevice(std::vector<T>& vec, const T* src, size_t count)
{
	if(count > vec.size()) {
		throw burst::exception(BURST_LOGIC_ERROR, "attempt to copy into vector which is too small");
	}
	if(count > 0) {
		memcpyBytesFromDevice(&vec[0], src, count * sizeof(T));
	}
}


void d_memset(void* d_ptr, int value, size_t count);

} 	} // end namespaces

#endif
