/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include "devices.hpp"

#include <map>
#include <boost/format.hpp>
#include <cuda_runtime.h>

#include "except.hpp"

namespace burst {
	namespace cuda {


typedef std::map<unsigned, cudaDeviceProp> devmap_t;

devmap_t* g_devices = NULL;


bool
deviceSuitable(const cudaDeviceProp& prop)
{
	/* 9999.9999 is the 'emulation device' */
	if(prop.major == 9999 || prop.minor == 9999) {
		return false;
	}

	/* 2.0 is the oldest architecture the kernels are built for */
	return prop.major >= 2;
}



/* Create and populate a (global) list of suitable devices. A host without a
 * driver simply has no devices. */
const devmap_t&
enumerateDevices()
{
	if(g_devices == NULL) {
		g_devices = new devmap_t();
		int dcount = 0;
		if(cudaGetDeviceCount(&dcount) != cudaSuccess) {
			/* clear the sticky error */
			cudaGetLastError();
			dcount = 0;
		}
		for(int device = 0; device < dcount; ++device) {
			cudaDeviceProp prop;
			CUDA_SAFE_CALL(cudaGetDeviceProperties(&prop, device));
			if(deviceSuitable(prop)) {
				(*g_devices)[device] = prop;
			}
		}
	}
	return *g_devices;
}



unsigned
deviceCount()
{
	return unsigned(enumerateDevices().size());
}



const char*
deviceDescription(unsigned device)
{
	using boost::format;

	const devmap_t& devices = enumerateDevices();
	devmap_t::const_iterator i = devices.find(device);
	if(i == devices.end()) {
		throw burst::BackendUnavailable(str(format("Invalid CUDA device: %u") % device));
	}
	return i->second.name;
}



unsigned
chooseDevice(int device)
{
	using boost::format;

	const devmap_t& devmap = enumerateDevices();
	if(devmap.empty()) {
		throw burst::BackendUnavailable("No CUDA devices available");
	}

	int dev = device;
	if(dev < 0) {
		/* Use the first suitable device */
		dev = int(devmap.begin()->first);
	} else if(devmap.find(unsigned(dev)) == devmap.end()) {
		throw burst::BackendUnavailable(str(format("Invalid CUDA device: %d") % device));
	}

	int existingDev;
	CUDA_SAFE_CALL(cudaGetDevice(&existingDev));
	if(existingDev != dev) {
		CUDA_SAFE_CALL(cudaSetDevice(dev));
	}
	return unsigned(dev);
}

}	}
