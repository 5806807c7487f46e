#ifndef BURST_CUDA_DEVICES_HPP
#define BURST_CUDA_DEVICES_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

namespace burst {
	namespace cuda {

/*! \return number of suitable devices, 0 if there is no usable driver */
unsigned deviceCount();

/*! \throws burst::BackendUnavailable for an invalid device */
const char* deviceDescription(unsigned device);

/*! Select the device to run on
 *
 * \param device requested device, or -1 to let the runtime choose
 * \return the device in use
 * \throws burst::BackendUnavailable if there are no suitable devices or
 * 		the requested one is not among them
 */
unsigned chooseDevice(int device);

}	}

#endif
