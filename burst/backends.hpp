#ifndef BURST_BACKENDS_HPP
#define BURST_BACKENDS_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

/* Factory methods for compute backends, and the entry points which backend
 * plugins export. */

#include <boost/shared_ptr.hpp>

#include <burst/config.h>
#include "types.h"
#include "BackendSelector.hpp"

namespace burst {
	class ComputeBackend;
	class ConfigurationImpl;
	class IdManager;
	class Plugin;
}


/* Plugin entry points. Each GPU plugin exports these with its own prefix,
 * e.g. burst_cuda_device_count */
extern "C" {

typedef unsigned backend_device_count_t(void);
typedef const char* backend_device_description_t(unsigned device);

/*! Construct a backend, returning NULL and setting the error if it fails */
typedef burst::ComputeBackend* backend_create_t(
		const burst::IdManager*,
		const burst::ConfigurationImpl*);

/*! Error message of the last failed call in this plugin */
typedef const char* backend_last_error_t(void);

/*! 1 if the last failure was due to a missing device rather than a device fault */
typedef int backend_last_error_unavailable_t(void);

}


namespace burst {

/*! \return name of the plugin library implementing \a backend, or NULL for
 * backends built into the base library */
const char* pluginName(backend_t backend);

/*! \return number of usable devices for a GPU backend, 0 if the plugin is
 * missing, fails to load or finds no device */
BURST_DLL_PUBLIC
unsigned
deviceCount(backend_t backend);

/*! Check which GPU backends can be constructed on this host */
BURST_DLL_PUBLIC
HardwareAvailability
probeHardware();

/*! Construct a backend of the given type
 *
 * \param plugin
 * 		set to the plugin which owns the backend's code, if any. It must
 * 		outlive the returned backend.
 *
 * \throws burst::BackendUnavailable if the backend is not compiled in, its
 * 		plugin cannot be loaded, or no suitable device is present
 * \throws burst::ComputationError for device faults during construction
 */
BURST_DLL_PUBLIC
ComputeBackend*
createBackend(backend_t backend,
		const IdManager& ids,
		const ConfigurationImpl& conf,
		boost::shared_ptr<Plugin>& plugin);

}

#endif
