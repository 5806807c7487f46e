#ifndef BURST_HPP
#define BURST_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <burst/config.h>
#include <burst/types.h>
#include <burst/exception.hpp>
#include <burst/Configuration.hpp>
#include <burst/Neuron.hpp>
#include <burst/Npu.hpp>

namespace burst {

/*! \return number of devices usable by a backend on this host (1 for the
 * CPU, 0 for a GPU backend whose plugin or device is missing) */
BURST_DLL_PUBLIC
unsigned
deviceCount(backend_t backend);

}

#endif
