#ifndef BURST_EXCEPTION_HPP
#define BURST_EXCEPTION_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <stdexcept>
#include <string>

#include <burst/config.h>
#include "errors.h"

namespace burst {

/* Minor extension of std::runtime_error which adds an error code. The error
 * codes are listed in errors.h. Each entry in the error taxonomy has its own
 * subclass so callers can catch selectively. */
class BURST_DLL_PUBLIC exception : public std::runtime_error
{
	public :

		exception(int errorNumber, const std::string& msg) :
			std::runtime_error(msg),
			m_errno(errorNumber) {}

		~exception() throw () {}

		int errorNumber() const { return m_errno; }

	private :

		int m_errno;
};



/*! Invalid capacities, thresholds or options. Fatal at construction. */
class BURST_DLL_PUBLIC ConfigurationError : public exception
{
	public :
		explicit ConfigurationError(const std::string& msg) :
			exception(BURST_CONFIGURATION_ERROR, msg) {}
};



/*! An id range or storage array is full. No partial state is created. */
class BURST_DLL_PUBLIC CapacityExceeded : public exception
{
	public :
		explicit CapacityExceeded(const std::string& msg) :
			exception(BURST_CAPACITY_EXCEEDED, msg) {}
};



/*! The requested backend cannot be used on this host */
class BURST_DLL_PUBLIC BackendUnavailable : public exception
{
	public :
		explicit BackendUnavailable(const std::string& msg) :
			exception(BURST_BACKEND_UNAVAILABLE, msg) {}
};



/*! Device or kernel failure. The burst in progress is aborted and none of
 * its output is valid. */
class BURST_DLL_PUBLIC ComputationError : public exception
{
	public :
		explicit ComputationError(const std::string& msg) :
			exception(BURST_COMPUTATION_ERROR, msg) {}
};



/*! Reference to an id which is not currently allocated */
class BURST_DLL_PUBLIC InvalidReference : public exception
{
	public :
		explicit InvalidReference(const std::string& msg) :
			exception(BURST_INVALID_REFERENCE, msg) {}
};


} // end namespace burst

#endif
