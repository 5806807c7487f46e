#ifndef BURST_ERRORS_H
#define BURST_ERRORS_H

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

/*! \file errors.h Error codes carried by burst::exception */

enum burst_error_t {
	BURST_OK = 0,
	BURST_CONFIGURATION_ERROR,  // invalid capacities, thresholds or options
	BURST_CAPACITY_EXCEEDED,    // an id range or storage array is full
	BURST_BACKEND_UNAVAILABLE,  // requested hardware or plugin is missing
	BURST_COMPUTATION_ERROR,    // kernel or device failure during a burst
	BURST_INVALID_REFERENCE,    // id is not (or no longer) allocated
	BURST_INVALID_INPUT,
	BURST_LOGIC_ERROR,
	BURST_DL_ERROR,
	BURST_API_UNSUPPORTED,
	BURST_UNKNOWN_ERROR
};

#endif
