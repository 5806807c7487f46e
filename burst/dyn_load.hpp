#ifndef BURST_DYN_LOAD_HPP
#define BURST_DYN_LOAD_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

/* Thin layer over libltdl for loading backend plugins */

#include <string>
#include <ltdl.h>

typedef lt_dlhandle dl_handle;

// leave ltdl to work out the extension
#define LIB_NAME(base) "lib" base

/*! Initialise loading routines, returning success */
bool dl_init();

/*! Shut down loading routines, returning success */
bool dl_exit();

/*! Load library, returning handle to library. Returns NULL in case of failure */
dl_handle dl_load(const char* name);

/*! Unload library. Return success. */
bool dl_unload(dl_handle h);

/*! Return description of last error */
const char* dl_error();

/* Return function pointer to given symbol or NULL if there's an error. */
void* dl_sym(dl_handle, const char* name);

/*! Replace the user search path, returning success */
bool dl_setsearchpath(const char* dir);

/*! Append a directory to the user search path, returning success */
bool dl_addsearchdir(const char* dir);

/*! \return platform file name (less extension) of a library with base name \a name */
std::string dl_libname(const std::string& name);

#endif
