/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include "dyn_load.hpp"

bool
dl_init()
{
	return lt_dlinit() == 0;
}

bool
dl_exit()
{
	return lt_dlexit() == 0;
}

dl_handle
dl_load(const char* name)
{
	return lt_dlopenext(name);
}

bool
dl_unload(dl_handle h)
{
	return lt_dlclose(h) == 0;
}

const char*
dl_error()
{
	const char* err = lt_dlerror();
	return err == NULL ? "unknown error" : err;
}

void*
dl_sym(dl_handle hdl, const char* name)
{
	return lt_dlsym(hdl, name);
}

bool
dl_setsearchpath(const char* dir)
{
	return lt_dlsetsearchpath(dir) == 0;
}

bool
dl_addsearchdir(const char* dir)
{
	return lt_dladdsearchdir(dir) == 0;
}

std::string
dl_libname(const std::string& name)
{
	return std::string("lib") + name;
}
