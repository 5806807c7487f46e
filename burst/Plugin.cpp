/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <cstdlib>
#include <boost/format.hpp>

#include "Plugin.hpp"
#include "exception.hpp"

namespace burst {


std::vector<boost::filesystem::path> Plugin::s_extraPaths;


Plugin::Plugin(const std::string& name) :
	m_handle(NULL),
	m_name(dl_libname(name))
{
	using boost::format;

	if(!dl_init()) {
		/* Nothing to clean up in case of failure here */
		throw BackendUnavailable(str(format("Error when loading plugin %s: %s")
					% m_name % dl_error()));
	}

	try {
		setpath();
		m_handle = dl_load(m_name.c_str());
		if(m_handle == NULL) {
			throw BackendUnavailable(str(format("Error when loading plugin %s: %s")
						% m_name % dl_error()));
		}
	} catch(burst::exception&) {
		dl_exit();
		throw;
	}
}



Plugin::~Plugin()
{
	/* Both the 'unload' and the 'exit' can fail. There's not much we can do
	 * about either situation, so just continue on our merry way */
	dl_unload(m_handle);
	dl_exit();
}



boost::filesystem::path
Plugin::userDirectory()
{
	const char* home = getenv("HOME");
	if(home == NULL) {
		return boost::filesystem::path();
	}
	return boost::filesystem::path(home) / BURST_USER_PLUGIN_DIR;
}



void
Plugin::setpath()
{
	using boost::format;
	using namespace boost::filesystem;

	std::vector<path> paths = s_extraPaths;

	path userPath = userDirectory();
	if(!userPath.empty() && exists(userPath)) {
		paths.push_back(userPath);
	}

	path systemPath(BURST_SYSTEM_PLUGIN_DIR);
	if(exists(systemPath)) {
		paths.push_back(systemPath);
	}

	for(std::vector<path>::const_iterator i = paths.begin();
			i != paths.end(); ++i) {
		bool success = false;
		if(i == paths.begin()) {
			success = dl_setsearchpath(i->string().c_str());
		} else {
			success = dl_addsearchdir(i->string().c_str());
		}
		if(!success) {
			throw BackendUnavailable(
					str(format("Error when setting plugin search path (%s): %s")
						% (*i) % dl_error()));
		}
	}
}



void*
Plugin::function(const std::string& name) const
{
	using boost::format;
	void* fn = dl_sym(m_handle, name.c_str());
	if(fn == NULL) {
		throw BackendUnavailable(str(format("Plugin %s has no symbol %s: %s")
					% m_name % name % dl_error()));
	}
	return fn;
}



void
Plugin::addPath(const std::string& dir)
{
	using boost::format;

	boost::filesystem::path path(dir);
	if(!boost::filesystem::is_directory(path)) {
		throw exception(BURST_DL_ERROR,
				str(format("User-specified plugin path %s could not be found") % dir));
	}
	s_extraPaths.push_back(path);
}

}
