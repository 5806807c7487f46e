#ifndef BURST_PLUGIN_HPP
#define BURST_PLUGIN_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include <boost/utility.hpp>

#include <burst/config.h>
#include "dyn_load.hpp"

namespace burst {


/*! \brief A dynamically loaded backend plugin
 *
 * Backends which depend on a device runtime (CUDA, wgpu-native) are built as
 * separate shared libraries so that the base library loads on hosts without
 * that runtime. Load failures are reported as burst::BackendUnavailable.
 */
class BURST_DLL_PUBLIC Plugin : private boost::noncopyable
{
	public :

		/*! Load a plugin from the library search path, after the
		 * burst-specific plugin directories
		 *
		 * \param name
		 * 		base name of the library, i.e. without any system-specific
		 * 		prefix or file extension. For example the library libfoo.so on
		 * 		a UNIX system has the  base name 'foo'.
		 *
		 * \throws burst::BackendUnavailable for load errors
		 */
		explicit Plugin(const std::string& name);

		~Plugin();

		/*! \return function pointer for a named function
		 *
		 * The user needs to cast this to the appropriate type.
		 *
		 * \throws burst::BackendUnavailable if the symbol is missing
		 */
		void* function(const std::string& name) const;

		/*! Add a directory which is searched before the default ones */
		static void addPath(const std::string& dir);

	private:

		dl_handle m_handle;

		std::string m_name;

		static std::vector<boost::filesystem::path> s_extraPaths;

		void setpath();

		static boost::filesystem::path userDirectory();
};

}

#endif
