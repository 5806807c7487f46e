#ifndef BURST_FIRE_LEDGER_HPP
#define BURST_FIRE_LEDGER_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <cstddef>
#include <map>
#include <utility>
#include <vector>
#include <boost/circular_buffer.hpp>
#include <boost/optional.hpp>

#include <burst/config.h>
#include "types.h"
#include "CompressedSet.hpp"

namespace burst {

class FireQueue;

/*! Fired set of one cortical area in one burst */
struct LedgerFrame
{
	LedgerFrame() : timestep(0) {}
	LedgerFrame(burst_t t) : timestep(t) {}

	burst_t timestep;
	CompressedSet fired;
};



/*! \brief Rolling per-area firing history
 *
 * Each tracked cortical area has a fixed-size ring of frames, one per
 * archived burst, oldest first. Frames are dense: silent bursts get an empty
 * frame and skipped timesteps are filled in, so consecutive frames always
 * have consecutive timesteps. When the ring is full the oldest frame is
 * overwritten.
 */
class BURST_DLL_PUBLIC FireLedger
{
	public :

		typedef boost::circular_buffer<LedgerFrame> frames_t;

		/*! \param defaultWindow frames kept for automatically tracked areas
		 * \throws burst::ConfigurationError if the window is zero */
		explicit FireLedger(size_t defaultWindow);

		/*! Start tracking an area with its own window
		 *
		 * Tracking an area again with the same window is a no-op. A different
		 * window is rejected: windows cannot be resized once in use.
		 *
		 * \throws burst::exception (BURST_INVALID_INPUT) */
		void track(area_t area, size_t window);

		/*! Track the area with the default window unless already tracked */
		void trackDefault(area_t area);

		/*! Stop tracking and drop the area's history */
		void untrack(area_t area);

		bool tracked(area_t area) const;

		/*! Record the fired sets of a burst for all tracked areas
		 *
		 * \throws burst::exception (BURST_INVALID_INPUT) unless \a timestep is
		 * 		later than every previously archived timestep */
		void archive(burst_t timestep, const FireQueue& fired);

		/*! \return frames of the area, oldest first
		 * \throws burst::InvalidReference if the area is not tracked */
		const frames_t& history(area_t area) const;

		/*! \return fired sets of the \a depth bursts ending at \a end, oldest first
		 *
		 * \throws burst::InvalidReference if the area is not tracked
		 * \throws burst::exception (BURST_INVALID_INPUT) if depth is zero or
		 * 		exceeds the window, \a end is later than the last archived
		 * 		burst, or the ring does not reach back far enough
		 */
		std::vector<CompressedSet> denseWindow(area_t area, burst_t end, size_t depth) const;

		/*! \return (area, window) of every tracked area */
		std::vector< std::pair<area_t, size_t> > trackedWindows() const;

		size_t defaultWindow() const { return m_defaultWindow; }

		/*! \return last archived timestep, if any */
		boost::optional<burst_t> lastTimestep() const { return m_last; }

		size_t memoryUsage() const;

	private :

		size_t m_defaultWindow;

		typedef std::map<area_t, frames_t> area_map;
		area_map m_areas;

		boost::optional<burst_t> m_last;

		const frames_t& frames(area_t area) const;
};

} // end namespace burst

#endif
