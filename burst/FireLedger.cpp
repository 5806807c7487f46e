/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include "FireLedger.hpp"

#include <boost/format.hpp>

#include "FireQueue.hpp"
#include "exception.hpp"

namespace burst {


FireLedger::FireLedger(size_t defaultWindow) :
	m_defaultWindow(defaultWindow)
{
	if(defaultWindow == 0) {
		throw ConfigurationError("Fire ledger window must be at least one burst");
	}
}



void
FireLedger::track(area_t area, size_t window)
{
	using boost::format;

	if(window == 0) {
		throw burst::exception(BURST_INVALID_INPUT,
				str(format("Invalid fire ledger window 0 for area %u") % area));
	}

	area_map::const_iterator i = m_areas.find(area);
	if(i != m_areas.end()) {
		if(i->second.capacity() != window) {
			throw burst::exception(BURST_INVALID_INPUT,
					str(format("Area %u is already tracked with window %u; cannot resize to %u")
						% area % i->second.capacity() % window));
		}
		return;
	}
	m_areas.insert(std::make_pair(area, frames_t(window)));
}



void
FireLedger::trackDefault(area_t area)
{
	if(m_areas.find(area) == m_areas.end()) {
		m_areas.insert(std::make_pair(area, frames_t(m_defaultWindow)));
	}
}



void
FireLedger::untrack(area_t area)
{
	m_areas.erase(area);
}



bool
FireLedger::tracked(area_t area) const
{
	return m_areas.find(area) != m_areas.end();
}



void
FireLedger::archive(burst_t timestep, const FireQueue& fired)
{
	using boost::format;

	if(m_last && timestep <= *m_last) {
		throw burst::exception(BURST_INVALID_INPUT,
				str(format("Fire ledger timestep %u is not after the last archived timestep %u")
					% timestep % *m_last));
	}

	std::map<area_t, std::vector<nidx_t> > groups = fired.byArea();

	for(area_map::iterator a = m_areas.begin(); a != m_areas.end(); ++a) {
		frames_t& frames = a->second;

		/* Fill skipped timesteps, at most a window's worth */
		if(!frames.empty()) {
			burst_t next = frames.back().timestep + 1;
			if(timestep - next > frames.capacity()) {
				next = timestep - frames.capacity();
			}
			for(burst_t t = next; t < timestep; ++t) {
				frames.push_back(LedgerFrame(t));
			}
		}

		frames.push_back(LedgerFrame(timestep));
		std::map<area_t, std::vector<nidx_t> >::const_iterator g = groups.find(a->first);
		if(g != groups.end()) {
			CompressedSet& set = frames.back().fired;
			for(std::vector<nidx_t>::const_iterator n = g->second.begin(); n != g->second.end(); ++n) {
				set.insert(*n);
			}
		}
	}

	m_last = timestep;
}



const FireLedger::frames_t&
FireLedger::frames(area_t area) const
{
	using boost::format;
	area_map::const_iterator i = m_areas.find(area);
	if(i == m_areas.end()) {
		throw InvalidReference(str(format("Cortical area %u is not tracked by the fire ledger") % area));
	}
	return i->second;
}



const FireLedger::frames_t&
FireLedger::history(area_t area) const
{
	return frames(area);
}



std::vector<CompressedSet>
FireLedger::denseWindow(area_t area, burst_t end, size_t depth) const
{
	using boost::format;

	const frames_t& fs = frames(area);

	if(depth == 0 || depth > fs.capacity()) {
		throw burst::exception(BURST_INVALID_INPUT,
				str(format("Invalid depth %u for fire ledger window of %u bursts")
					% depth % fs.capacity()));
	}

	if(fs.empty() || end > fs.back().timestep) {
		throw burst::exception(BURST_INVALID_INPUT,
				str(format("Timestep %u has not been archived for area %u") % end % area));
	}

	/* Frames are contiguous in time, so positions follow from timesteps */
	burst_t behind = fs.back().timestep - end;
	if(behind + depth > fs.size()) {
		throw burst::exception(BURST_INVALID_INPUT,
				str(format("Insufficient history for area %u: %u bursts ending at %u requested, %u held")
					% area % depth % end % fs.size()));
	}

	size_t last = fs.size() - 1 - size_t(behind);
	std::vector<CompressedSet> ret;
	ret.reserve(depth);
	for(size_t i = last + 1 - depth; i <= last; ++i) {
		ret.push_back(fs[i].fired);
	}
	return ret;
}



std::vector< std::pair<area_t, size_t> >
FireLedger::trackedWindows() const
{
	std::vector< std::pair<area_t, size_t> > ret;
	for(area_map::const_iterator i = m_areas.begin(); i != m_areas.end(); ++i) {
		ret.push_back(std::make_pair(i->first, i->second.capacity()));
	}
	return ret;
}



size_t
FireLedger::memoryUsage() const
{
	size_t bytes = 0;
	for(area_map::const_iterator a = m_areas.begin(); a != m_areas.end(); ++a) {
		bytes += a->second.capacity() * sizeof(LedgerFrame);
		for(frames_t::const_iterator f = a->second.begin(); f != a->second.end(); ++f) {
			bytes += f->fired.memoryUsage();
		}
	}
	return bytes;
}

} // end namespace burst
