#ifndef BURST_TIMER_HPP
#define BURST_TIMER_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <burst/config.h>

#ifdef BURST_TIMING_ENABLED
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/numeric/conversion/cast.hpp>
#else
#include "exception.hpp"
#endif

namespace burst {

/*! Burst counter and, when compiled with timing support, wall-clock timer */
class Timer
{
	public:

		Timer() { reset(); }

		/*! Update internal counters. Should be called for every burst. */
		void step() { m_bursts++ ; }

		/*! \return elapsed wall-clock time in microseconds */
		unsigned long elapsedWallclock() const;

		/*! \return wall-clock microseconds since the previous lap or reset,
		 * 		or 0 when compiled without timing support */
		unsigned long lap();

		/*! \return number of bursts since the last reset */
		unsigned long elapsedBursts() const { return m_bursts; }

		/*! Reset internal counters. */
		void reset();

	private:

#ifdef BURST_TIMING_ENABLED
		boost::posix_time::ptime m_start;
		boost::posix_time::ptime m_lap;
#endif

		unsigned long m_bursts;
};



inline
unsigned long
Timer::elapsedWallclock() const
{
#ifdef BURST_TIMING_ENABLED
	using namespace boost::posix_time;
	time_duration elapsed = ptime(microsec_clock::local_time()) - m_start;
	return boost::numeric_cast<unsigned long, time_duration::tick_type>(elapsed.total_microseconds());
#else
	throw burst::exception(BURST_API_UNSUPPORTED,
			"elapsedWallclock is not supported in this version");
	return 0;
#endif
}



inline
unsigned long
Timer::lap()
{
#ifdef BURST_TIMING_ENABLED
	using namespace boost::posix_time;
	ptime now = microsec_clock::local_time();
	time_duration elapsed = now - m_lap;
	m_lap = now;
	return boost::numeric_cast<unsigned long, time_duration::tick_type>(elapsed.total_microseconds());
#else
	return 0;
#endif
}



inline
void
Timer::reset()
{
#ifdef BURST_TIMING_ENABLED
	using namespace boost::posix_time;
	m_start = ptime(microsec_clock::local_time());
	m_lap = m_start;
#endif
	m_bursts = 0;
}

}

#endif
