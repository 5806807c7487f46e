#ifndef BURST_CPU_WORKER_HPP
#define BURST_CPU_WORKER_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <cstddef>
#include <burst/types.h>

namespace burst {
	namespace cpu {

class Backend;

/*! Thread body updating one contiguous slice of a model's neurons */
class Worker
{
	public :

		Worker(unsigned id, size_t jobSize, size_t neuronCount, model_t model, Backend* backend);

		void operator()();

	private:

		size_t m_start;
		size_t m_end;
		model_t m_model;
		Backend* m_backend;
};

}	}	// end namespaces

#endif
