/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <algorithm>

#include "Worker.hpp"
#include "Backend.hpp"

namespace burst {
	namespace cpu {

Worker::Worker(unsigned id, size_t jobSize, size_t neuronCount, model_t model, Backend* backend) :
	m_start(std::min(id * jobSize, neuronCount)),
	m_end(std::min((id+1) * jobSize, neuronCount)),
	m_model(model),
	m_backend(backend)
{
	;
}


void
Worker::operator()()
{
	m_backend->updateRange(m_model, m_start, m_end);
}

}	} // end namespaces
