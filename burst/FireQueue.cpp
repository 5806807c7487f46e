/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include "FireQueue.hpp"

#include <algorithm>
#include <boost/format.hpp>

#include "exception.hpp"

namespace burst {


void
FireQueue::reset(burst_t burst)
{
	m_burst = burst;
	m_neurons.clear();
}



void
FireQueue::push(const FiringNeuron& neuron)
{
	using boost::format;
	if(!m_neurons.empty() && m_neurons.back().id >= neuron.id) {
		throw burst::exception(BURST_LOGIC_ERROR,
				str(format("Fire queue entries out of order (%u after %u)")
					% neuron.id % m_neurons.back().id));
	}
	m_neurons.push_back(neuron);
}



std::vector<nidx_t>
FireQueue::ids() const
{
	std::vector<nidx_t> ret;
	ret.reserve(m_neurons.size());
	for(std::vector<FiringNeuron>::const_iterator i = m_neurons.begin();
			i != m_neurons.end(); ++i) {
		ret.push_back(i->id);
	}
	return ret;
}



bool
idLess(const FiringNeuron& n, nidx_t id)
{
	return n.id < id;
}


bool
FireQueue::contains(nidx_t id) const
{
	std::vector<FiringNeuron>::const_iterator i =
		std::lower_bound(m_neurons.begin(), m_neurons.end(), id, idLess);
	return i != m_neurons.end() && i->id == id;
}



bool
FireQueue::erase(nidx_t id)
{
	std::vector<FiringNeuron>::iterator i =
		std::lower_bound(m_neurons.begin(), m_neurons.end(), id, idLess);
	if(i == m_neurons.end() || i->id != id) {
		return false;
	}
	m_neurons.erase(i);
	return true;
}



std::map<area_t, std::vector<nidx_t> >
FireQueue::byArea() const
{
	std::map<area_t, std::vector<nidx_t> > ret;
	for(std::vector<FiringNeuron>::const_iterator i = m_neurons.begin();
			i != m_neurons.end(); ++i) {
		ret[i->area].push_back(i->id);
	}
	return ret;
}

} // end namespace burst
