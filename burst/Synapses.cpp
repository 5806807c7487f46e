/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include "Synapses.hpp"

#include <algorithm>
#include <boost/format.hpp>

#include "exception.hpp"

namespace burst {

const std::vector<sidx_t> SynapseStorage::s_empty;


SynapseStorage::SynapseStorage(size_t capacity) :
	m_capacity(capacity),
	m_live(0),
	m_revision(0)
{
	;
}



void
eraseValue(std::vector<sidx_t>& v, sidx_t value)
{
	std::vector<sidx_t>::iterator i = std::find(v.begin(), v.end(), value);
	if(i != v.end()) {
		v.erase(i);
	}
}



sidx_t
SynapseStorage::add(const Synapse& s)
{
	using boost::format;

	if(m_live == m_capacity) {
		throw CapacityExceeded(str(format("Synapse storage is full (%u synapses)") % m_capacity));
	}

	sidx_t id;
	if(!m_freeSlots.empty()) {
		id = m_freeSlots.back();
		m_freeSlots.pop_back();
	} else {
		id = sidx_t(m_valid.size());
		m_source.push_back(0);
		m_target.push_back(0);
		m_weight.push_back(0);
		m_psp.push_back(0);
		m_kind.push_back(0);
		m_valid.push_back(0);
	}

	m_source[id] = s.source;
	m_target[id] = s.target;
	m_weight[id] = s.weight;
	m_psp[id] = s.psp;
	m_kind[id] = uint8_t(s.kind);
	m_valid[id] = 1;

	m_outgoing[s.source].push_back(id);
	m_incoming[s.target].push_back(id);

	m_live += 1;
	m_revision += 1;
	return id;
}



void
SynapseStorage::checkLive(sidx_t id) const
{
	using boost::format;
	if(!valid(id)) {
		throw InvalidReference(str(format("Non-existing synapse %u") % id));
	}
}



void
SynapseStorage::remove(sidx_t id)
{
	checkLive(id);

	index_t::iterator out = m_outgoing.find(m_source[id]);
	eraseValue(out->second, id);
	if(out->second.empty()) {
		m_outgoing.erase(out);
	}

	index_t::iterator in = m_incoming.find(m_target[id]);
	eraseValue(in->second, id);
	if(in->second.empty()) {
		m_incoming.erase(in);
	}

	m_valid[id] = 0;
	m_freeSlots.push_back(id);
	m_live -= 1;
	m_revision += 1;
}



void
SynapseStorage::setWeight(sidx_t id, uint8_t weight)
{
	checkLive(id);
	m_weight[id] = weight;
	m_revision += 1;
}



Synapse
SynapseStorage::get(sidx_t id) const
{
	checkLive(id);
	return Synapse(m_source[id], m_target[id], m_weight[id], m_psp[id], synapse_kind_t(m_kind[id]));
}



const std::vector<sidx_t>&
SynapseStorage::outgoing(nidx_t source) const
{
	index_t::const_iterator i = m_outgoing.find(source);
	return i == m_outgoing.end() ? s_empty : i->second;
}



const std::vector<sidx_t>&
SynapseStorage::incoming(nidx_t target) const
{
	index_t::const_iterator i = m_incoming.find(target);
	return i == m_incoming.end() ? s_empty : i->second;
}

} // end namespace burst
