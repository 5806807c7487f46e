/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include "FireCandidateList.hpp"

#include <algorithm>

#include "IdManager.hpp"

namespace burst {


FireCandidateList::FireCandidateList(const IdManager& ids) :
	m_ids(&ids),
	m_buckets(BURST_MODEL_COUNT),
	m_lookups(0)
{
	;
}



void
FireCandidateList::accumulate(nidx_t target, float contribution)
{
	index_t::iterator i = m_index.find(target);
	if(i != m_index.end()) {
		m_buckets[i->second.first].current[i->second.second] += contribution;
		return;
	}
	std::pair<model_t, lidx_t> loc = m_ids->locate(target);
	m_lookups += 1;
	add(target, loc.first, loc.second, contribution);
}



void
FireCandidateList::accumulate(model_t model, lidx_t local, float contribution)
{
	nidx_t id = m_ids->globalIdx(model, local);
	index_t::iterator i = m_index.find(id);
	if(i != m_index.end()) {
		m_buckets[model].current[i->second.second] += contribution;
		return;
	}
	add(id, model, local, contribution);
}



void
FireCandidateList::add(nidx_t id, model_t model, lidx_t local, float contribution)
{
	Bucket& bucket = m_buckets[model];
	m_index.insert(std::make_pair(id, std::make_pair(model, uint32_t(bucket.local.size()))));
	bucket.local.push_back(local);
	bucket.current.push_back(contribution);
}



void
FireCandidateList::clear()
{
	for(std::vector<Bucket>::iterator b = m_buckets.begin(); b != m_buckets.end(); ++b) {
		b->local.clear();
		b->current.clear();
	}
	m_index.clear();
	m_lookups = 0;
}



boost::optional<float>
FireCandidateList::get(nidx_t neuron) const
{
	index_t::const_iterator i = m_index.find(neuron);
	if(i == m_index.end()) {
		return boost::optional<float>();
	}
	return boost::optional<float>(m_buckets[i->second.first].current[i->second.second]);
}



std::vector< std::pair<nidx_t, float> >
FireCandidateList::entries() const
{
	std::vector< std::pair<nidx_t, float> > ret;
	ret.reserve(size());
	for(unsigned m = 0; m < BURST_MODEL_COUNT; ++m) {
		const Bucket& bucket = m_buckets[m];
		for(size_t i = 0; i < bucket.size(); ++i) {
			ret.push_back(std::make_pair(m_ids->globalIdx(model_t(m), bucket.local[i]), bucket.current[i]));
		}
	}
	std::sort(ret.begin(), ret.end());
	return ret;
}

} // end namespace burst
