/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include "IdManager.hpp"

#include <limits>
#include <boost/format.hpp>

#include "exception.hpp"

namespace burst {


const uint8_t IdManager::NO_MODEL;


IdManager::IdManager(const std::vector<uint32_t>& ceilings, id_lookup_t lookup) :
	m_start(BURST_MODEL_COUNT, 0),
	m_extent(BURST_MODEL_COUNT, 0),
	m_ceiling(BURST_MODEL_COUNT, 0),
	m_free(BURST_MODEL_COUNT),
	m_lookup(lookup)
{
	using boost::format;

	if(ceilings.size() != BURST_MODEL_COUNT) {
		throw ConfigurationError(str(format("Expected %u model ceilings, got %u")
					% BURST_MODEL_COUNT % ceilings.size()));
	}

	uint64_t start = 0;
	for(unsigned m = 0; m < BURST_MODEL_COUNT; ++m) {
		m_start[m] = nidx_t(start);
		m_ceiling[m] = ceilings[m];
		start += ceilings[m];
	}

	if(start > uint64_t(std::numeric_limits<nidx_t>::max()) + 1) {
		throw ConfigurationError(
				str(format("Model ranges (total %u ids) exceed the 32-bit neuron id space") % start));
	}
}



nidx_t
IdManager::allocate(model_t model)
{
	using boost::format;

	CompressedSet& free = m_free.at(model);
	if(!free.empty()) {
		return globalIdx(model, free.popMin());
	}

	if(m_extent[model] == m_ceiling[model]) {
		throw CapacityExceeded(
				str(format("Neuron id range of model %u is full (%u ids)")
					% model % m_ceiling[model]));
	}

	nidx_t id = globalIdx(model, m_extent[model]);
	m_extent[model] += 1;

	if(m_lookup == BURST_ID_LOOKUP_TABLE) {
		if(m_table.size() <= id) {
			m_table.resize(size_t(id) + 1, NO_MODEL);
		}
		m_table[id] = uint8_t(model);
	}
	return id;
}



bool
IdManager::deallocate(nidx_t id)
{
	std::pair<model_t, lidx_t> loc = locate(id);
	return m_free[loc.first].insert(loc.second);
}



bool
IdManager::isAllocated(nidx_t id) const
{
	model_t model;
	bool found = m_lookup == BURST_ID_LOOKUP_TABLE ? lookupTable(id, &model) : lookupScan(id, &model);
	return found && !m_free[model].contains(localIdx(model, id));
}



bool
IdManager::lookupScan(nidx_t id, model_t* model) const
{
	for(unsigned m = 0; m < BURST_MODEL_COUNT; ++m) {
		if(id >= m_start[m] && id - m_start[m] < m_extent[m]) {
			*model = model_t(m);
			return true;
		}
	}
	return false;
}



bool
IdManager::lookupTable(nidx_t id, model_t* model) const
{
	if(id >= m_table.size() || m_table[id] == NO_MODEL) {
		return false;
	}
	*model = model_t(m_table[id]);
	return true;
}



model_t
IdManager::modelType(nidx_t id) const
{
	using boost::format;

	model_t model;
	bool found = m_lookup == BURST_ID_LOOKUP_TABLE ? lookupTable(id, &model) : lookupScan(id, &model);
	if(!found) {
		throw InvalidReference(str(format("Non-existing neuron id %u") % id));
	}
	return model;
}



std::pair<model_t, lidx_t>
IdManager::locate(nidx_t id) const
{
	model_t model = modelType(id);
	return std::make_pair(model, localIdx(model, id));
}



uint32_t
IdManager::liveCount(model_t model) const
{
	return m_extent[model] - uint32_t(m_free[model].size());
}



uint64_t
IdManager::liveCount() const
{
	uint64_t n = 0;
	for(unsigned m = 0; m < BURST_MODEL_COUNT; ++m) {
		n += liveCount(model_t(m));
	}
	return n;
}



RangeStats
IdManager::stats(model_t model) const
{
	RangeStats s;
	s.start = m_start[model];
	s.extent = m_extent[model];
	s.ceiling = m_ceiling[model];
	s.live = liveCount(model);
	s.free = uint32_t(m_free[model].size());
	s.freeSetBytes = m_free[model].memoryUsage();
	return s;
}

} // end namespace burst
