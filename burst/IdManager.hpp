#ifndef BURST_ID_MANAGER_HPP
#define BURST_ID_MANAGER_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <cstddef>
#include <utility>
#include <vector>

#include <burst/config.h>
#include "types.h"
#include "CompressedSet.hpp"

namespace burst {


/*! Per-model allocation statistics */
struct RangeStats
{
	nidx_t start;      // first global id of the range
	uint32_t extent;   // ids handed out so far, live or free
	uint32_t ceiling;  // maximum extent
	uint32_t live;
	uint32_t free;
	size_t freeSetBytes;
};



/*! \brief Neuron id allocation and routing
 *
 * The 32-bit id space is split into one contiguous range per neuron model.
 * Model \e m owns [start(m), start(m) + ceiling(m)); only the prefix
 * [start(m), start(m) + extent(m)) has ever been handed out. Freed ids are
 * kept, as local indices, in a per-model compressed set and are reused
 * (lowest first) before the range grows. Ranges never shrink or overlap.
 *
 * Mapping between global ids and (model, local index) is plain arithmetic.
 * Resolving the model of a bare global id is either a scan over the model
 * ranges or a lookup in a byte-per-id table, as selected at construction.
 */
class BURST_DLL_PUBLIC IdManager
{
	public :

		/*! \param ceilings maximum number of ids for each model, indexed by
		 * 		model_t. The ranges are laid out in model order.
		 * \throws burst::ConfigurationError if the ranges do not fit the id space */
		IdManager(const std::vector<uint32_t>& ceilings, id_lookup_t lookup);

		/*! \return a recycled id if the model has any, else the next id in its range
		 * \throws burst::CapacityExceeded if the range is at its ceiling */
		nidx_t allocate(model_t model);

		/*! Return an id to its model's free set
		 *
		 * \return true if the id was live, false if it was already free
		 * \throws burst::InvalidReference if the id was never handed out */
		bool deallocate(nidx_t id);

		/*! \return true if the id is handed out and not freed */
		bool isAllocated(nidx_t id) const;

		/*! \return model whose range contains the id
		 * \throws burst::InvalidReference if no range contains it */
		model_t modelType(nidx_t id) const;

		/*! \return (model, local index) of the id
		 * \throws burst::InvalidReference if no range contains it */
		std::pair<model_t, lidx_t> locate(nidx_t id) const;

		nidx_t globalIdx(model_t model, lidx_t local) const {
			return m_start[model] + local;
		}

		lidx_t localIdx(model_t model, nidx_t id) const {
			return id - m_start[model];
		}

		/*! \return number of ids ever handed out for the model, which is
		 * also the length of that model's storage arrays */
		uint32_t extent(model_t model) const { return m_extent[model]; }

		uint32_t liveCount(model_t model) const;

		/*! \return total number of live ids across all models */
		uint64_t liveCount() const;

		const CompressedSet& freeSet(model_t model) const { return m_free[model]; }

		RangeStats stats(model_t model) const;

		id_lookup_t lookupMode() const { return m_lookup; }

	private :

		std::vector<nidx_t> m_start;
		std::vector<uint32_t> m_extent;
		std::vector<uint32_t> m_ceiling;

		/* Free local indices per model */
		std::vector<CompressedSet> m_free;

		id_lookup_t m_lookup;

		/* Model of each id handed out so far, for BURST_ID_LOOKUP_TABLE */
		std::vector<uint8_t> m_table;

		static const uint8_t NO_MODEL = 0xff;

		bool lookupScan(nidx_t id, model_t* model) const;
		bool lookupTable(nidx_t id, model_t* model) const;
};

} // end namespace burst

#endif
