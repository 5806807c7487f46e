#ifndef BURST_FIRE_CANDIDATE_LIST_HPP
#define BURST_FIRE_CANDIDATE_LIST_HPP

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
#include <boost/optional.hpp>
#include <boost/unordered_map.hpp>

#include <burst/config.h>
#include "types.h"

namespace burst {

class IdManager;

/*! \brief Per-burst accumulator of synaptic input, bucketed by neuron model
 *
 * The first delivery to a neuron in a burst resolves its model through the
 * id manager and records where its entry lives. Later deliveries to the same
 * neuron hit that cache. Entries are kept in one bucket per model, as local
 * indices, so the dynamics phase never resolves a model again.
 */
class BURST_DLL_PUBLIC FireCandidateList
{
	public :

		/* Entries of a single model, in order of first delivery */
		struct Bucket
		{
			std::vector<lidx_t> local;
			std::vector<float> current;

			size_t size() const { return local.size(); }
		};

		explicit FireCandidateList(const IdManager& ids);

		/*! Add \a contribution to the entry of \a target
		 *
		 * \throws burst::InvalidReference if the target id is in no model range
		 */
		void accumulate(nidx_t target, float contribution);

		/*! Add \a contribution to the entry of a neuron whose model is known */
		void accumulate(model_t model, lidx_t local, float contribution);

		/*! Remove all entries, keeping allocated memory */
		void clear();

		size_t size() const { return m_index.size(); }
		bool empty() const { return m_index.empty(); }

		const Bucket& bucket(model_t model) const { return m_buckets[model]; }

		/*! \return accumulated input of the neuron, if it has an entry */
		boost::optional<float> get(nidx_t neuron) const;

		/*! \return all (id, input) entries ordered by id */
		std::vector< std::pair<nidx_t, float> > entries() const;

		/*! \return number of id-manager lookups since the last clear */
		size_t lookups() const { return m_lookups; }

	private :

		const IdManager* m_ids;

		std::vector<Bucket> m_buckets;

		/* Neuron id -> (model, position in bucket) */
		typedef boost::unordered_map<nidx_t, std::pair<model_t, uint32_t> > index_t;
		index_t m_index;

		size_t m_lookups;

		void add(nidx_t id, model_t model, lidx_t local, float contribution);
};

} // end namespace burst

#endif
