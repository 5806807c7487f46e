#ifndef BURST_SYNAPSES_HPP
#define BURST_SYNAPSES_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include <cstddef>
#include <vector>
#include <boost/unordered_map.hpp>

#include <burst/config.h>
#include "types.h"
#include "Synapse.hpp"

namespace burst {

/*! \brief Structure-of-arrays synapse store
 *
 * Synapses are addressed by slot. Removed slots are recycled. Outgoing and
 * incoming indices map a neuron id to the slots it takes part in, so that
 * propagation only touches the synapses of neurons which fired.
 */
class BURST_DLL_PUBLIC SynapseStorage
{
	public :

		explicit SynapseStorage(size_t capacity);

		/*! \throws burst::CapacityExceeded when \a capacity synapses are live */
		sidx_t add(const Synapse& s);

		/*! \throws burst::InvalidReference if the slot is not live */
		void remove(sidx_t id);

		/*! \throws burst::InvalidReference if the slot is not live */
		void setWeight(sidx_t id, uint8_t weight);

		/*! \throws burst::InvalidReference if the slot is not live */
		Synapse get(sidx_t id) const;

		bool valid(sidx_t id) const { return id < m_valid.size() && m_valid[id]; }

		/*! \return slots of the live synapses leaving \a source */
		const std::vector<sidx_t>& outgoing(nidx_t source) const;

		/*! \return slots of the live synapses arriving at \a target */
		const std::vector<sidx_t>& incoming(nidx_t target) const;

		/*! \return number of live synapses */
		size_t size() const { return m_live; }

		/*! \return number of slots, live or free */
		size_t slots() const { return m_valid.size(); }

		size_t capacity() const { return m_capacity; }

		const std::vector<nidx_t>& source() const { return m_source; }
		const std::vector<nidx_t>& target() const { return m_target; }
		const std::vector<uint8_t>& weight() const { return m_weight; }
		const std::vector<uint8_t>& psp() const { return m_psp; }
		const std::vector<uint8_t>& kind() const { return m_kind; }
		const std::vector<uint8_t>& validMask() const { return m_valid; }

		/*! Changes whenever a synapse is added, removed or re-weighted */
		uint64_t revision() const { return m_revision; }

	private :

		size_t m_capacity;
		size_t m_live;

		std::vector<nidx_t> m_source;
		std::vector<nidx_t> m_target;
		std::vector<uint8_t> m_weight;
		std::vector<uint8_t> m_psp;
		std::vector<uint8_t> m_kind;
		std::vector<uint8_t> m_valid;

		std::vector<sidx_t> m_freeSlots;

		typedef boost::unordered_map<nidx_t, std::vector<sidx_t> > index_t;

		index_t m_outgoing;
		index_t m_incoming;

		uint64_t m_revision;

		static const std::vector<sidx_t> s_empty;

		void checkLive(sidx_t id) const;
};

} // end namespace burst

#endif
