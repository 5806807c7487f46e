#ifndef BURST_COMPRESSED_SET_HPP
#define BURST_COMPRESSED_SET_HPP

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

#include <burst/config.h>
#include "types.h"

namespace burst {

/*! \brief Compressed set of 32-bit integers
 *
 * Roaring-style layout: values are split on their high 16 bits into
 * containers. A container holds its low 16 bits either as a sorted array
 * (sparse) or as a 65536-bit bitmap (dense), switching representation at
 * \a ARRAY_LIMIT entries. This is used both for the per-model free id sets and
 * for the fired sets in the fire ledger.
 */
class BURST_DLL_PUBLIC CompressedSet
{
	public :

		/* Largest cardinality stored as a sorted array */
		static const size_t ARRAY_LIMIT = 4096;

		CompressedSet();

		/*! \return true if the value was not already present */
		bool insert(uint32_t value);

		/*! \return true if the value was present */
		bool erase(uint32_t value);

		bool contains(uint32_t value) const;

		size_t size() const { return m_size; }
		bool empty() const { return m_size == 0; }

		void clear();

		/*! \return smallest value in the set
		 * \throws burst::exception if the set is empty */
		uint32_t min() const;

		/*! Remove and return the smallest value */
		uint32_t popMin();

		/*! \return all values in ascending order */
		std::vector<uint32_t> values() const;

		CompressedSet operator|(const CompressedSet& rhs) const;
		CompressedSet operator&(const CompressedSet& rhs) const;
		CompressedSet& operator|=(const CompressedSet& rhs);

		bool operator==(const CompressedSet& rhs) const;
		bool operator!=(const CompressedSet& rhs) const { return !(*this == rhs); }

		/*! \return approximate heap usage in bytes */
		size_t memoryUsage() const;

		/*! \return number of containers currently in bitmap form */
		size_t bitmapContainers() const;

	private :

		struct Container
		{
			Container() : cardinality(0) {}

			std::vector<uint16_t> array;   // sorted, used when bitmap is empty
			std::vector<uint64_t> bitmap;  // 1024 words when in use
			uint32_t cardinality;

			bool isBitmap() const { return !bitmap.empty(); }
			bool contains(uint16_t low) const;
			bool insert(uint16_t low);
			bool erase(uint16_t low);
			uint16_t min() const;
			void normalize();
			void toBitmap();
			void toArray();
			void append(uint32_t high, std::vector<uint32_t>& out) const;
		};

		/* Parallel arrays, sorted on key */
		std::vector<uint16_t> m_keys;
		std::vector<Container> m_containers;

		size_t m_size;

		/*! \return position of key, or m_keys.size() if not found */
		size_t find(uint16_t key) const;

		static Container unite(const Container& a, const Container& b);
		static Container intersect(const Container& a, const Container& b);
};

} // end namespace burst

#endif
