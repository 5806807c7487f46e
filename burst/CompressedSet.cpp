/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

#include "CompressedSet.hpp"

#include <algorithm>
#include <iterator>

#include "exception.hpp"

namespace burst {

const size_t BITMAP_WORDS = 65536 / 64;


inline
uint16_t
highBits(uint32_t v)
{
	return uint16_t(v >> 16);
}


inline
uint16_t
lowBits(uint32_t v)
{
	return uint16_t(v & 0xffff);
}



/* Container */


bool
CompressedSet::Container::contains(uint16_t low) const
{
	if(isBitmap()) {
		return (bitmap[low >> 6] >> (low & 0x3f)) & 0x1;
	}
	return std::binary_search(array.begin(), array.end(), low);
}



bool
CompressedSet::Container::insert(uint16_t low)
{
	if(isBitmap()) {
		uint64_t& word = bitmap[low >> 6];
		uint64_t mask = uint64_t(1) << (low & 0x3f);
		if(word & mask) {
			return false;
		}
		word |= mask;
		cardinality += 1;
		return true;
	}

	std::vector<uint16_t>::iterator i = std::lower_bound(array.begin(), array.end(), low);
	if(i != array.end() && *i == low) {
		return false;
	}
	array.insert(i, low);
	cardinality += 1;
	normalize();
	return true;
}



bool
CompressedSet::Container::erase(uint16_t low)
{
	if(isBitmap()) {
		uint64_t& word = bitmap[low >> 6];
		uint64_t mask = uint64_t(1) << (low & 0x3f);
		if(!(word & mask)) {
			return false;
		}
		word &= ~mask;
		cardinality -= 1;
		normalize();
		return true;
	}

	std::vector<uint16_t>::iterator i = std::lower_bound(array.begin(), array.end(), low);
	if(i == array.end() || *i != low) {
		return false;
	}
	array.erase(i);
	cardinality -= 1;
	return true;
}



uint16_t
CompressedSet::Container::min() const
{
	if(isBitmap()) {
		for(size_t w = 0; w < BITMAP_WORDS; ++w) {
			if(bitmap[w]) {
				return uint16_t(w * 64 + __builtin_ctzll(bitmap[w]));
			}
		}
		throw burst::exception(BURST_LOGIC_ERROR, "empty bitmap container");
	}
	return array.front();
}



void
CompressedSet::Container::toBitmap()
{
	bitmap.assign(BITMAP_WORDS, 0);
	for(std::vector<uint16_t>::const_iterator i = array.begin(); i != array.end(); ++i) {
		bitmap[*i >> 6] |= uint64_t(1) << (*i & 0x3f);
	}
	std::vector<uint16_t>().swap(array);
}



void
CompressedSet::Container::toArray()
{
	std::vector<uint16_t> values;
	values.reserve(cardinality);
	for(size_t w = 0; w < BITMAP_WORDS; ++w) {
		uint64_t word = bitmap[w];
		while(word) {
			unsigned bit = __builtin_ctzll(word);
			values.push_back(uint16_t(w * 64 + bit));
			word &= word - 1;
		}
	}
	array.swap(values);
	std::vector<uint64_t>().swap(bitmap);
}



/* Pick the smaller representation for the current cardinality */
void
CompressedSet::Container::normalize()
{
	if(isBitmap() && cardinality <= ARRAY_LIMIT) {
		toArray();
	} else if(!isBitmap() && cardinality > ARRAY_LIMIT) {
		toBitmap();
	}
}



void
CompressedSet::Container::append(uint32_t high, std::vector<uint32_t>& out) const
{
	uint32_t base = high << 16;
	if(isBitmap()) {
		for(size_t w = 0; w < BITMAP_WORDS; ++w) {
			uint64_t word = bitmap[w];
			while(word) {
				unsigned bit = __builtin_ctzll(word);
				out.push_back(base | uint32_t(w * 64 + bit));
				word &= word - 1;
			}
		}
	} else {
		for(std::vector<uint16_t>::const_iterator i = array.begin(); i != array.end(); ++i) {
			out.push_back(base | *i);
		}
	}
}



unsigned
popcount(const std::vector<uint64_t>& words)
{
	unsigned n = 0;
	for(std::vector<uint64_t>::const_iterator i = words.begin(); i != words.end(); ++i) {
		n += __builtin_popcountll(*i);
	}
	return n;
}



CompressedSet::Container
CompressedSet::unite(const Container& a, const Container& b)
{
	Container c;
	if(a.isBitmap() || b.isBitmap()) {
		const Container& bm = a.isBitmap() ? a : b;
		const Container& other = a.isBitmap() ? b : a;
		c.bitmap = bm.bitmap;
		if(other.isBitmap()) {
			for(size_t w = 0; w < BITMAP_WORDS; ++w) {
				c.bitmap[w] |= other.bitmap[w];
			}
		} else {
			for(std::vector<uint16_t>::const_iterator i = other.array.begin();
					i != other.array.end(); ++i) {
				c.bitmap[*i >> 6] |= uint64_t(1) << (*i & 0x3f);
			}
		}
		c.cardinality = popcount(c.bitmap);
	} else {
		c.array.reserve(a.array.size() + b.array.size());
		std::set_union(a.array.begin(), a.array.end(),
				b.array.begin(), b.array.end(),
				std::back_inserter(c.array));
		c.cardinality = uint32_t(c.array.size());
	}
	c.normalize();
	return c;
}



CompressedSet::Container
CompressedSet::intersect(const Container& a, const Container& b)
{
	Container c;
	if(a.isBitmap() && b.isBitmap()) {
		c.bitmap.resize(BITMAP_WORDS);
		for(size_t w = 0; w < BITMAP_WORDS; ++w) {
			c.bitmap[w] = a.bitmap[w] & b.bitmap[w];
		}
		c.cardinality = popcount(c.bitmap);
	} else if(a.isBitmap() || b.isBitmap()) {
		const Container& bm = a.isBitmap() ? a : b;
		const Container& arr = a.isBitmap() ? b : a;
		for(std::vector<uint16_t>::const_iterator i = arr.array.begin(); i != arr.array.end(); ++i) {
			if(bm.contains(*i)) {
				c.array.push_back(*i);
			}
		}
		c.cardinality = uint32_t(c.array.size());
	} else {
		std::set_intersection(a.array.begin(), a.array.end(),
				b.array.begin(), b.array.end(),
				std::back_inserter(c.array));
		c.cardinality = uint32_t(c.array.size());
	}
	c.normalize();
	return c;
}



/* Set */


CompressedSet::CompressedSet() :
	m_size(0)
{
	;
}



size_t
CompressedSet::find(uint16_t key) const
{
	std::vector<uint16_t>::const_iterator i = std::lower_bound(m_keys.begin(), m_keys.end(), key);
	if(i != m_keys.end() && *i == key) {
		return size_t(i - m_keys.begin());
	}
	return m_keys.size();
}



bool
CompressedSet::insert(uint32_t value)
{
	uint16_t key = highBits(value);
	std::vector<uint16_t>::iterator i = std::lower_bound(m_keys.begin(), m_keys.end(), key);
	size_t pos = size_t(i - m_keys.begin());
	if(i == m_keys.end() || *i != key) {
		m_keys.insert(i, key);
		m_containers.insert(m_containers.begin() + pos, Container());
	}
	bool inserted = m_containers[pos].insert(lowBits(value));
	if(inserted) {
		m_size += 1;
	}
	return inserted;
}



bool
CompressedSet::erase(uint32_t value)
{
	size_t pos = find(highBits(value));
	if(pos == m_keys.size()) {
		return false;
	}
	bool erased = m_containers[pos].erase(lowBits(value));
	if(erased) {
		m_size -= 1;
		if(m_containers[pos].cardinality == 0) {
			m_keys.erase(m_keys.begin() + pos);
			m_containers.erase(m_containers.begin() + pos);
		}
	}
	return erased;
}



bool
CompressedSet::contains(uint32_t value) const
{
	size_t pos = find(highBits(value));
	return pos != m_keys.size() && m_containers[pos].contains(lowBits(value));
}



void
CompressedSet::clear()
{
	m_keys.clear();
	m_containers.clear();
	m_size = 0;
}



uint32_t
CompressedSet::min() const
{
	if(empty()) {
		throw burst::exception(BURST_LOGIC_ERROR, "min() called on empty compressed set");
	}
	return (uint32_t(m_keys.front()) << 16) | m_containers.front().min();
}



uint32_t
CompressedSet::popMin()
{
	uint32_t value = min();
	erase(value);
	return value;
}



std::vector<uint32_t>
CompressedSet::values() const
{
	std::vector<uint32_t> out;
	out.reserve(m_size);
	for(size_t i = 0; i < m_keys.size(); ++i) {
		m_containers[i].append(m_keys[i], out);
	}
	return out;
}



CompressedSet
CompressedSet::operator|(const CompressedSet& rhs) const
{
	CompressedSet out;
	size_t i = 0, j = 0;
	while(i < m_keys.size() || j < rhs.m_keys.size()) {
		if(j == rhs.m_keys.size() || (i < m_keys.size() && m_keys[i] < rhs.m_keys[j])) {
			out.m_keys.push_back(m_keys[i]);
			out.m_containers.push_back(m_containers[i]);
			++i;
		} else if(i == m_keys.size() || rhs.m_keys[j] < m_keys[i]) {
			out.m_keys.push_back(rhs.m_keys[j]);
			out.m_containers.push_back(rhs.m_containers[j]);
			++j;
		} else {
			out.m_keys.push_back(m_keys[i]);
			out.m_containers.push_back(unite(m_containers[i], rhs.m_containers[j]));
			++i;
			++j;
		}
		out.m_size += out.m_containers.back().cardinality;
	}
	return out;
}



CompressedSet&
CompressedSet::operator|=(const CompressedSet& rhs)
{
	CompressedSet u = *this | rhs;
	std::swap(m_keys, u.m_keys);
	std::swap(m_containers, u.m_containers);
	m_size = u.m_size;
	return *this;
}



CompressedSet
CompressedSet::operator&(const CompressedSet& rhs) const
{
	CompressedSet out;
	size_t i = 0, j = 0;
	while(i < m_keys.size() && j < rhs.m_keys.size()) {
		if(m_keys[i] < rhs.m_keys[j]) {
			++i;
		} else if(rhs.m_keys[j] < m_keys[i]) {
			++j;
		} else {
			Container c = intersect(m_containers[i], rhs.m_containers[j]);
			if(c.cardinality) {
				out.m_keys.push_back(m_keys[i]);
				out.m_containers.push_back(c);
				out.m_size += c.cardinality;
			}
			++i;
			++j;
		}
	}
	return out;
}



bool
CompressedSet::operator==(const CompressedSet& rhs) const
{
	return m_size == rhs.m_size && values() == rhs.values();
}



size_t
CompressedSet::memoryUsage() const
{
	size_t bytes = m_keys.capacity() * sizeof(uint16_t)
		+ m_containers.capacity() * sizeof(Container);
	for(std::vector<Container>::const_iterator i = m_containers.begin();
			i != m_containers.end(); ++i) {
		bytes += i->array.capacity() * sizeof(uint16_t);
		bytes += i->bitmap.capacity() * sizeof(uint64_t);
	}
	return bytes;
}



size_t
CompressedSet::bitmapContainers() const
{
	size_t n = 0;
	for(std::vector<Container>::const_iterator i = m_containers.begin();
			i != m_containers.end(); ++i) {
		n += i->isBitmap() ? 1 : 0;
	}
	return n;
}

} // end namespace burst
