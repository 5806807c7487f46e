#include <vector>
#include <boost/test/unit_test.hpp>
#include <boost/random.hpp>

#include <burst/CompressedSet.hpp>
#include <burst/IdManager.hpp>
#include <burst/exception.hpp>


BOOST_AUTO_TEST_SUITE(compressed_set)


BOOST_AUTO_TEST_CASE(basic)
{
	burst::CompressedSet set;
	BOOST_REQUIRE(set.empty());
	BOOST_REQUIRE(set.insert(7));
	BOOST_REQUIRE(!set.insert(7));
	BOOST_REQUIRE(set.insert(70000));
	BOOST_REQUIRE(set.insert(3));
	BOOST_REQUIRE_EQUAL(set.size(), 3U);
	BOOST_REQUIRE(set.contains(70000));
	BOOST_REQUIRE(!set.contains(70001));
	BOOST_REQUIRE_EQUAL(set.min(), 3U);

	std::vector<uint32_t> values = set.values();
	BOOST_REQUIRE_EQUAL(values.size(), 3U);
	BOOST_REQUIRE_EQUAL(values[0], 3U);
	BOOST_REQUIRE_EQUAL(values[1], 7U);
	BOOST_REQUIRE_EQUAL(values[2], 70000U);

	BOOST_REQUIRE_EQUAL(set.popMin(), 3U);
	BOOST_REQUIRE(set.erase(70000));
	BOOST_REQUIRE(!set.erase(70000));
	BOOST_REQUIRE_EQUAL(set.size(), 1U);

	set.clear();
	BOOST_REQUIRE(set.empty());
}



/* Dense containers switch to bitmaps and back without losing members */
BOOST_AUTO_TEST_CASE(container_conversion)
{
	const uint32_t count = burst::CompressedSet::ARRAY_LIMIT * 2;

	burst::CompressedSet set;
	for(uint32_t i = 0; i < count; ++i) {
		set.insert(i * 2);
	}
	BOOST_REQUIRE_EQUAL(set.size(), count);
	BOOST_REQUIRE_EQUAL(set.bitmapContainers(), 1U);
	BOOST_REQUIRE(set.memoryUsage() >= 8192);

	for(uint32_t i = 0; i < count; ++i) {
		BOOST_REQUIRE(set.contains(i * 2));
		BOOST_REQUIRE(!set.contains(i * 2 + 1));
	}

	for(uint32_t i = 0; i < count - 10; ++i) {
		BOOST_REQUIRE(set.erase(i * 2));
	}
	BOOST_REQUIRE_EQUAL(set.size(), 10U);
	BOOST_REQUIRE_EQUAL(set.bitmapContainers(), 0U);
	BOOST_REQUIRE_EQUAL(set.min(), (count - 10) * 2);
}



BOOST_AUTO_TEST_CASE(set_operations)
{
	burst::CompressedSet a, b;
	for(uint32_t i = 0; i < 100; ++i) {
		a.insert(i);
		b.insert(i + 50);
	}
	b.insert(1 << 20);

	burst::CompressedSet u = a | b;
	burst::CompressedSet x = a & b;
	BOOST_REQUIRE_EQUAL(u.size(), 151U);
	BOOST_REQUIRE_EQUAL(x.size(), 50U);
	BOOST_REQUIRE(x.contains(50));
	BOOST_REQUIRE(!x.contains(49));
	BOOST_REQUIRE(u.contains(1 << 20));

	a |= b;
	BOOST_REQUIRE(a == u);
	BOOST_REQUIRE(a != x);
}



BOOST_AUTO_TEST_CASE(random_membership)
{
	boost::mt19937 rng(42);
	boost::uniform_int<uint32_t> dist(0, 1 << 22);
	boost::variate_generator<boost::mt19937&, boost::uniform_int<uint32_t> > value(rng, dist);

	burst::CompressedSet set;
	std::vector<uint32_t> inserted;
	for(unsigned i = 0; i < 20000; ++i) {
		uint32_t v = value();
		if(set.insert(v)) {
			inserted.push_back(v);
		}
	}
	BOOST_REQUIRE_EQUAL(set.size(), inserted.size());
	for(std::vector<uint32_t>::const_iterator i = inserted.begin(); i != inserted.end(); ++i) {
		BOOST_REQUIRE(set.contains(*i));
	}

	std::vector<uint32_t> values = set.values();
	for(size_t i = 1; i < values.size(); ++i) {
		BOOST_REQUIRE(values[i-1] < values[i]);
	}
}

BOOST_AUTO_TEST_SUITE_END()



namespace idtest {

std::vector<uint32_t>
ceilings(uint32_t lif, uint32_t izhikevich)
{
	std::vector<uint32_t> c(BURST_MODEL_COUNT, 0);
	c[BURST_MODEL_LIF] = lif;
	c[BURST_MODEL_IZHIKEVICH] = izhikevich;
	return c;
}


void
testAllocation(id_lookup_t lookup)
{
	burst::IdManager ids(ceilings(10, 5), lookup);

	nidx_t l0 = ids.allocate(BURST_MODEL_LIF);
	nidx_t l1 = ids.allocate(BURST_MODEL_LIF);
	nidx_t i0 = ids.allocate(BURST_MODEL_IZHIKEVICH);

	BOOST_REQUIRE_EQUAL(l0, 0U);
	BOOST_REQUIRE_EQUAL(l1, 1U);
	BOOST_REQUIRE_EQUAL(i0, 10U);
	BOOST_REQUIRE_EQUAL(ids.modelType(i0), BURST_MODEL_IZHIKEVICH);
	BOOST_REQUIRE_EQUAL(ids.locate(i0).second, 0U);
	BOOST_REQUIRE_EQUAL(ids.globalIdx(BURST_MODEL_IZHIKEVICH, 0), i0);
	BOOST_REQUIRE_EQUAL(ids.localIdx(BURST_MODEL_LIF, l1), 1U);

	BOOST_REQUIRE(ids.isAllocated(l1));
	BOOST_REQUIRE(!ids.isAllocated(2));
	BOOST_REQUIRE(!ids.isAllocated(11));
	BOOST_REQUIRE(!ids.isAllocated(1000));
	BOOST_REQUIRE_THROW(ids.locate(1000), burst::InvalidReference);

	BOOST_REQUIRE(ids.deallocate(l0));
	BOOST_REQUIRE(!ids.isAllocated(l0));
	BOOST_REQUIRE(!ids.deallocate(l0));
	BOOST_REQUIRE_EQUAL(ids.liveCount(), 2U);
	BOOST_REQUIRE_EQUAL(ids.liveCount(BURST_MODEL_LIF), 1U);

	/* lowest free id is recycled first */
	nidx_t l2 = ids.allocate(BURST_MODEL_LIF);
	BOOST_REQUIRE_EQUAL(l2, l0);
	BOOST_REQUIRE_EQUAL(ids.extent(BURST_MODEL_LIF), 2U);

	for(unsigned i = 1; i < 5; ++i) {
		ids.allocate(BURST_MODEL_IZHIKEVICH);
	}
	BOOST_REQUIRE_THROW(ids.allocate(BURST_MODEL_IZHIKEVICH), burst::CapacityExceeded);

	burst::RangeStats stats = ids.stats(BURST_MODEL_IZHIKEVICH);
	BOOST_REQUIRE_EQUAL(stats.start, 10U);
	BOOST_REQUIRE_EQUAL(stats.extent, 5U);
	BOOST_REQUIRE_EQUAL(stats.ceiling, 5U);
	BOOST_REQUIRE_EQUAL(stats.live, 5U);
	BOOST_REQUIRE_EQUAL(stats.free, 0U);
}

}


BOOST_AUTO_TEST_SUITE(id_manager)

	BOOST_AUTO_TEST_CASE(scan) {
		idtest::testAllocation(BURST_ID_LOOKUP_SCAN);
	}

	BOOST_AUTO_TEST_CASE(table) {
		idtest::testAllocation(BURST_ID_LOOKUP_TABLE);
	}

	BOOST_AUTO_TEST_CASE(id_space_overflow) {
		BOOST_REQUIRE_THROW(
				burst::IdManager(idtest::ceilings(0xffffffff, 0xffffffff), BURST_ID_LOOKUP_SCAN),
				burst::ConfigurationError);
	}

	/* Every id of a freed range is reused before the range grows */
	BOOST_AUTO_TEST_CASE(recycling) {
		burst::IdManager ids(idtest::ceilings(1000, 0), BURST_ID_LOOKUP_SCAN);
		for(unsigned i = 0; i < 1000; ++i) {
			ids.allocate(BURST_MODEL_LIF);
		}
		for(nidx_t n = 0; n < 1000; n += 3) {
			ids.deallocate(n);
		}
		BOOST_REQUIRE_EQUAL(ids.freeSet(BURST_MODEL_LIF).size(), 334U);
		for(nidx_t n = 0; n < 1000; n += 3) {
			BOOST_REQUIRE_EQUAL(ids.allocate(BURST_MODEL_LIF), n);
		}
		BOOST_REQUIRE_EQUAL(ids.extent(BURST_MODEL_LIF), 1000U);
		BOOST_REQUIRE_THROW(ids.allocate(BURST_MODEL_LIF), burst::CapacityExceeded);
	}

BOOST_AUTO_TEST_SUITE_END()
