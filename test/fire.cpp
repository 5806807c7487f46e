#include <map>
#include <vector>
#include <boost/test/unit_test.hpp>

#include <burst/FireCandidateList.hpp>
#include <burst/FireLedger.hpp>
#include <burst/FireQueue.hpp>
#include <burst/IdManager.hpp>
#include <burst/exception.hpp>


namespace {

burst::IdManager
smallIds()
{
	std::vector<uint32_t> c(BURST_MODEL_COUNT, 0);
	c[BURST_MODEL_LIF] = 8;
	c[BURST_MODEL_IZHIKEVICH] = 8;
	burst::IdManager ids(c, BURST_ID_LOOKUP_SCAN);
	for(unsigned i = 0; i < 4; ++i) {
		ids.allocate(BURST_MODEL_LIF);
		ids.allocate(BURST_MODEL_IZHIKEVICH);
	}
	return ids;
}


burst::FiringNeuron
firing(nidx_t id, area_t area)
{
	burst::FiringNeuron n;
	n.id = id;
	n.area = area;
	n.potential = 1.0f;
	return n;
}

}



BOOST_AUTO_TEST_SUITE(fire_candidate_list)

BOOST_AUTO_TEST_CASE(accumulate)
{
	burst::IdManager ids = smallIds();
	burst::FireCandidateList fcl(ids);

	fcl.accumulate(2, 1.5f);
	fcl.accumulate(9, 4.0f);
	fcl.accumulate(2, 2.0f);
	fcl.accumulate(BURST_MODEL_IZHIKEVICH, 1, -1.0f);

	BOOST_REQUIRE_EQUAL(fcl.size(), 2U);
	BOOST_REQUIRE_EQUAL(*fcl.get(2), 3.5f);
	BOOST_REQUIRE_EQUAL(*fcl.get(9), 3.0f);
	BOOST_REQUIRE(!fcl.get(3));

	/* only the first sight of an id needs a range lookup */
	BOOST_REQUIRE_EQUAL(fcl.lookups(), 2U);

	BOOST_REQUIRE_EQUAL(fcl.bucket(BURST_MODEL_LIF).size(), 1U);
	BOOST_REQUIRE_EQUAL(fcl.bucket(BURST_MODEL_IZHIKEVICH).local[0], 1U);

	std::vector< std::pair<nidx_t, float> > entries = fcl.entries();
	BOOST_REQUIRE_EQUAL(entries.size(), 2U);
	BOOST_REQUIRE_EQUAL(entries[0].first, 2U);
	BOOST_REQUIRE_EQUAL(entries[1].first, 9U);

	fcl.clear();
	BOOST_REQUIRE(fcl.empty());
	BOOST_REQUIRE(fcl.bucket(BURST_MODEL_IZHIKEVICH).local.empty());
}


BOOST_AUTO_TEST_CASE(zero_contribution)
{
	burst::IdManager ids = smallIds();
	burst::FireCandidateList fcl(ids);
	fcl.accumulate(1, 0.0f);
	BOOST_REQUIRE(fcl.get(1));
	BOOST_REQUIRE_EQUAL(*fcl.get(1), 0.0f);
}


BOOST_AUTO_TEST_CASE(unknown_target)
{
	burst::IdManager ids = smallIds();
	burst::FireCandidateList fcl(ids);
	BOOST_REQUIRE_THROW(fcl.accumulate(100, 1.0f), burst::InvalidReference);
	BOOST_REQUIRE(fcl.empty());
}

BOOST_AUTO_TEST_SUITE_END()



BOOST_AUTO_TEST_SUITE(fire_queue)

BOOST_AUTO_TEST_CASE(ordering)
{
	burst::FireQueue queue;
	queue.reset(3);
	queue.push(firing(1, 0));
	queue.push(firing(4, 2));
	queue.push(firing(9, 0));

	BOOST_REQUIRE_EQUAL(queue.burst(), 3U);
	BOOST_REQUIRE_EQUAL(queue.size(), 3U);
	BOOST_REQUIRE(queue.contains(4));
	BOOST_REQUIRE(!queue.contains(5));
	BOOST_REQUIRE_THROW(queue.push(firing(9, 0)), burst::exception);
	BOOST_REQUIRE_THROW(queue.push(firing(2, 0)), burst::exception);

	std::map<area_t, std::vector<nidx_t> > areas = queue.byArea();
	BOOST_REQUIRE_EQUAL(areas.size(), 2U);
	BOOST_REQUIRE_EQUAL(areas[0].size(), 2U);
	BOOST_REQUIRE_EQUAL(areas[2][0], 4U);

	queue.reset(4);
	BOOST_REQUIRE(queue.empty());
	BOOST_REQUIRE_EQUAL(queue.burst(), 4U);
}



BOOST_AUTO_TEST_CASE(erase)
{
	burst::FireQueue queue;
	queue.reset(1);
	queue.push(firing(1, 0));
	queue.push(firing(4, 2));
	queue.push(firing(9, 0));

	BOOST_REQUIRE(queue.erase(4));
	BOOST_REQUIRE(!queue.erase(4));
	BOOST_REQUIRE(!queue.erase(5));
	BOOST_REQUIRE_EQUAL(queue.size(), 2U);
	BOOST_REQUIRE(!queue.contains(4));
	BOOST_REQUIRE_EQUAL(queue.ids()[1], 9U);

	/* ordering is kept for later pushes */
	queue.push(firing(10, 0));
	BOOST_REQUIRE_THROW(queue.push(firing(4, 0)), burst::exception);
}

BOOST_AUTO_TEST_SUITE_END()



BOOST_AUTO_TEST_SUITE(fire_ledger)

BOOST_AUTO_TEST_CASE(tracking)
{
	burst::FireLedger ledger(4);
	BOOST_REQUIRE_THROW(ledger.track(1, 0), burst::exception);

	ledger.track(1, 10);
	ledger.track(1, 10);
	BOOST_REQUIRE_THROW(ledger.track(1, 20), burst::exception);

	/* the default does not override an explicit window */
	ledger.trackDefault(1);
	ledger.trackDefault(2);
	std::vector< std::pair<area_t, size_t> > windows = ledger.trackedWindows();
	BOOST_REQUIRE_EQUAL(windows.size(), 2U);
	BOOST_REQUIRE_EQUAL(windows[0].second, 10U);
	BOOST_REQUIRE_EQUAL(windows[1].second, 4U);

	ledger.untrack(1);
	BOOST_REQUIRE(!ledger.tracked(1));
	BOOST_REQUIRE(ledger.tracked(2));
	BOOST_REQUIRE_THROW(ledger.history(1), burst::InvalidReference);
}


BOOST_AUTO_TEST_CASE(archive)
{
	burst::FireLedger ledger(3);
	ledger.track(0, 3);
	ledger.track(1, 3);

	burst::FireQueue queue;
	queue.push(firing(1, 0));
	queue.push(firing(5, 1));
	ledger.archive(1, queue);

	queue.reset(2);
	queue.push(firing(2, 0));
	ledger.archive(2, queue);

	BOOST_REQUIRE_THROW(ledger.archive(2, queue), burst::exception);
	BOOST_REQUIRE_EQUAL(ledger.lastTimestep().get(), 2U);

	const burst::FireLedger::frames_t& h0 = ledger.history(0);
	BOOST_REQUIRE_EQUAL(h0.size(), 2U);
	BOOST_REQUIRE(h0[0].fired.contains(1));
	BOOST_REQUIRE(h0[1].fired.contains(2));
	BOOST_REQUIRE(ledger.history(1)[1].fired.empty());

	/* skipped timesteps read back as silent frames */
	queue.reset(9);
	queue.push(firing(3, 0));
	ledger.archive(9, queue);
	const burst::FireLedger::frames_t& h = ledger.history(0);
	BOOST_REQUIRE_EQUAL(h.size(), 3U);
	BOOST_REQUIRE_EQUAL(h[0].timestep, 7U);
	BOOST_REQUIRE_EQUAL(h[2].timestep, 9U);
	BOOST_REQUIRE(h[1].fired.empty());

	std::vector<burst::CompressedSet> w = ledger.denseWindow(0, 9, 2);
	BOOST_REQUIRE_EQUAL(w.size(), 2U);
	BOOST_REQUIRE(w[0].empty());
	BOOST_REQUIRE(w[1].contains(3));

	BOOST_REQUIRE_THROW(ledger.denseWindow(0, 9, 0), burst::exception);
	BOOST_REQUIRE_THROW(ledger.denseWindow(0, 9, 4), burst::exception);
	BOOST_REQUIRE_THROW(ledger.denseWindow(0, 6, 1), burst::exception);
	BOOST_REQUIRE(ledger.memoryUsage() > 0);
}

BOOST_AUTO_TEST_SUITE_END()
