/*
 *  TrustLB, trust-weighted load balancing testbed
 *  Copyright (C) 2026 TrustLB developers
 *
 *  This file is part of TrustLB.
 *
 *  TrustLB is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation; either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  TrustLB is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with TrustLB; if not, see <http://www.gnu.org/licenses/>.
 */

#include <stdexcept>
#include <boost/test/unit_test.hpp>
#include <boost/thread/thread.hpp>
#include "TrustWeightEngine.hpp"
#include "TrustClassifier.hpp"
#include "MetricsSource.hpp"
#include "TestHost.hpp"
using namespace std;


namespace {
// Node i reports i errors, node 4 has no telemetry, node 5 fails, node 6 is slow
class FakeSource : public MetricsSource {
public:
    FakeSource() : slowNode(6) {}

    virtual Observation fetch(uint32_t nodeId, Duration window) {
        Observation o;
        o.nodeId = nodeId;
        if (nodeId == 5)
            throw std::runtime_error("metrics backend failure");
        if (nodeId == (uint32_t)slowNode)
            boost::this_thread::sleep_for(boost::chrono::milliseconds(400));
        if (nodeId != 4) {
            o.latency = 0.02;
            o.errors = nodeId;
            o.cpuRate = 0.3;
            o.memory = 50e6;
        }
        return o;
    }

    int slowNode;
};


// Faulty probability is the error count over 10
class FakeClassifier : public TrustClassifier {
public:
    virtual bool isAvailable() const {
        return true;
    }

    virtual Prediction predict(const vector<double> & features) const {
        Prediction p;
        double faulty = features[1] / 10.0;
        p.labels.push_back("benign");
        p.labels.push_back("error-500");
        p.probabilities.push_back(1.0 - faulty);
        p.probabilities.push_back(faulty);
        return p;
    }

    virtual string getDescription() const {
        return "fake classifier";
    }
};


vector<uint32_t> nodeIds(uint32_t n) {
    vector<uint32_t> result;
    for (uint32_t i = 1; i <= n; ++i)
        result.push_back(i);
    return result;
}
}


BOOST_AUTO_TEST_SUITE(Cor)   // Correctness test suite

BOOST_AUTO_TEST_SUITE(Trust)


BOOST_AUTO_TEST_CASE(testRefreshWeights) {
    TestHost::getInstance().reset();
    FakeSource source;
    source.slowNode = 0;
    RoutingTableHandle handle;
    TrustWeightEngine engine(nodeIds(9), source, boost::shared_ptr<TrustClassifier>(new FakeClassifier),
            WeightBands(), handle, 4);
    BOOST_CHECK(!engine.isDegraded());
    // Before the first refresh the table is empty
    BOOST_CHECK(handle.get()->empty());
    BOOST_CHECK_EQUAL(handle.get()->getMode(), RoutingTable::ROUND_ROBIN);

    RoutingTableHandle::Ptr table = engine.refresh();
    BOOST_CHECK(table == handle.get());
    BOOST_CHECK_EQUAL(table->getMode(), RoutingTable::TRUST_WEIGHTED);
    BOOST_CHECK_EQUAL(table->getWeights().size(), 9U);
    BOOST_CHECK_EQUAL(engine.getNumRefreshes(), 1U);

    // p = 0.1, 0.2, 0.3
    BOOST_CHECK_EQUAL(table->getWeight(1), 1.0);
    BOOST_CHECK_EQUAL(table->getWeight(2), 0.5);
    BOOST_CHECK_EQUAL(table->getWeight(3), 0.5);
    // Missing metrics count as zeros, p = 0
    BOOST_CHECK_EQUAL(table->getWeight(4), 1.0);
    BOOST_CHECK(engine.getState(4).classified);
    // A failing node gets the default weight without affecting the rest
    BOOST_CHECK_EQUAL(table->getWeight(5), 1.0);
    BOOST_CHECK(!engine.getState(5).classified);
    BOOST_CHECK_EQUAL(engine.getState(5).lastError, "metrics backend failure");
    // p = 0.6 and over
    for (uint32_t i = 6; i <= 9; ++i)
        BOOST_CHECK_EQUAL(table->getWeight(i), 0.1);

    TrustState s = engine.getState(8);
    BOOST_CHECK(s.classified);
    BOOST_CHECK_CLOSE(s.pFaulty, 0.8, 1e-9);
    BOOST_CHECK_EQUAL(s.prediction.getMostLikely(), "error-500");
    BOOST_CHECK_EQUAL(s.lastUpdate, TestHost::getInstance().getCurrentTime());
}


BOOST_AUTO_TEST_CASE(testPrimaryFault) {
    TestHost::getInstance().reset();
    FakeSource source;
    source.slowNode = 0;
    RoutingTableHandle handle;
    TrustWeightEngine engine(nodeIds(3), source, boost::shared_ptr<TrustClassifier>(new FakeClassifier),
            WeightBands(), handle);
    // A class the model does not know never makes a node faulty
    engine.setPrimaryFault("delay");
    RoutingTableHandle::Ptr table = engine.refresh();
    for (uint32_t i = 1; i <= 3; ++i)
        BOOST_CHECK_EQUAL(table->getWeight(i), 1.0);
    engine.setPrimaryFault("500-error");
    table = engine.refresh();
    BOOST_CHECK_EQUAL(table->getWeight(2), 0.5);
}


BOOST_AUTO_TEST_CASE(testSlowNodeTimesOut) {
    TestHost::getInstance().reset();
    FakeSource source;
    RoutingTableHandle handle;
    TrustWeightEngine engine(nodeIds(7), source, boost::shared_ptr<TrustClassifier>(new FakeClassifier),
            WeightBands(), handle, 7);
    engine.setTimeout(Duration(0.1));
    RoutingTableHandle::Ptr table = engine.refresh();
    BOOST_CHECK_EQUAL(table->getWeight(6), 1.0);
    BOOST_CHECK_EQUAL(engine.getState(6).lastError, "timeout");
    BOOST_CHECK_EQUAL(table->getWeight(7), 0.1);
    BOOST_CHECK_EQUAL(table->getMode(), RoutingTable::TRUST_WEIGHTED);
}


BOOST_AUTO_TEST_CASE(testDegradedMode) {
    TestHost::getInstance().reset();
    FakeSource source;
    RoutingTableHandle handle;
    TrustWeightEngine engine(nodeIds(9), source, boost::shared_ptr<TrustClassifier>(new NullClassifier),
            WeightBands(), handle);
    BOOST_CHECK(engine.isDegraded());
    RoutingTableHandle::Ptr table = engine.refresh();
    BOOST_CHECK(table->isDegraded());
    BOOST_CHECK_EQUAL(table->getMode(), RoutingTable::ROUND_ROBIN);
    for (uint32_t i = 1; i <= 9; ++i) {
        BOOST_CHECK_EQUAL(table->getWeight(i), 1.0);
        BOOST_CHECK(!engine.getState(i).classified);
    }

    // No classifier at all behaves the same
    TrustWeightEngine none(nodeIds(2), source, boost::shared_ptr<TrustClassifier>(), WeightBands(), handle);
    BOOST_CHECK(none.isDegraded());
    BOOST_CHECK(none.refresh()->isDegraded());
}


BOOST_AUTO_TEST_CASE(testRoutingTable) {
    map<uint32_t, double> w;
    BOOST_CHECK_EQUAL(RoutingTable(w, false, Time()).getMode(), RoutingTable::ROUND_ROBIN);
    w[1] = 0.0;
    w[2] = 0.0;
    BOOST_CHECK_EQUAL(RoutingTable(w, false, Time()).getMode(), RoutingTable::ROUND_ROBIN);
    w[2] = 0.1;
    RoutingTable t(w, false, Time());
    BOOST_CHECK_EQUAL(t.getMode(), RoutingTable::TRUST_WEIGHTED);
    BOOST_CHECK_CLOSE(t.getTotalWeight(), 0.1, 1e-9);
    BOOST_CHECK_EQUAL(t.getWeight(3), 0.0);
    BOOST_CHECK_EQUAL(RoutingTable(w, true, Time()).getMode(), RoutingTable::ROUND_ROBIN);
    BOOST_CHECK_EQUAL(string(RoutingTable::getModeName(RoutingTable::TRUST_WEIGHTED)), "trust-weighted");
}

BOOST_AUTO_TEST_SUITE_END()   // Trust

BOOST_AUTO_TEST_SUITE_END()   // Cor
