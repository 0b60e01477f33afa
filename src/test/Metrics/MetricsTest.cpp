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

#include <cmath>
#include <limits>
#include <boost/test/unit_test.hpp>
#include "MetricsRegistry.hpp"
#include "MetricsSource.hpp"
#include "WindowedMetricsStore.hpp"
#include "PrometheusMetricsSource.hpp"
#include "TestHost.hpp"
using namespace std;


namespace {
MetricsRegistry::Labels node(const string & id) {
    return MetricsRegistry::Labels(1, make_pair(string("node_id"), id));
}
}


BOOST_AUTO_TEST_SUITE(Cor)   // Correctness test suite

BOOST_AUTO_TEST_SUITE(Metrics)


BOOST_AUTO_TEST_CASE(testRegistryExposition) {
    MetricsRegistry m;
    m.declare("requests_total", MetricsRegistry::COUNTER, "Total requests");
    m.declare("cpu_percent", MetricsRegistry::GAUGE, "CPU usage");
    vector<double> buckets;
    buckets.push_back(0.1);
    buckets.push_back(1.0);
    m.declare("latency_seconds", MetricsRegistry::HISTOGRAM, "Latency", buckets);

    m.increment("requests_total", node("node-1"));
    m.increment("requests_total", node("node-1"), 2.0);
    m.set("cpu_percent", node("node-1"), 35.5);
    m.set("cpu_percent", node("node-1"), 42.0);
    m.observe("latency_seconds", node("node-1"), 0.05);
    m.observe("latency_seconds", node("node-1"), 0.5);
    m.observe("latency_seconds", node("node-1"), 7.0);

    BOOST_CHECK_EQUAL(m.getValue("requests_total", node("node-1")), 3.0);
    BOOST_CHECK_EQUAL(m.getValue("cpu_percent", node("node-1")), 42.0);
    BOOST_CHECK_EQUAL(m.getValue("latency_seconds", node("node-1")), 3.0);
    BOOST_CHECK_EQUAL(m.getValue("requests_total", node("node-2")), 0.0);

    string text = m.expose();
    BOOST_TEST_MESSAGE(text);
    BOOST_CHECK(text.find("# HELP requests_total Total requests\n# TYPE requests_total counter\n") != string::npos);
    BOOST_CHECK(text.find("requests_total{node_id=\"node-1\"} 3\n") != string::npos);
    BOOST_CHECK(text.find("cpu_percent{node_id=\"node-1\"} 42\n") != string::npos);
    BOOST_CHECK(text.find("latency_seconds_bucket{node_id=\"node-1\",le=\"0.1\"} 1\n") != string::npos);
    BOOST_CHECK(text.find("latency_seconds_bucket{node_id=\"node-1\",le=\"1\"} 2\n") != string::npos);
    BOOST_CHECK(text.find("latency_seconds_bucket{node_id=\"node-1\",le=\"+Inf\"} 3\n") != string::npos);
    BOOST_CHECK(text.find("latency_seconds_count{node_id=\"node-1\"} 3\n") != string::npos);
    BOOST_CHECK(text.find("latency_seconds_sum{node_id=\"node-1\"} 7.55\n") != string::npos);
}


BOOST_AUTO_TEST_CASE(testRegistryMisuse) {
    MetricsRegistry m;
    m.declare("cpu_percent", MetricsRegistry::GAUGE, "CPU usage");
    BOOST_CHECK_THROW(m.increment("cpu_percent", node("node-1")), std::logic_error);
    BOOST_CHECK_THROW(m.set("undeclared", node("node-1"), 1.0), std::logic_error);
}


BOOST_AUTO_TEST_CASE(testObservation) {
    Observation o;
    BOOST_CHECK_EQUAL(o.countMissing(), 4U);
    o.latency = 0.25;
    o.errors = 3.0;
    o.cpuRate = std::numeric_limits<double>::infinity();
    BOOST_CHECK_EQUAL(o.countMissing(), 1U);

    Observation s = o.sanitized();
    BOOST_CHECK_EQUAL(s.countMissing(), 0U);
    BOOST_CHECK_EQUAL(s.cpuRate, 0.0);
    BOOST_CHECK_EQUAL(s.memory, 0.0);

    s.memory = 64.0 * 1024.0 * 1024.0;
    vector<double> f = s.toFeatures();
    BOOST_REQUIRE_EQUAL(f.size(), (size_t)Observation::numFeatures);
    BOOST_CHECK_CLOSE(f[0], 250.0, 1e-9);   // ms
    BOOST_CHECK_CLOSE(f[1], 3.0, 1e-9);
    BOOST_CHECK_EQUAL(f[2], 0.0);
    BOOST_CHECK_CLOSE(f[3], 64.0, 1e-9);    // MB
}


BOOST_AUTO_TEST_CASE(testWindowedStore) {
    TestHost::getInstance().reset();
    WindowedMetricsStore store(Duration(120.0));

    // Nothing recorded yet
    Observation o = store.fetch(1, Duration(30.0));
    BOOST_CHECK_EQUAL(o.nodeId, 1U);
    BOOST_CHECK_EQUAL(o.countMissing(), 4U);

    // Old samples fall out of the window
    store.record(1, 500, Duration(2.0), 90.0, 100.0);
    TestHost::getInstance().advance(Duration(60.0));
    store.record(1, 200, Duration(0.1), 20.0, 200.0);
    store.record(1, 500, Duration(0.3), 40.0, 300.0);
    store.record(2, 200, Duration(1.0), 50.0, 400.0);
    TestHost::getInstance().advance(Duration(5.0));

    o = store.fetch(1, Duration(30.0));
    BOOST_CHECK_EQUAL(o.countMissing(), 0U);
    BOOST_CHECK_CLOSE(o.latency, 0.2, 1e-9);
    BOOST_CHECK_EQUAL(o.errors, 1.0);
    BOOST_CHECK_CLOSE(o.cpuRate, 0.3, 1e-9);
    BOOST_CHECK_EQUAL(o.memory, 300.0);

    o = store.fetch(1, Duration(90.0));
    BOOST_CHECK_EQUAL(o.errors, 2.0);
    BOOST_CHECK_CLOSE(o.latency, 0.8, 1e-9);

    // Retention drops samples for good
    BOOST_CHECK_EQUAL(store.getNumSamples(1), 3U);
    TestHost::getInstance().advance(Duration(200.0));
    store.fetch(1, Duration(30.0));
    BOOST_CHECK_EQUAL(store.getNumSamples(1), 0U);
    BOOST_CHECK_EQUAL(store.getNumSamples(3), 0U);
}


BOOST_AUTO_TEST_CASE(testWindowedStoreFailures) {
    TestHost::getInstance().reset();
    WindowedMetricsStore store;

    // A node that only fails has errors and nothing else
    store.recordFailure(1);
    store.recordFailure(1);
    Observation o = store.fetch(1, Duration(30.0));
    BOOST_CHECK_EQUAL(o.errors, 2.0);
    BOOST_CHECK(std::isnan(o.latency));
    BOOST_CHECK(std::isnan(o.cpuRate));
    BOOST_CHECK(std::isnan(o.memory));

    // Late answers count as errors but keep their latency
    store.record(2, 200, Duration(0.5), 20.0, 100.0);
    store.record(2, 0, Duration(6.5), 60.0, 200.0);
    store.recordFailure(2);
    o = store.fetch(2, Duration(30.0));
    BOOST_CHECK_EQUAL(o.errors, 2.0);
    BOOST_CHECK_CLOSE(o.latency, 3.5, 1e-9);
    BOOST_CHECK_CLOSE(o.cpuRate, 0.4, 1e-9);
    BOOST_CHECK_EQUAL(o.memory, 200.0);
    BOOST_CHECK_EQUAL(store.getNumSamples(2), 3U);
}


BOOST_AUTO_TEST_CASE(testPrometheusQueries) {
    string q = PrometheusMetricsSource::latencyQuery(3, Duration(30.0));
    BOOST_CHECK_EQUAL(q, "rate(request_latency_seconds_sum{node_id=\"node-3\"}[30s]) / "
            "rate(request_latency_seconds_count{node_id=\"node-3\"}[30s])");
    // Crashes are counted with status "error"
    BOOST_CHECK_EQUAL(PrometheusMetricsSource::errorQuery(3, Duration(30.0)),
            "sum(increase(http_requests_total{node_id=\"node-3\",status=~\"500|error\"}[30s]))");
    BOOST_CHECK(PrometheusMetricsSource::cpuQuery(3, Duration(30.0)).find("node_cpu_usage_percent{node_id=\"node-3\"}[30s]") != string::npos);
    BOOST_CHECK_EQUAL(PrometheusMetricsSource::memoryQuery(3), "node_memory_bytes{node_id=\"node-3\"}");
}


BOOST_AUTO_TEST_CASE(testPrometheusResults) {
    BOOST_CHECK_CLOSE(PrometheusMetricsSource::parseResult(
            "{\"status\":\"success\",\"data\":{\"resultType\":\"vector\",\"result\":"
            "[{\"metric\":{\"node_id\":\"node-1\"},\"value\":[1700000000.123,\"0.0421\"]}]}}"), 0.0421, 1e-9);
    BOOST_CHECK(std::isnan(PrometheusMetricsSource::parseResult(
            "{\"status\":\"success\",\"data\":{\"resultType\":\"vector\",\"result\":[]}}")));
    BOOST_CHECK(std::isnan(PrometheusMetricsSource::parseResult(
            "{\"status\":\"success\",\"data\":{\"resultType\":\"vector\",\"result\":"
            "[{\"metric\":{},\"value\":[1700000000,\"NaN\"]}]}}")));
    BOOST_CHECK(std::isinf(PrometheusMetricsSource::parseResult(
            "{\"status\":\"success\",\"data\":{\"resultType\":\"vector\",\"result\":"
            "[{\"metric\":{},\"value\":[1700000000,\"+Inf\"]}]}}")));
    BOOST_CHECK_THROW(PrometheusMetricsSource::parseResult(
            "{\"status\":\"error\",\"errorType\":\"bad_data\",\"error\":\"parse error\"}"), std::runtime_error);
    BOOST_CHECK_THROW(PrometheusMetricsSource::parseResult("<html>"), std::runtime_error);
    BOOST_CHECK_THROW(PrometheusMetricsSource::parseResult("{\"status\":\"success\"}"), std::runtime_error);
    BOOST_CHECK_THROW(PrometheusMetricsSource::parseResult(
            "{\"status\":\"success\",\"data\":{\"resultType\":\"vector\",\"result\":"
            "[{\"metric\":{},\"value\":[1700000000]}]}}"), std::runtime_error);
}


BOOST_AUTO_TEST_CASE(testPrometheusUnreachable) {
    // Nothing listens on port 1, every metric is missing
    PrometheusMetricsSource source("127.0.0.1", 1, Duration(0.5));
    Observation o = source.fetch(2, Duration(30.0));
    BOOST_CHECK_EQUAL(o.nodeId, 2U);
    BOOST_CHECK_EQUAL(o.countMissing(), 4U);
}

BOOST_AUTO_TEST_SUITE_END()   // Metrics

BOOST_AUTO_TEST_SUITE_END()   // Cor
