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

#include <sstream>
#include <boost/test/unit_test.hpp>
#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include "NodeService.hpp"
#include "FaultEngine.hpp"
#include "HttpClient.hpp"
#include "WorkloadEnvironment.hpp"
#include "TestHost.hpp"
using namespace std;
namespace http = boost::beast::http;
using nlohmann::json;


namespace {
// Seconds in a processed_in field, like "0.052s"
double processedIn(const json & doc) {
    string text = doc.at("processed_in").get<string>();
    BOOST_REQUIRE(!text.empty() && text[text.size() - 1] == 's');
    return boost::lexical_cast<double>(text.substr(0, text.size() - 1));
}

// Value of a sample in the exposition format
double exposedValue(const string & exposition, const string & series) {
    istringstream iss(exposition);
    string line;
    while (getline(iss, line))
        if (line.compare(0, series.size() + 1, series + " ") == 0)
            return boost::lexical_cast<double>(line.substr(series.size() + 1));
    BOOST_FAIL("series " + series + " not exposed");
    return 0.0;
}

MetricsRegistry::Labels statusLabels(const string & node, const string & status) {
    MetricsRegistry::Labels l;
    l.push_back(make_pair("node_id", node));
    l.push_back(make_pair("status", status));
    return l;
}
}


BOOST_AUTO_TEST_SUITE(Cor)   // Correctness test suite

BOOST_AUTO_TEST_SUITE(Node)


BOOST_AUTO_TEST_CASE(testProcessAndHealth) {
    TestHost::getInstance().reset();
    SimulatedEnvironment env;
    FaultEngine e(7, FaultClass::BENIGN, env);
    NodeService s(e, 0, 1);
    HttpServer::Request req(http::verb::get, "/process", 11);

    for (int i = 1; i <= 5; ++i) {
        HttpServer::Response res(http::status::ok, 11);
        s.handleProcess(req, res);
        BOOST_CHECK_EQUAL(res.result_int(), 200U);
        json doc = json::parse(res.body());
        BOOST_CHECK_EQUAL(doc.at("node").get<string>(), "node-7");
        BOOST_CHECK_EQUAL(doc.at("status").get<string>(), "ok");
        BOOST_CHECK_EQUAL(doc.at("request_num").get<int>(), i);
        BOOST_CHECK_GT(doc.at("load_factor").get<double>(), 0.0);
        BOOST_CHECK_GE(processedIn(doc), 0.0);
    }

    TestHost::getInstance().advance(Duration(12.5));
    HttpServer::Response res(http::status::ok, 11);
    s.handleHealth(req, res);
    json doc = json::parse(res.body());
    BOOST_CHECK_EQUAL(doc.at("node").get<string>(), "node-7");
    BOOST_CHECK_EQUAL(doc.at("status").get<string>(), "alive");
    BOOST_CHECK_EQUAL(doc.at("fault_type").get<string>(), "benign");
    BOOST_CHECK_EQUAL(doc.at("total_requests").get<int>(), 5);
    BOOST_CHECK_CLOSE(doc.at("uptime_seconds").get<double>(), 12.5, 1e-6);

    const MetricsRegistry & m = s.getMetrics();
    BOOST_CHECK_EQUAL(m.getValue("http_requests_total", statusLabels("node-7", "success")), 5.0);
    BOOST_CHECK_EQUAL(m.getValue("http_requests_total", statusLabels("node-7", "500")), 0.0);
    BOOST_CHECK_EQUAL(m.getValue("request_latency_seconds",
            MetricsRegistry::Labels(1, make_pair(string("node_id"), string("node-7")))), 5.0);
}


BOOST_AUTO_TEST_CASE(testErrorResponses) {
    TestHost::getInstance().reset();
    SimulatedEnvironment env;
    FaultEngine e(8, FaultClass::ERROR_500, env);
    NodeService s(e, 0, 1);
    HttpServer::Request req(http::verb::get, "/process", 11);
    unsigned int errors = 0, successes = 0;
    for (int i = 0; i < 100; ++i) {
        HttpServer::Response res(http::status::ok, 11);
        s.handleProcess(req, res);
        if (res.result() == http::status::internal_server_error) {
            ++errors;
            BOOST_CHECK_EQUAL(res.body(), NodeService::errorBody);
        } else {
            ++successes;
            BOOST_CHECK_EQUAL(res.result_int(), 200U);
        }
    }
    BOOST_CHECK_GT(errors, 0U);
    const MetricsRegistry & m = s.getMetrics();
    BOOST_CHECK_EQUAL(m.getValue("http_requests_total", statusLabels("node-8", "500")), (double)errors);
    BOOST_CHECK_EQUAL(m.getValue("http_requests_total", statusLabels("node-8", "success")), (double)successes);

    HttpServer::Response res(http::status::ok, 11);
    s.handleMetrics(req, res);
    BOOST_CHECK(res.body().find("http_requests_total{node_id=\"node-8\",status=\"500\"}") != string::npos);
    BOOST_CHECK(res.body().find("# TYPE request_latency_seconds histogram") != string::npos);
    BOOST_CHECK(res.body().find("node_cpu_usage_percent{node_id=\"node-8\"}") != string::npos);
    BOOST_CHECK(res.body().find("node_memory_bytes{node_id=\"node-8\"}") != string::npos);
}


BOOST_AUTO_TEST_CASE(testCrashTerminates) {
    TestHost::getInstance().reset();
    SimulatedEnvironment env;
    FaultEngine e(9, FaultClass::CRASH, env);
    NodeService s(e, 0, 1);
    HttpServer::Request req(http::verb::get, "/process", 11);
    TestHost::getInstance().advance(Duration(300.0));
    bool aborted = false;
    for (int i = 0; i < 50000 && !aborted; ++i) {
        HttpServer::Response res(http::status::ok, 11);
        try {
            s.handleProcess(req, res);
        } catch (HttpServer::AbortConnection &) {
            aborted = true;
        }
    }
    BOOST_REQUIRE(aborted);
    BOOST_CHECK(s.waitForTermination());
    BOOST_CHECK_EQUAL(s.getMetrics().getValue("http_requests_total", statusLabels("node-9", "error")), 1.0);

    HttpServer::Response res(http::status::ok, 11);
    s.handleHealth(req, res);
    BOOST_CHECK_EQUAL(json::parse(res.body()).at("status").get<string>(), "crashed");
}


BOOST_AUTO_TEST_CASE(testLyingNodeTelemetry) {
    TestHost::getInstance().reset();
    SimulatedEnvironment env;
    FaultEngine e(11, FaultClass::LIE_LATENCY, env);
    NodeService s(e, 0, 1);
    HttpServer::Request req(http::verb::get, "/process", 11);
    double reported = 0.0;
    for (int i = 0; i < 50; ++i) {
        HttpServer::Response res(http::status::ok, 11);
        s.handleProcess(req, res);
        BOOST_REQUIRE_EQUAL(res.result_int(), 200U);
        double seconds = processedIn(json::parse(res.body()));
        BOOST_CHECK_LT(seconds, 1.0);
        reported += seconds;
    }

    // The body hides the extra work, the histogram does not
    HttpServer::Response res(http::status::ok, 11);
    s.handleMetrics(req, res);
    double observed = exposedValue(res.body(), "request_latency_seconds_sum{node_id=\"node-11\"}");
    BOOST_CHECK_GT(observed, reported + 3.0 * 20);
}


BOOST_AUTO_TEST_CASE(testProcessBodyEscaping) {
    RequestOutcome r;
    r.reportedLatency = Duration(0.0521);
    r.loadFactor = 1.25;
    r.requestNum = 3;
    json doc = json::parse(NodeService::processBody("node \"quoted\"\\1", r).dump());
    BOOST_CHECK_EQUAL(doc.at("node").get<string>(), "node \"quoted\"\\1");
    BOOST_CHECK_EQUAL(doc.at("processed_in").get<string>(), "0.052s");
    BOOST_CHECK_EQUAL(doc.at("load_factor").get<double>(), 1.25);
    BOOST_CHECK_EQUAL(doc.at("request_num").get<unsigned long>(), 3UL);
}


BOOST_AUTO_TEST_CASE(testServedOverHttp) {
    TestHost::getInstance().reset();
    SimulatedEnvironment env;
    FaultEngine e(10, FaultClass::BENIGN, env);
    NodeService s(e, 0, 2);
    s.start();
    HttpClient::Reply r = HttpClient::get("127.0.0.1", s.getPort(), "/process", Duration(2.0));
    BOOST_CHECK_EQUAL(r.status, 200U);
    BOOST_CHECK_EQUAL(r.contentType, "application/json");
    r = HttpClient::get("127.0.0.1", s.getPort(), "/metrics", Duration(2.0));
    BOOST_CHECK_EQUAL(r.status, 200U);
    BOOST_CHECK(r.body.find("http_requests_total{node_id=\"node-10\",status=\"success\"} 1") != string::npos);
    s.requestShutdown();
    BOOST_CHECK(!s.waitForTermination());
    s.stop();
}

BOOST_AUTO_TEST_SUITE_END()   // Node

BOOST_AUTO_TEST_SUITE_END()   // Cor
