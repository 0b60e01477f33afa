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

#include <boost/test/unit_test.hpp>
#include <boost/thread/thread.hpp>
#include <boost/atomic.hpp>
#include "HttpServer.hpp"
#include "HttpClient.hpp"
#include "PeriodicTask.hpp"
using namespace std;
namespace http = boost::beast::http;


namespace {
void echo(const HttpServer::Request & req, HttpServer::Response & res) {
    res.set(http::field::content_type, "text/plain");
    res.body() = "echo " + HttpServer::getParameter(req, "msg");
}

void fail(const HttpServer::Request &, HttpServer::Response &) {
    throw std::runtime_error("handler failure");
}

void drop(const HttpServer::Request &, HttpServer::Response &) {
    throw HttpServer::AbortConnection();
}

void slow(const HttpServer::Request &, HttpServer::Response & res) {
    boost::this_thread::sleep_for(boost::chrono::milliseconds(500));
    res.body() = "late";
}
}


BOOST_AUTO_TEST_SUITE(Cor)   // Correctness test suite

BOOST_AUTO_TEST_SUITE(Http)


BOOST_AUTO_TEST_CASE(testRequestTarget) {
    HttpServer::Request req(http::verb::get, "/process?node=3&fast", 11);
    BOOST_CHECK_EQUAL(HttpServer::getPath(req), "/process");
    BOOST_CHECK_EQUAL(HttpServer::getParameter(req, "node"), "3");
    BOOST_CHECK_EQUAL(HttpServer::getParameter(req, "fast"), "");
    BOOST_CHECK_EQUAL(HttpServer::getParameter(req, "missing"), "");
    BOOST_CHECK_EQUAL(HttpClient::urlEncode("rate(x[30s])"), "rate%28x%5B30s%5D%29");
}


BOOST_AUTO_TEST_CASE(testRoundTrip) {
    HttpServer server(0, 2);
    server.route("/echo", echo);
    server.route("/fail", fail);
    server.route("/drop", drop);
    server.start();
    uint16_t port = server.getPort();
    BOOST_REQUIRE(port != 0);

    HttpClient::Reply r = HttpClient::get("127.0.0.1", port, "/echo?msg=hello", Duration(2.0));
    BOOST_CHECK_EQUAL(r.status, 200U);
    BOOST_CHECK_EQUAL(r.contentType, "text/plain");
    BOOST_CHECK_EQUAL(r.body, "echo hello");

    r = HttpClient::get("127.0.0.1", port, "/nothing", Duration(2.0));
    BOOST_CHECK_EQUAL(r.status, 404U);

    // Handler exceptions become 500 responses
    r = HttpClient::get("127.0.0.1", port, "/fail", Duration(2.0));
    BOOST_CHECK_EQUAL(r.status, 500U);

    // Aborted connections are failures, not timeouts
    try {
        HttpClient::get("127.0.0.1", port, "/drop", Duration(2.0));
        BOOST_ERROR("Dropped connection returned a response");
    } catch (HttpError & e) {
        BOOST_CHECK(!e.isTimeout());
    }

    server.stop();
}


BOOST_AUTO_TEST_CASE(testTimeout) {
    HttpServer server(0, 1);
    server.route("/slow", slow);
    server.start();
    try {
        HttpClient::get("127.0.0.1", server.getPort(), "/slow", Duration(0.1));
        BOOST_ERROR("Slow request did not time out");
    } catch (HttpError & e) {
        BOOST_CHECK(e.isTimeout());
    }
    server.stop();
}


BOOST_AUTO_TEST_CASE(testIdleClient) {
    HttpServer server(0, 1, Duration(0.2));
    server.route("/echo", echo);
    server.start();

    // A client that connects and never sends its request
    boost::asio::io_context io;
    boost::asio::ip::tcp::socket idle(io);
    idle.connect(boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), server.getPort()));

    // The only worker gets free again after the read timeout
    HttpClient::Reply r = HttpClient::get("127.0.0.1", server.getPort(), "/echo?msg=next", Duration(2.0));
    BOOST_CHECK_EQUAL(r.body, "echo next");

    idle.close();
    boost::asio::ip::tcp::socket other(io);
    other.connect(boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), server.getPort()));
    // Let the worker pick it up before stopping
    boost::this_thread::sleep_for(boost::chrono::milliseconds(50));
    Time start = Time::getWallClockTime();
    server.stop();
    BOOST_CHECK_LT(Time::getWallClockTime() - start, Duration(2.0));
}


BOOST_AUTO_TEST_CASE(testConnectionRefused) {
    // Grab a free port and release it
    uint16_t port;
    {
        HttpServer server(0, 1);
        server.start();
        port = server.getPort();
        server.stop();
    }
    BOOST_CHECK_THROW(HttpClient::get("127.0.0.1", port, "/", Duration(1.0)), HttpError);
}


namespace {
boost::atomic<int> counter(0);

void countRun() {
    ++counter;
}

void throwingRun() {
    ++counter;
    throw std::runtime_error("periodic failure");
}
}


BOOST_AUTO_TEST_CASE(testPeriodicTask) {
    counter = 0;
    PeriodicTask task("count", Duration(0.05), countRun);
    BOOST_CHECK(!task.isRunning());
    task.start();
    BOOST_CHECK(task.isRunning());
    boost::this_thread::sleep_for(boost::chrono::milliseconds(275));
    task.stop();
    BOOST_CHECK(!task.isRunning());
    int runs = counter.load();
    // First run is immediate
    BOOST_CHECK_GE(runs, 3);
    BOOST_CHECK_LE(runs, 7);
    BOOST_CHECK_EQUAL(task.getNumRuns(), (unsigned long)runs);
    boost::this_thread::sleep_for(boost::chrono::milliseconds(100));
    BOOST_CHECK_EQUAL(counter.load(), runs);
}


BOOST_AUTO_TEST_CASE(testPeriodicTaskRunsWhileRead) {
    counter = 0;
    PeriodicTask task("polled", Duration(0.01), countRun);
    task.start();
    unsigned long last = 0;
    Time deadline = Time::getWallClockTime() + Duration(2.0);
    // Polled from this thread while the task thread updates it
    while (last < 5 && Time::getWallClockTime() < deadline) {
        unsigned long now = task.getNumRuns();
        BOOST_CHECK_GE(now, last);
        last = now;
    }
    task.stop();
    BOOST_CHECK_GE(last, 5U);
    BOOST_CHECK_EQUAL(task.getNumRuns(), (unsigned long)counter.load());
}


BOOST_AUTO_TEST_CASE(testPeriodicTaskSurvivesExceptions) {
    counter = 0;
    PeriodicTask task("throwing", Duration(0.02), throwingRun);
    task.start();
    boost::this_thread::sleep_for(boost::chrono::milliseconds(150));
    task.stop();
    BOOST_CHECK_GE(counter.load(), 2);
}

BOOST_AUTO_TEST_SUITE_END()   // Http

BOOST_AUTO_TEST_SUITE_END()   // Cor
