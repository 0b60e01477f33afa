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
#include <sstream>
#include <stdexcept>
#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include "PrometheusMetricsSource.hpp"
#include "HttpClient.hpp"
#include "Logger.hpp"


namespace {
std::string selector(const char * metric, uint32_t nodeId, const char * extra = "") {
    std::ostringstream oss;
    oss << metric << "{node_id=\"node-" << nodeId << '"' << extra << '}';
    return oss.str();
}

std::string range(Duration window) {
    std::ostringstream oss;
    oss << '[' << (window.microseconds() / 1000000 > 0 ? window.microseconds() / 1000000 : 1) << "s]";
    return oss.str();
}
}


std::string PrometheusMetricsSource::latencyQuery(uint32_t nodeId, Duration window) {
    return "rate(" + selector("request_latency_seconds_sum", nodeId) + range(window) + ") / rate("
           + selector("request_latency_seconds_count", nodeId) + range(window) + ")";
}


std::string PrometheusMetricsSource::errorQuery(uint32_t nodeId, Duration window) {
    return "sum(increase(" + selector("http_requests_total", nodeId, ",status=~\"500|error\"") + range(window) + "))";
}


std::string PrometheusMetricsSource::cpuQuery(uint32_t nodeId, Duration window) {
    return "avg_over_time(" + selector("node_cpu_usage_percent", nodeId) + range(window) + ") / 100";
}


std::string PrometheusMetricsSource::memoryQuery(uint32_t nodeId) {
    return selector("node_memory_bytes", nodeId);
}


double PrometheusMetricsSource::parseResult(const std::string & body) {
    std::string text;
    try {
        nlohmann::json doc = nlohmann::json::parse(body);
        if (doc.value("status", "") != "success")
            throw std::runtime_error("query failed: " + doc.value("error", std::string("unknown error")));
        const nlohmann::json & result = doc.at("data").at("result");
        if (!result.is_array() || result.empty())
            return std::numeric_limits<double>::quiet_NaN();
        // "value": [ <timestamp>, "<value>" ]
        const nlohmann::json & value = result.at(0).at("value");
        if (!value.is_array() || value.size() != 2 || !value[1].is_string())
            throw std::runtime_error("malformed sample in query response");
        text = value[1].get<std::string>();
    } catch (nlohmann::json::exception & e) {
        throw std::runtime_error(std::string("malformed query response: ") + e.what());
    }
    try {
        return boost::lexical_cast<double>(text);
    } catch (boost::bad_lexical_cast &) {
        // Prometheus writes special values as NaN, +Inf and -Inf
        if (text == "+Inf") return std::numeric_limits<double>::infinity();
        if (text == "-Inf") return -std::numeric_limits<double>::infinity();
        return std::numeric_limits<double>::quiet_NaN();
    }
}


double PrometheusMetricsSource::query(const std::string & q) {
    try {
        HttpClient::Reply reply = HttpClient::get(host, port, "/api/v1/query?query=" + HttpClient::urlEncode(q), queryTimeout);
        if (reply.status != 200) {
            LogMsg("Metrics", WARN) << "Query " << q << " returned status " << reply.status;
            return std::numeric_limits<double>::quiet_NaN();
        }
        return parseResult(reply.body);
    } catch (HttpError & e) {
        LogMsg("Metrics", WARN) << "Query " << q << ": " << e.what();
    } catch (std::runtime_error & e) {
        LogMsg("Metrics", WARN) << "Query " << q << ": " << e.what();
    }
    return std::numeric_limits<double>::quiet_NaN();
}


Observation PrometheusMetricsSource::fetch(uint32_t nodeId, Duration window) {
    Observation o;
    o.nodeId = nodeId;
    o.latency = query(latencyQuery(nodeId, window));
    o.errors = query(errorQuery(nodeId, window));
    o.cpuRate = query(cpuQuery(nodeId, window));
    o.memory = query(memoryQuery(nodeId));
    LogMsg("Metrics", DEBUG) << "Fetched " << o;
    return o;
}
