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
#include <stdexcept>
#include <iomanip>
#include <boost/random/uniform_real_distribution.hpp>
#include "Dispatcher.hpp"
#include "Logger.hpp"


void DispatchStatistics::Counters::add(const ForwardResult & r) {
    ++dispatched;
    switch (r.status) {
        case ForwardResult::SUCCESS: ++successes; break;
        case ForwardResult::ERROR_RESPONSE: ++errors; break;
        case ForwardResult::FAILURE: ++failures; break;
        case ForwardResult::TIMEOUT: ++timeouts; break;
    }
    totalLatency += r.latency;
}


namespace {
void printCounters(std::ostream & os, const char * name, const DispatchStatistics::Counters & c) {
    os << std::setw(16) << std::left << name << std::right
       << std::setw(10) << c.dispatched << std::setw(10) << c.successes << std::setw(10) << c.errors
       << std::setw(10) << c.failures << std::setw(10) << c.timeouts << std::setw(12) << std::fixed
       << std::setprecision(3) << (c.dispatched ? c.totalLatency.seconds() / c.dispatched : 0.0) << std::endl;
}
}


std::ostream & operator<<(std::ostream & os, const DispatchStatistics & s) {
    os << std::setw(16) << std::left << "" << std::right << std::setw(10) << "requests" << std::setw(10) << "ok"
       << std::setw(10) << "errors" << std::setw(10) << "failures" << std::setw(10) << "timeouts"
       << std::setw(12) << "avg lat (s)" << std::endl;
    for (std::map<uint32_t, DispatchStatistics::Counters>::const_iterator it = s.nodes.begin(); it != s.nodes.end(); ++it) {
        std::ostringstream name;
        name << "node-" << it->first;
        printCounters(os, name.str().c_str(), it->second);
    }
    printCounters(os, RoutingTable::getModeName(RoutingTable::TRUST_WEIGHTED), s.modes[RoutingTable::TRUST_WEIGHTED]);
    printCounters(os, RoutingTable::getModeName(RoutingTable::ROUND_ROBIN), s.modes[RoutingTable::ROUND_ROBIN]);
    printCounters(os, "total", s.total);
    return os;
}


Dispatcher::Dispatcher(const std::vector<uint32_t> & n, const RoutingTableHandle & h, NodeGateway & g, uint32_t seed)
        : nodes(n), handle(h), gateway(g), gen(seed), nextRoundRobin(0) {
    if (nodes.empty())
        throw std::invalid_argument("a dispatcher needs at least one node");
    for (std::vector<uint32_t>::const_iterator it = nodes.begin(); it != nodes.end(); ++it)
        stats.nodes[*it];
}


Dispatcher::Selection Dispatcher::select() {
    RoutingTableHandle::Ptr table = handle.get();
    Selection s;
    s.mode = table->getMode();
    boost::mutex::scoped_lock lock(mutex);
    if (s.mode == RoutingTable::TRUST_WEIGHTED) {
        double total = 0.0;
        for (std::vector<uint32_t>::const_iterator it = nodes.begin(); it != nodes.end(); ++it)
            total += table->getWeight(*it);
        if (total > 0.0) {
            double r = boost::random::uniform_real_distribution<double>(0.0, total)(gen);
            // Walk the cumulative weights, the last node with weight takes the rounding residue
            s.nodeId = 0;
            for (std::vector<uint32_t>::const_iterator it = nodes.begin(); it != nodes.end(); ++it) {
                double w = table->getWeight(*it);
                if (w <= 0.0) continue;
                s.nodeId = *it;
                if (r < w) break;
                r -= w;
            }
            return s;
        }
        // None of the known nodes has weight
        s.mode = RoutingTable::ROUND_ROBIN;
    }
    s.nodeId = nodes[nextRoundRobin];
    nextRoundRobin = (nextRoundRobin + 1) % nodes.size();
    return s;
}


Dispatcher::Record Dispatcher::dispatch() {
    Record r;
    r.selection = select();
    r.result = gateway.forward(r.selection.nodeId);
    {
        boost::mutex::scoped_lock lock(mutex);
        stats.nodes[r.selection.nodeId].add(r.result);
        stats.modes[r.selection.mode].add(r.result);
        stats.total.add(r.result);
    }
    if (r.result.hasResponse())
        LogMsg("Dsp", INFO) << "ROUTE -> node-" << r.selection.nodeId << " (Strategy: "
                << RoutingTable::getModeName(r.selection.mode) << ") | Status: " << r.result.httpStatus
                << " in " << r.result.latency;
    else
        LogMsg("Dsp", WARN) << "ROUTE -> node-" << r.selection.nodeId << " (Strategy: "
                << RoutingTable::getModeName(r.selection.mode) << ") | FAILURE: "
                << ForwardResult::getStatusName(r.result.status);
    return r;
}


DispatchStatistics Dispatcher::getStatistics() const {
    boost::mutex::scoped_lock lock(mutex);
    return stats;
}
