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
#include "WindowedMetricsStore.hpp"
#include "Logger.hpp"


void WindowedMetricsStore::prune(std::deque<Sample> & s, Time now) {
    while (!s.empty() && now - s.front().time > retention)
        s.pop_front();
}


void WindowedMetricsStore::record(uint32_t nodeId, unsigned int httpStatus, Duration latency, double cpuPercent,
        double memory) {
    Sample s;
    s.time = Time::getCurrentTime();
    s.status = httpStatus;
    s.latency = latency.seconds();
    s.cpuRate = cpuPercent / 100.0;
    s.memory = memory;
    add(nodeId, s);
}


void WindowedMetricsStore::recordFailure(uint32_t nodeId) {
    Sample s;
    s.time = Time::getCurrentTime();
    s.status = 0;
    s.latency = s.cpuRate = s.memory = std::numeric_limits<double>::quiet_NaN();
    add(nodeId, s);
}


void WindowedMetricsStore::add(uint32_t nodeId, const Sample & s) {
    boost::mutex::scoped_lock lock(mutex);
    std::deque<Sample> & nodeSamples = samples[nodeId];
    nodeSamples.push_back(s);
    prune(nodeSamples, s.time);
}


Observation WindowedMetricsStore::fetch(uint32_t nodeId, Duration window) {
    Observation o;
    o.nodeId = nodeId;
    Time from = o.timestamp - window;
    double latencySum = 0.0, cpuSum = 0.0, errors = 0.0;
    unsigned int count = 0, answered = 0;
    {
        boost::mutex::scoped_lock lock(mutex);
        std::map<uint32_t, std::deque<Sample> >::iterator it = samples.find(nodeId);
        if (it != samples.end()) {
            prune(it->second, o.timestamp);
            // Samples are sorted by time, walk back until the start of the window
            for (std::deque<Sample>::reverse_iterator s = it->second.rbegin();
                    s != it->second.rend() && s->time >= from; ++s) {
                ++count;
                if (s->status == 0 || s->status >= 500) errors += 1.0;
                if (std::isnan(s->latency)) continue;
                if (answered++ == 0) o.memory = s->memory;
                latencySum += s->latency;
                cpuSum += s->cpuRate;
            }
        }
    }
    if (count > 0)
        o.errors = errors;
    if (answered > 0) {
        o.latency = latencySum / answered;
        o.cpuRate = cpuSum / answered;
    }
    LogMsg("Metrics", DEBUG) << "Window of " << count << " samples: " << o;
    return o;
}


std::size_t WindowedMetricsStore::getNumSamples(uint32_t nodeId) const {
    boost::mutex::scoped_lock lock(mutex);
    std::map<uint32_t, std::deque<Sample> >::const_iterator it = samples.find(nodeId);
    return it == samples.end() ? 0 : it->second.size();
}
