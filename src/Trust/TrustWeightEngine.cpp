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
#include <boost/bind/bind.hpp>
#include <boost/thread/future.hpp>
#include <boost/chrono.hpp>
#include <boost/asio/post.hpp>
#include "TrustWeightEngine.hpp"
#include "Logger.hpp"


TrustWeightEngine::TrustWeightEngine(const std::vector<uint32_t> & n, MetricsSource & s,
        boost::shared_ptr<TrustClassifier> c, const WeightBands & b, RoutingTableHandle & h, unsigned int workers)
        : nodes(n), source(s), classifier(c), bands(b), handle(h), window(30.0), timeout(10.0),
          pool(new boost::asio::thread_pool(workers == 0 ? 1 : workers)), refreshes(0) {
    if (!classifier)
        classifier.reset(new NullClassifier);
    // Every known node starts trusted
    for (std::vector<uint32_t>::const_iterator it = nodes.begin(); it != nodes.end(); ++it) {
        TrustState & st = states[*it];
        st.nodeId = *it;
        st.weight = bands.getDefaultWeight();
        st.lastUpdate = Time::getCurrentTime();
    }
    LogMsg("Trust", INFO) << "Weighting " << nodes.size() << " nodes with " << classifier->getDescription()
            << ", bands " << bands;
}


TrustWeightEngine::~TrustWeightEngine() {
    pool->join();
}


TrustState TrustWeightEngine::evaluate(uint32_t nodeId) {
    Observation raw = source.fetch(nodeId, window);
    if (raw.countMissing() > 0)
        LogMsg("Trust", DEBUG) << "node-" << nodeId << " has " << raw.countMissing() << " missing metrics, using 0.0";
    Observation o = raw.sanitized();

    TrustState s;
    s.nodeId = nodeId;
    s.lastUpdate = Time::getCurrentTime();
    s.prediction = classifier->predict(o.toFeatures());
    s.pFaulty = s.prediction.getFaultyProbability(primaryFault);
    s.weight = bands.getWeight(s.pFaulty);
    s.classified = true;
    LogMsg("Trust", INFO) << "PREDICT (node-" << nodeId << ") P_Faulty(" << (primaryFault.empty() ? "any" : primaryFault.c_str())
            << ")=" << s.pFaulty << " -> weight " << s.weight;
    LogMsg("Trust", DEBUG) << "node-" << nodeId << ' ' << o << ' ' << s.prediction;
    return s;
}


RoutingTableHandle::Ptr TrustWeightEngine::refresh() {
    Time now = Time::getCurrentTime();
    std::map<uint32_t, TrustState> newStates;

    if (!classifier->isAvailable()) {
        for (std::vector<uint32_t>::const_iterator it = nodes.begin(); it != nodes.end(); ++it) {
            TrustState & s = newStates[*it];
            s.nodeId = *it;
            s.weight = bands.getDefaultWeight();
            s.lastUpdate = now;
            s.lastError = classifier->getDescription();
        }
    } else {
        boost::chrono::steady_clock::time_point deadline =
                boost::chrono::steady_clock::now() + boost::chrono::microseconds(timeout.microseconds());
        std::vector<boost::future<TrustState> > pending;
        for (std::vector<uint32_t>::const_iterator it = nodes.begin(); it != nodes.end(); ++it) {
            boost::shared_ptr<boost::packaged_task<TrustState()> > task(
                    new boost::packaged_task<TrustState()>(boost::bind(&TrustWeightEngine::evaluate, this, *it)));
            pending.push_back(task->get_future());
            boost::asio::post(*pool, [task] () { (*task)(); });
        }

        for (std::size_t i = 0; i < nodes.size(); ++i) {
            uint32_t id = nodes[i];
            TrustState s;
            if (pending[i].wait_until(deadline) != boost::future_status::ready) {
                s.lastError = "timeout";
            } else {
                try {
                    s = pending[i].get();
                } catch (std::exception & e) {
                    s.lastError = e.what();
                }
            }
            if (!s.classified) {
                LogMsg("Trust", WARN) << "Could not classify node-" << id << ": " << s.lastError
                        << ", using weight " << bands.getDefaultWeight();
                s.nodeId = id;
                s.weight = bands.getDefaultWeight();
                s.lastUpdate = now;
            }
            newStates[id] = s;
        }
    }

    std::map<uint32_t, double> weights;
    for (std::map<uint32_t, TrustState>::const_iterator it = newStates.begin(); it != newStates.end(); ++it)
        weights[it->first] = it->second.weight;
    RoutingTableHandle::Ptr table(new RoutingTable(weights, !classifier->isAvailable(), now));
    handle.publish(table);
    {
        boost::mutex::scoped_lock lock(mutex);
        states.swap(newStates);
        ++refreshes;
    }
    logSummary(*table);
    return table;
}


void TrustWeightEngine::logSummary(const RoutingTable & table) {
    std::ostringstream weights;
    const std::map<uint32_t, double> & w = table.getWeights();
    for (std::map<uint32_t, double>::const_iterator it = w.begin(); it != w.end(); ++it)
        if (it->second != bands.getDefaultWeight())
            weights << " node-" << it->first << '=' << it->second;
    if (weights.str().empty())
        weights << " none";
    LogMsg("Trust", INFO) << "Refresh: mode " << RoutingTable::getModeName(table.getMode())
            << (table.isDegraded() ? " (degraded)" : "") << ", non-default weights:" << weights.str();
}


std::map<uint32_t, TrustState> TrustWeightEngine::getStates() const {
    boost::mutex::scoped_lock lock(mutex);
    return states;
}


TrustState TrustWeightEngine::getState(uint32_t nodeId) const {
    boost::mutex::scoped_lock lock(mutex);
    std::map<uint32_t, TrustState>::const_iterator it = states.find(nodeId);
    if (it != states.end()) return it->second;
    TrustState s;
    s.nodeId = nodeId;
    s.weight = bands.getDefaultWeight();
    return s;
}


unsigned long TrustWeightEngine::getNumRefreshes() const {
    boost::mutex::scoped_lock lock(mutex);
    return refreshes;
}
