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

#ifndef WINDOWEDMETRICSSTORE_H_
#define WINDOWEDMETRICSSTORE_H_

#include <map>
#include <deque>
#include <boost/thread/mutex.hpp>
#include "MetricsSource.hpp"


/**
 * \brief In-process metrics source.
 *
 * A sample is recorded for every request forwarded to a node, with its real latency and the
 * gauges of the node. An observation aggregates the samples of the last window: average
 * latency, number of errors, average CPU rate and the last memory value. Errors are 5xx
 * responses, answers that did not arrive in time and failures without answer. A node without
 * samples in the window has every metric missing, like a node that Prometheus cannot scrape.
 */
class WindowedMetricsStore : public MetricsSource {
public:
    /**
     * @param retention Samples older than this are discarded. Windows longer than it see
     *        only the retained samples.
     */
    explicit WindowedMetricsStore(Duration retention = Duration(600.0)) : retention(retention) {}

    /**
     * Records the telemetry of a response.
     * @param nodeId ID of the node that answered.
     * @param httpStatus Status code of the response, 0 if it did not arrive in time.
     * @param latency Real latency of the request.
     * @param cpuPercent CPU usage gauge of the node, in percent.
     * @param memory Resident memory gauge of the node, in bytes.
     */
    void record(uint32_t nodeId, unsigned int httpStatus, Duration latency, double cpuPercent, double memory);

    /**
     * Records a request that got no answer at all. It counts as an error and does not
     * contribute to the latency or resource averages.
     */
    void recordFailure(uint32_t nodeId);

    virtual Observation fetch(uint32_t nodeId, Duration window);

    /// Returns the number of samples retained for a node.
    std::size_t getNumSamples(uint32_t nodeId) const;

private:
    struct Sample {
        Time time;
        unsigned int status;
        double latency;
        double cpuRate;
        double memory;
    };

    void add(uint32_t nodeId, const Sample & s);

    void prune(std::deque<Sample> & samples, Time now);

    Duration retention;
    mutable boost::mutex mutex;
    std::map<uint32_t, std::deque<Sample> > samples;
};

#endif /* WINDOWEDMETRICSSTORE_H_ */
