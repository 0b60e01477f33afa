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

#ifndef PROMETHEUSMETRICSSOURCE_H_
#define PROMETHEUSMETRICSSOURCE_H_

#include <string>
#include <stdint.h>
#include "MetricsSource.hpp"


/**
 * \brief Metrics source backed by a Prometheus server.
 *
 * Each metric of an observation is an instant query to /api/v1/query, bounded by its own
 * timeout. A query that fails, times out or returns no sample leaves its metric missing.
 */
class PrometheusMetricsSource : public MetricsSource {
public:
    PrometheusMetricsSource(const std::string & host, uint16_t port, Duration queryTimeout)
        : host(host), port(port), queryTimeout(queryTimeout) {}

    virtual Observation fetch(uint32_t nodeId, Duration window);

    /// Query of the average latency of a node, in seconds.
    static std::string latencyQuery(uint32_t nodeId, Duration window);
    /// Query of the number of 500 responses and crashes of a node.
    static std::string errorQuery(uint32_t nodeId, Duration window);
    /// Query of the CPU usage rate of a node, in [0,1].
    static std::string cpuQuery(uint32_t nodeId, Duration window);
    /// Query of the resident memory of a node, in bytes.
    static std::string memoryQuery(uint32_t nodeId);

    /**
     * Extracts the value of the first sample of an instant query response.
     * @return The value, or NaN if the result is empty.
     * @throws std::runtime_error If the document is not a successful query response.
     */
    static double parseResult(const std::string & body);

private:
    double query(const std::string & q);

    std::string host;
    uint16_t port;
    Duration queryTimeout;
};

#endif /* PROMETHEUSMETRICSSOURCE_H_ */
