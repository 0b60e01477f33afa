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

#ifndef METRICSSOURCE_H_
#define METRICSSOURCE_H_

#include <vector>
#include <ostream>
#include <stdint.h>
#include "Time.hpp"


/**
 * \brief Telemetry of a node during a refresh window.
 *
 * Any metric may be missing, which is represented with a NaN. The weight engine sanitizes
 * the observation before using it, so that a missing metric counts as a 0.0.
 */
struct Observation {
    /// Number of features handed to the classifier.
    enum { numFeatures = 4 };

    Observation();

    uint32_t nodeId;
    Time timestamp;
    double latency;       ///< Average latency, in seconds
    double errors;        ///< Number of error responses
    double cpuRate;       ///< CPU usage rate, in [0,1]
    double memory;        ///< Resident memory, in bytes

    /// Returns the number of metrics that are missing.
    unsigned int countMissing() const;

    /// Returns a copy with every missing or infinite metric replaced with 0.0.
    Observation sanitized() const;

    /**
     * Returns the feature vector of the classifier, in this order: latency_ms,
     * error_500_count, cpu_usage_rate and resident_mem_mb.
     */
    std::vector<double> toFeatures() const;

    /// Names of the features, in the order of toFeatures.
    static const char * getFeatureName(unsigned int i);

    friend std::ostream & operator<<(std::ostream & os, const Observation & o);
};


/**
 * \brief Interface of a time-series store with the telemetry of the nodes.
 *
 * Implementations must be thread-safe, because the weight engine fetches the observations
 * of several nodes at the same time.
 */
class MetricsSource {
public:
    virtual ~MetricsSource() {}

    /**
     * Returns the observation of a node over the last period of time. Metrics that cannot be
     * obtained are returned as NaN, it is not an error.
     * @param nodeId ID of the node.
     * @param window Length of the period.
     * @throws std::exception If the source itself fails. The caller isolates the failure to
     *         this node.
     */
    virtual Observation fetch(uint32_t nodeId, Duration window) = 0;
};

#endif /* METRICSSOURCE_H_ */
