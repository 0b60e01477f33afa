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

#ifndef METRICSREGISTRY_H_
#define METRICSREGISTRY_H_

#include <map>
#include <string>
#include <vector>
#include <utility>
#include <boost/thread/mutex.hpp>


/**
 * \brief Set of metrics exposed in the Prometheus text format.
 *
 * Each metric family is declared once with its type, and then each combination of label
 * values makes a new series. All the methods are thread-safe.
 */
class MetricsRegistry {
public:
    typedef std::vector<std::pair<std::string, std::string> > Labels;

    enum Type {
        COUNTER,
        GAUGE,
        HISTOGRAM
    };

    /// Bucket upper bounds used by histograms unless stated otherwise.
    static const std::vector<double> & getDefaultBuckets();

    /**
     * Declares a metric family.
     * @param name Metric name.
     * @param type Metric type.
     * @param help Description printed in the HELP line.
     * @param buckets Bucket upper bounds for histograms, sorted, without +Inf.
     */
    void declare(const std::string & name, Type type, const std::string & help,
            const std::vector<double> & buckets = getDefaultBuckets());

    /**
     * Adds a value to a counter.
     * @throws std::logic_error If the metric is not a declared counter.
     */
    void increment(const std::string & name, const Labels & labels, double v = 1.0);

    /**
     * Sets the value of a gauge.
     * @throws std::logic_error If the metric is not a declared gauge.
     */
    void set(const std::string & name, const Labels & labels, double v);

    /**
     * Adds an observation to a histogram.
     * @throws std::logic_error If the metric is not a declared histogram.
     */
    void observe(const std::string & name, const Labels & labels, double v);

    /**
     * Returns the value of a counter or gauge series, or the number of observations of a
     * histogram series. Series never updated are 0.
     */
    double getValue(const std::string & name, const Labels & labels) const;

    /**
     * Returns the whole registry in the Prometheus text exposition format, version 0.0.4.
     */
    std::string expose() const;

    /// Content type of the exposition.
    static const char * contentType;

private:
    struct Series {
        Series() : value(0.0), sum(0.0), count(0) {}
        Labels labels;
        double value;
        std::vector<unsigned long> buckets;   ///< Non-cumulative bucket counts
        double sum;
        unsigned long count;
    };

    struct Family {
        Type type;
        std::string help;
        std::vector<double> bounds;
        std::map<std::string, Series> series;   ///< Indexed by the rendered label set
    };

    Series & getSeries(const std::string & name, Type type, const Labels & labels);
    static std::string renderLabels(const Labels & labels, const std::string & extraName = std::string(),
            const std::string & extraValue = std::string());

    mutable boost::mutex mutex;
    std::map<std::string, Family> families;
};

#endif /* METRICSREGISTRY_H_ */
