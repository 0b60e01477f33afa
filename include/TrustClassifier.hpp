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

#ifndef TRUSTCLASSIFIER_H_
#define TRUSTCLASSIFIER_H_

#include <string>
#include <vector>
#include <ostream>
#include <boost/shared_ptr.hpp>
#include <boost/filesystem/path.hpp>


/**
 * \brief Interface of a fault classifier.
 *
 * A classifier maps the feature vector of a node to a probability for each fault class it
 * knows. When no classifier can be loaded, a NullClassifier takes its place and the weight
 * engine falls back to uniform weights.
 */
class TrustClassifier {
public:
    /**
     * Class labels and one probability per label.
     */
    struct Prediction {
        std::vector<std::string> labels;
        std::vector<double> probabilities;

        /// Returns the probability of a fault class, 0 if the label is not known.
        double getProbability(const std::string & label) const;

        /**
         * Returns the probability that the node is faulty. It is the sum of the non-benign classes, unless a
         * primary class is given, in which case it is the probability of that class.
         */
        double getFaultyProbability(const std::string & primary = std::string()) const;

        /// Returns the label with the highest probability.
        std::string getMostLikely() const;

        friend std::ostream & operator<<(std::ostream & os, const Prediction & p);
    };

    virtual ~TrustClassifier() {}

    /// Whether this classifier can produce predictions.
    virtual bool isAvailable() const = 0;

    /**
     * Predicts the fault class of a node.
     * @param features latency_ms, error_500_count, cpu_usage_rate and resident_mem_mb.
     * @throws std::exception If the prediction fails.
     */
    virtual Prediction predict(const std::vector<double> & features) const = 0;

    /// Short description for the logs.
    virtual std::string getDescription() const = 0;

    /**
     * Loads the classifier artifacts from a directory: model.msgpack, scaler.msgpack and
     * labels.msgpack. Problems are logged and produce a NullClassifier, never an exception.
     * @param modelDir Directory of the artifacts. Empty means no classifier.
     */
    static boost::shared_ptr<TrustClassifier> load(const boost::filesystem::path & modelDir);

    /// Returns the canonical fault class name of a label, or the lower-case label if unknown.
    static std::string canonicalLabel(const std::string & label);
};


/**
 * Placeholder when there is no classifier.
 */
class NullClassifier : public TrustClassifier {
public:
    explicit NullClassifier(const std::string & reason = "no model") : reason(reason) {}

    virtual bool isAvailable() const {
        return false;
    }

    /// @throws std::logic_error Always, there is nothing to predict with.
    virtual Prediction predict(const std::vector<double> & features) const;

    virtual std::string getDescription() const {
        return "no classifier (" + reason + ")";
    }

private:
    std::string reason;
};

#endif /* TRUSTCLASSIFIER_H_ */
