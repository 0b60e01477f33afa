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

#include <cctype>
#include <stdexcept>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem/operations.hpp>
#include "TrustClassifier.hpp"
#include "ForestClassifier.hpp"
#include "FaultClass.hpp"
#include "Logger.hpp"
namespace fs = boost::filesystem;


std::string TrustClassifier::canonicalLabel(const std::string & label) {
    try {
        return FaultClass::fromName(label).getName();
    } catch (std::invalid_argument &) {
        return boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(label));
    }
}


double TrustClassifier::Prediction::getProbability(const std::string & label) const {
    std::string wanted = canonicalLabel(label);
    for (std::size_t i = 0; i < labels.size() && i < probabilities.size(); ++i)
        if (canonicalLabel(labels[i]) == wanted)
            return probabilities[i];
    return 0.0;
}


double TrustClassifier::Prediction::getFaultyProbability(const std::string & primary) const {
    if (!primary.empty())
        return getProbability(primary);
    const std::string benign = FaultClass(FaultClass::BENIGN).getName();
    double result = 0.0;
    for (std::size_t i = 0; i < labels.size() && i < probabilities.size(); ++i)
        if (canonicalLabel(labels[i]) != benign)
            result += probabilities[i];
    return result;
}


std::string TrustClassifier::Prediction::getMostLikely() const {
    std::size_t best = 0;
    for (std::size_t i = 1; i < labels.size() && i < probabilities.size(); ++i)
        if (probabilities[i] > probabilities[best]) best = i;
    return labels.empty() ? std::string() : labels[best];
}


std::ostream & operator<<(std::ostream & os, const TrustClassifier::Prediction & p) {
    os << '{';
    for (std::size_t i = 0; i < p.labels.size() && i < p.probabilities.size(); ++i)
        os << (i ? ", " : "") << p.labels[i] << ": " << p.probabilities[i];
    return os << '}';
}


TrustClassifier::Prediction NullClassifier::predict(const std::vector<double> &) const {
    throw std::logic_error("prediction requested without classifier: " + reason);
}


boost::shared_ptr<TrustClassifier> TrustClassifier::load(const fs::path & modelDir) {
    if (modelDir.empty()) {
        LogMsg("Trust", WARN) << "No model directory configured, falling back to round-robin";
        return boost::shared_ptr<TrustClassifier>(new NullClassifier("no model directory"));
    }
    try {
        boost::shared_ptr<TrustClassifier> result = ForestClassifier::fromDirectory(modelDir);
        LogMsg("Trust", INFO) << "Loaded " << result->getDescription() << " from " << modelDir;
        return result;
    } catch (std::runtime_error & e) {
        LogMsg("Trust", WARN) << "Classifier unavailable, falling back to round-robin: " << e.what();
        return boost::shared_ptr<TrustClassifier>(new NullClassifier(e.what()));
    }
}
