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
#include <iterator>
#include <algorithm>
#include <stdexcept>
#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>
#include "ForestClassifier.hpp"
#include "MetricsSource.hpp"
#include "Logger.hpp"
namespace fs = boost::filesystem;


const char * ForestClassifier::modelFile = "model.msgpack";
const char * ForestClassifier::scalerFile = "scaler.msgpack";
const char * ForestClassifier::labelsFile = "labels.msgpack";


namespace {
template<class T> void readArtifact(const fs::path & file, T & artifact) {
    if (!fs::exists(file))
        throw std::runtime_error("missing artifact " + file.string());
    fs::ifstream ifs(file, std::ios_base::in | std::ios_base::binary);
    if (!ifs.is_open())
        throw std::runtime_error("cannot open artifact " + file.string());
    std::string data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    try {
        msgpack::unpacker pac;
        pac.reserve_buffer(data.size());
        std::copy(data.begin(), data.end(), pac.buffer());
        pac.buffer_consumed(data.size());
        msgpack::unpacked msg;
        if (!pac.next(&msg))
            throw std::runtime_error("truncated");
        artifact = msg.get().as<T>();
    } catch (std::exception & e) {
        throw std::runtime_error("malformed artifact " + file.string() + ": " + e.what());
    }
}
}


ForestClassifier::ForestClassifier(const Model & m, const Scaler & s, const Labels & l)
        : model(m), scaler(s), labels(l) {
    validate();
}


boost::shared_ptr<ForestClassifier> ForestClassifier::fromDirectory(const fs::path & dir) {
    Model m;
    Scaler s;
    Labels l;
    readArtifact(dir / modelFile, m);
    readArtifact(dir / scalerFile, s);
    readArtifact(dir / labelsFile, l);
    return boost::shared_ptr<ForestClassifier>(new ForestClassifier(m, s, l));
}


void ForestClassifier::validate() const {
    const std::size_t numClasses = labels.classes.size();
    const int numFeatures = Observation::numFeatures;
    if (numClasses == 0)
        throw std::runtime_error("label encoder has no classes");
    if (scaler.mean.size() != (std::size_t)numFeatures || scaler.scale.size() != (std::size_t)numFeatures)
        throw std::runtime_error("scaler does not match the number of features");
    if (model.trees.empty())
        throw std::runtime_error("model has no trees");
    for (std::size_t t = 0; t < model.trees.size(); ++t) {
        const std::vector<Node> & nodes = model.trees[t].nodes;
        if (nodes.empty())
            throw std::runtime_error("empty tree in model");
        for (std::size_t i = 0; i < nodes.size(); ++i) {
            const Node & n = nodes[i];
            std::ostringstream where;
            where << "tree " << t << " node " << i;
            if (n.isLeaf()) {
                if (n.value.size() != numClasses)
                    throw std::runtime_error(where.str() + " does not match the number of classes");
            } else if (n.feature < 0 || n.feature >= numFeatures
                    || n.left <= (int32_t)i || n.left >= (int32_t)nodes.size()
                    || n.right <= (int32_t)i || n.right >= (int32_t)nodes.size()) {
                // Children after their parent guarantees that every walk ends
                throw std::runtime_error(where.str() + " is malformed");
            }
        }
    }
}


TrustClassifier::Prediction ForestClassifier::predict(const std::vector<double> & features) const {
    if (features.size() != scaler.mean.size())
        throw std::invalid_argument("wrong number of features");
    std::vector<double> x(features.size());
    for (std::size_t i = 0; i < x.size(); ++i)
        x[i] = (features[i] - scaler.mean[i]) / (scaler.scale[i] != 0.0 ? scaler.scale[i] : 1.0);

    Prediction result;
    result.labels = labels.classes;
    result.probabilities.assign(labels.classes.size(), 0.0);
    for (std::vector<Tree>::const_iterator t = model.trees.begin(); t != model.trees.end(); ++t) {
        int32_t i = 0;
        while (!t->nodes[i].isLeaf()) {
            const Node & n = t->nodes[i];
            i = x[n.feature] <= n.threshold ? n.left : n.right;
        }
        // Leaves may hold sample counts, normalize them
        const std::vector<double> & v = t->nodes[i].value;
        double total = 0.0;
        for (std::size_t c = 0; c < v.size(); ++c) total += v[c];
        if (total > 0.0)
            for (std::size_t c = 0; c < v.size(); ++c) result.probabilities[c] += v[c] / total;
    }
    double total = 0.0;
    for (std::size_t c = 0; c < result.probabilities.size(); ++c) total += result.probabilities[c];
    for (std::size_t c = 0; c < result.probabilities.size(); ++c)
        result.probabilities[c] = total > 0.0 ? result.probabilities[c] / total : 1.0 / result.probabilities.size();
    return result;
}


std::string ForestClassifier::getDescription() const {
    std::ostringstream oss;
    oss << "random forest of " << model.trees.size() << " trees over " << labels.classes.size() << " classes";
    return oss.str();
}
