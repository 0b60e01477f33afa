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

#ifndef FORESTCLASSIFIER_H_
#define FORESTCLASSIFIER_H_

#include <string>
#include <vector>
#include <stdint.h>
#include <msgpack.hpp>
#include <boost/filesystem/path.hpp>
#include "TrustClassifier.hpp"


/**
 * \brief Random forest classifier.
 *
 * The forest is trained elsewhere and exported as three msgpack artifacts:
 * - model.msgpack, the trees,
 * - scaler.msgpack, the mean and scale of each feature, as a standard scaler,
 * - labels.msgpack, the class name of each output, as a label encoder.
 *
 * Features are standardized before walking the trees, and the class distribution of the
 * reached leaves is averaged over all the trees.
 */
class ForestClassifier : public TrustClassifier {
public:
    /**
     * A node of a tree. Internal nodes go to the left child when the feature is less or
     * equal than the threshold. Leaves have no children (-1) and hold the class weights.
     */
    struct Node {
        Node() : feature(-1), threshold(0.0), left(-1), right(-1) {}
        int32_t feature;
        double threshold;
        int32_t left, right;
        std::vector<double> value;

        bool isLeaf() const {
            return left < 0 && right < 0;
        }

        MSGPACK_DEFINE(feature, threshold, left, right, value);
    };

    struct Tree {
        std::vector<Node> nodes;   ///< Node 0 is the root
        MSGPACK_DEFINE(nodes);
    };

    struct Model {
        std::vector<Tree> trees;
        MSGPACK_DEFINE(trees);
    };

    struct Scaler {
        std::vector<double> mean;
        std::vector<double> scale;
        MSGPACK_DEFINE(mean, scale);
    };

    struct Labels {
        std::vector<std::string> classes;
        MSGPACK_DEFINE(classes);
    };

    static const char * modelFile;
    static const char * scalerFile;
    static const char * labelsFile;

    /**
     * Builds a classifier from its artifacts.
     * @throws std::runtime_error If they are inconsistent.
     */
    ForestClassifier(const Model & m, const Scaler & s, const Labels & l);

    /**
     * Reads the artifacts from a directory.
     * @throws std::runtime_error If any of them is missing, unreadable or inconsistent.
     */
    static boost::shared_ptr<ForestClassifier> fromDirectory(const boost::filesystem::path & dir);

    virtual bool isAvailable() const {
        return true;
    }

    /// @throws std::invalid_argument If the number of features is wrong.
    virtual Prediction predict(const std::vector<double> & features) const;

    virtual std::string getDescription() const;

    unsigned int getNumTrees() const {
        return model.trees.size();
    }

    const std::vector<std::string> & getClasses() const {
        return labels.classes;
    }

private:
    void validate() const;

    Model model;
    Scaler scaler;
    Labels labels;
};

#endif /* FORESTCLASSIFIER_H_ */
