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
#include <boost/test/unit_test.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>
#include "ForestClassifier.hpp"
#include "TrustClassifier.hpp"
#include "WeightBands.hpp"
#include "MetricsSource.hpp"
using namespace std;
namespace fs = boost::filesystem;


namespace {
ForestClassifier::Node leaf(double benign, double faulty) {
    ForestClassifier::Node n;
    n.value.push_back(benign);
    n.value.push_back(faulty);
    return n;
}

ForestClassifier::Node split(int32_t feature, double threshold, int32_t left, int32_t right) {
    ForestClassifier::Node n;
    n.feature = feature;
    n.threshold = threshold;
    n.left = left;
    n.right = right;
    return n;
}

// Two trees: one splits on the error count, the other is undecided
struct TestForest {
    ForestClassifier::Model model;
    ForestClassifier::Scaler scaler;
    ForestClassifier::Labels labels;

    TestForest() {
        ForestClassifier::Tree t1, t2;
        t1.nodes.push_back(split(1, 2.5, 1, 2));
        t1.nodes.push_back(leaf(10.0, 0.0));
        t1.nodes.push_back(leaf(1.0, 9.0));
        t2.nodes.push_back(leaf(1.0, 1.0));
        model.trees.push_back(t1);
        model.trees.push_back(t2);
        scaler.mean.assign(Observation::numFeatures, 0.0);
        scaler.scale.assign(Observation::numFeatures, 1.0);
        labels.classes.push_back("benign");
        labels.classes.push_back("500-error");
    }
};

vector<double> features(double errors) {
    vector<double> f(Observation::numFeatures, 0.0);
    f[1] = errors;
    return f;
}

template<class T> void writeArtifact(const fs::path & file, const T & artifact) {
    fs::ofstream ofs(file, ios_base::out | ios_base::binary);
    msgpack::pack(ofs, artifact);
}

struct TempDir {
    fs::path path;
    TempDir() : path(fs::temp_directory_path() / fs::unique_path("trustlb-%%%%-%%%%")) {
        fs::create_directories(path);
    }
    ~TempDir() {
        boost::system::error_code ec;
        fs::remove_all(path, ec);
    }
};
}


BOOST_AUTO_TEST_SUITE(Cor)   // Correctness test suite

BOOST_AUTO_TEST_SUITE(Trust)


BOOST_AUTO_TEST_CASE(testWeightBands) {
    WeightBands b;
    BOOST_CHECK_EQUAL(b.getWeight(0.05), 1.0);
    BOOST_CHECK_EQUAL(b.getWeight(0.20), 0.5);
    BOOST_CHECK_EQUAL(b.getWeight(0.45), 0.5);
    BOOST_CHECK_EQUAL(b.getWeight(0.60), 0.1);
    BOOST_CHECK_EQUAL(b.getWeight(0.95), 0.1);
    BOOST_CHECK_EQUAL(b.getWeight(std::numeric_limits<double>::quiet_NaN()), 1.0);
    BOOST_CHECK_EQUAL(b.getBand(0.0), WeightBands::TRUSTED);
    BOOST_CHECK_EQUAL(b.getBand(1.0), WeightBands::FAULTY);
    BOOST_CHECK_EQUAL(b.getDefaultWeight(), 1.0);
    BOOST_CHECK_EQUAL(string(WeightBands::getBandName(WeightBands::SUSPICIOUS)), "suspicious");

    WeightBands custom(0.3, 0.3, 2.0, 1.0, 0.0);
    BOOST_CHECK_EQUAL(custom.getWeight(0.29), 2.0);
    BOOST_CHECK_EQUAL(custom.getWeight(0.3), 0.0);

    BOOST_CHECK_THROW(WeightBands(0.7, 0.6), std::invalid_argument);
    BOOST_CHECK_THROW(WeightBands(0.2, 1.5), std::invalid_argument);
    BOOST_CHECK_THROW(WeightBands(0.2, 0.6, 1.0, -0.5, 0.1), std::invalid_argument);
}


BOOST_AUTO_TEST_CASE(testPredictionLabels) {
    TrustClassifier::Prediction p;
    p.labels.push_back("Benign");
    p.labels.push_back("500-error");
    p.labels.push_back("delay");
    p.probabilities.push_back(0.5);
    p.probabilities.push_back(0.3);
    p.probabilities.push_back(0.2);
    BOOST_CHECK_CLOSE(p.getFaultyProbability(), 0.5, 1e-9);
    BOOST_CHECK_CLOSE(p.getFaultyProbability("error-500"), 0.3, 1e-9);
    BOOST_CHECK_CLOSE(p.getFaultyProbability("delay"), 0.2, 1e-9);
    BOOST_CHECK_EQUAL(p.getFaultyProbability("crash"), 0.0);
    BOOST_CHECK_EQUAL(p.getMostLikely(), "Benign");
}


BOOST_AUTO_TEST_CASE(testFaultyMassOnBandEdge) {
    TrustClassifier::Prediction p;
    p.labels.push_back("benign");
    p.labels.push_back("error-500");
    p.probabilities.push_back(0.8);
    p.probabilities.push_back(0.2);
    WeightBands b;
    double faulty = p.getFaultyProbability();
    BOOST_CHECK_EQUAL(faulty, 0.2);
    BOOST_CHECK_EQUAL(b.getBand(faulty), WeightBands::SUSPICIOUS);
    BOOST_CHECK_EQUAL(b.getWeight(faulty), 0.5);
}


BOOST_AUTO_TEST_CASE(testForestPrediction) {
    TestForest f;
    ForestClassifier c(f.model, f.scaler, f.labels);
    BOOST_CHECK(c.isAvailable());
    BOOST_CHECK_EQUAL(c.getNumTrees(), 2U);

    TrustClassifier::Prediction p = c.predict(features(0.0));
    BOOST_REQUIRE_EQUAL(p.probabilities.size(), 2U);
    BOOST_CHECK_CLOSE(p.getProbability("benign"), 0.75, 1e-9);
    BOOST_CHECK_CLOSE(p.getFaultyProbability(), 0.25, 1e-9);

    p = c.predict(features(5.0));
    BOOST_CHECK_CLOSE(p.getFaultyProbability(), 0.7, 1e-9);
    BOOST_CHECK_CLOSE(p.getFaultyProbability("error-500"), 0.7, 1e-9);
    BOOST_CHECK_EQUAL(p.getMostLikely(), "500-error");

    // Standardization moves the threshold
    f.scaler.mean[1] = 4.0;
    ForestClassifier shifted(f.model, f.scaler, f.labels);
    BOOST_CHECK_CLOSE(shifted.predict(features(5.0)).getFaultyProbability(), 0.25, 1e-9);

    BOOST_CHECK_THROW(c.predict(vector<double>(3, 0.0)), std::invalid_argument);
}


BOOST_AUTO_TEST_CASE(testForestValidation) {
    TestForest f;
    ForestClassifier::Model loop = f.model;
    loop.trees[0].nodes[0].left = 0;
    BOOST_CHECK_THROW(ForestClassifier(loop, f.scaler, f.labels), std::runtime_error);

    ForestClassifier::Model wrongLeaf = f.model;
    wrongLeaf.trees[1].nodes[0].value.push_back(1.0);
    BOOST_CHECK_THROW(ForestClassifier(wrongLeaf, f.scaler, f.labels), std::runtime_error);

    ForestClassifier::Scaler shortScaler = f.scaler;
    shortScaler.mean.pop_back();
    BOOST_CHECK_THROW(ForestClassifier(f.model, shortScaler, f.labels), std::runtime_error);

    BOOST_CHECK_THROW(ForestClassifier(ForestClassifier::Model(), f.scaler, f.labels), std::runtime_error);
}


BOOST_AUTO_TEST_CASE(testLoadArtifacts) {
    TempDir dir;
    TestForest f;
    writeArtifact(dir.path / ForestClassifier::modelFile, f.model);
    writeArtifact(dir.path / ForestClassifier::scalerFile, f.scaler);
    writeArtifact(dir.path / ForestClassifier::labelsFile, f.labels);

    boost::shared_ptr<TrustClassifier> c = TrustClassifier::load(dir.path);
    BOOST_REQUIRE(c->isAvailable());
    BOOST_CHECK_CLOSE(c->predict(features(5.0)).getFaultyProbability(), 0.7, 1e-9);

    // Any missing or broken artifact leaves the engine without classifier
    {
        fs::ofstream broken(dir.path / ForestClassifier::scalerFile, ios_base::out | ios_base::binary);
        broken << "not msgpack";
    }
    c = TrustClassifier::load(dir.path);
    BOOST_CHECK(!c->isAvailable());

    fs::remove(dir.path / ForestClassifier::scalerFile);
    c = TrustClassifier::load(dir.path);
    BOOST_CHECK(!c->isAvailable());
    BOOST_CHECK_THROW(c->predict(features(0.0)), std::logic_error);

    BOOST_CHECK(!TrustClassifier::load(fs::path())->isAvailable());
    BOOST_CHECK(!TrustClassifier::load(dir.path / "nonexistent")->isAvailable());
}

BOOST_AUTO_TEST_SUITE_END()   // Trust

BOOST_AUTO_TEST_SUITE_END()   // Cor
