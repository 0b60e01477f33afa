/*
 *  STaRS, Scalable Task Routing approach to distributed Scheduling
 *  Copyright (C) 2012 Javier Celaya
 *
 *  This file is part of STaRS.
 *
 *  STaRS is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation; either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  STaRS is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with STaRS; if not, see <http://www.gnu.org/licenses/>.
 */

#include <unistd.h>
#include <csignal>
#include <iostream>
#include <iomanip>
#include <stdexcept>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <boost/shared_ptr.hpp>
#include "config.h"
#include "Logger.hpp"
#include "ConfigurationManager.hpp"
#include "Simulator.hpp"
#include "FaultEngine.hpp"
#include "WorkloadEnvironment.hpp"
#include "WindowedMetricsStore.hpp"
#include "NodeGateway.hpp"
#include "TrustClassifier.hpp"
#include "WeightBands.hpp"
#include "TrustWeightEngine.hpp"
namespace fs = boost::filesystem;
namespace pt = boost::posix_time;

extern char ** environ;


Time Time::getCurrentTime() {
    return Simulator::getInstance().getCurrentTime();
}


void finish(int param) {
    LogMsg("Sim", NOTICE) << "Stopping due to user signal";
    Simulator::getInstance().stop();
}


int main(int argc, char * argv[]) {
    try {
        // Try to load default config file
        fs::path defaultConfigFile(".trustlbrc");
        if (fs::exists(defaultConfigFile))
            ConfigurationManager::getInstance().loadConfigFile(defaultConfigFile);
        // Command line overrides config file
        if (ConfigurationManager::getInstance().loadCommandLine(argc, argv, "trustlb-sim")) return 0;
        ConfigurationManager & cfg = ConfigurationManager::getInstance();
        LogMsg::initLog(cfg.getLogConfig());
        LogMsg::addConsoleLogging();
        if (!cfg.getLogFile().empty())
            LogMsg::addFileLogging(cfg.getLogFile());
        LogMsg("Sim", NOTICE) << "TrustLB v" << TRUSTLB_VERSION_MAJOR << '.' << TRUSTLB_VERSION_MINOR
                << " simulator PID " << getpid();

        std::signal(SIGINT, finish);
        std::signal(SIGTERM, finish);

        DispatchStatistics stats = Simulator::getInstance().run(cfg);
        return stats.total.dispatched > 0 ? 0 : 1;
    } catch (std::exception & e) {
        std::cerr << "Exception caught: " << e.what() << std::endl;
        return 1;
    }
}


std::vector<FaultClass> Simulator::parseFaultTypes(const std::string & list) {
    std::vector<std::string> names;
    boost::split(names, list, boost::is_any_of(", "), boost::token_compress_on);
    std::vector<FaultClass> result;
    for (std::vector<std::string>::iterator it = names.begin(); it != names.end(); ++it)
        if (!it->empty())
            result.push_back(FaultClass::fromName(*it));
    if (result.empty())
        throw std::invalid_argument("empty list of fault types");
    return result;
}


Properties Simulator::assignFaults(unsigned int numNodes, unsigned int numFaulty,
        const std::vector<FaultClass> & types, uint32_t seed) {
    if (numFaulty > numNodes)
        throw std::invalid_argument("more faulty nodes than nodes");
    if (numFaulty > 0 && types.empty())
        throw std::invalid_argument("no fault types to choose from");
    if (seed == 0)
        seed = static_cast<uint32_t>(Time::getWallClockTime().getRawDate());
    boost::random::mt19937 gen(seed);

    Properties result;
    std::vector<uint32_t> ids;
    for (uint32_t i = 1; i <= numNodes; ++i) {
        ids.push_back(i);
        result[FaultClass::getVariableName(i)] = FaultClass(FaultClass::BENIGN).getName();
    }
    // Partial Fisher-Yates shuffle, the first numFaulty IDs are the faulty nodes
    for (unsigned int i = 0; i < numFaulty; ++i) {
        unsigned int j = boost::random::uniform_int_distribution<unsigned int>(i, numNodes - 1)(gen);
        std::swap(ids[i], ids[j]);
        FaultClass f = types[boost::random::uniform_int_distribution<std::size_t>(0, types.size() - 1)(gen)];
        result[FaultClass::getVariableName(ids[i])] = f.getName();
    }
    return result;
}


void Simulator::writeEnvFile(const Properties & faults, unsigned int numNodes, const fs::path & file) {
    fs::ofstream ofs(file);
    if (!ofs)
        throw std::runtime_error("cannot write " + file.string());
    for (uint32_t i = 1; i <= numNodes; ++i)
        ofs << FaultClass::getVariableName(i) << '=' << FaultClass::forNode(i, faults).getName() << std::endl;
    if (!ofs)
        throw std::runtime_error("error writing " + file.string());
}


DispatchStatistics Simulator::run(const ConfigurationManager & cfg) {
    pt::ptime start = pt::microsec_clock::local_time();
    now = Time::getWallClockTime();
    end = false;

    // Fault assignment
    unsigned int numNodes = cfg.getNumNodes();
    Properties faults;
    if (cfg.getNumFaulty() > 0) {
        faults = assignFaults(numNodes, cfg.getNumFaulty(), parseFaultTypes(cfg.getFaultTypes()), cfg.getSimSeed());
    } else {
        if (!faults.loadFromFile(cfg.getFaultsFile()))
            LogMsg("Sim", INFO) << "No fault assignment file " << cfg.getFaultsFile();
        faults.loadFromEnvironment(environ, "NODE_");
    }
    if (!cfg.getEnvOutput().empty()) {
        writeEnvFile(faults, numNodes, cfg.getEnvOutput());
        LogMsg("Sim", INFO) << "Fault assignment written to " << cfg.getEnvOutput();
    }

    // Nodes
    SimulatedEnvironment env;
    WindowedMetricsStore store;
    LocalNodeGateway gateway(cfg.getRequestTimeout(), &store);
    std::vector<uint32_t> nodes;
    std::vector<boost::shared_ptr<FaultEngine> > engines;
    for (uint32_t i = 1; i <= numNodes; ++i) {
        FaultClass f = FaultClass::forNode(i, faults);
        engines.push_back(boost::shared_ptr<FaultEngine>(new FaultEngine(i, f, env)));
        gateway.addNode(*engines.back());
        nodes.push_back(i);
        if (f != FaultClass::BENIGN)
            LogMsg("Sim", NOTICE) << "node-" << i << " is " << f;
    }

    // Weights and dispatch
    boost::shared_ptr<TrustClassifier> classifier = TrustClassifier::load(cfg.getModelDir());
    WeightBands bands(cfg.getBandLow(), cfg.getBandHigh(), cfg.getWeightTrusted(), cfg.getWeightSuspicious(),
            cfg.getWeightFaulty());
    RoutingTableHandle handle;
    TrustWeightEngine weightEngine(nodes, store, classifier, bands, handle, cfg.getRefreshWorkers());
    weightEngine.setPrimaryFault(cfg.getPrimaryFault());
    weightEngine.setMetricsWindow(cfg.getMetricsWindow());
    weightEngine.setTimeout(cfg.getClassifyTimeout());
    Dispatcher dispatcher(nodes, handle, gateway, cfg.getSeed());

    LogMsg("Sim", NOTICE) << "Running " << cfg.getDispatches() << " dispatches over " << numNodes << " nodes, "
            << classifier->getDescription();
    Time simStart = now, nextRefresh = now;
    unsigned long i = 0;
    for (; i < cfg.getDispatches() && !end; ++i) {
        if (now >= nextRefresh) {
            weightEngine.refresh();
            nextRefresh = now + cfg.getRefreshPeriod();
        }
        dispatcher.dispatch();
        now += cfg.getDispatchPeriod();
    }

    // Show results
    pt::time_duration realTime = pt::microsec_clock::local_time() - start;
    LogMsg("Sim", NOTICE) << i << " dispatches in " << realTime << " (" << (now - simStart) << " simulated), "
            << weightEngine.getNumRefreshes() << " refreshes";
    std::map<uint32_t, TrustState> states = weightEngine.getStates();
    std::cout << std::setw(10) << std::left << "node" << std::setw(14) << "fault" << std::right << std::setw(10)
              << "P_faulty" << std::setw(10) << "weight" << std::setw(10) << "requests" << std::endl;
    for (std::vector<boost::shared_ptr<FaultEngine> >::iterator it = engines.begin(); it != engines.end(); ++it) {
        const TrustState & s = states[(*it)->getId()];
        std::cout << std::setw(10) << std::left << (*it)->getName() << std::setw(14) << (*it)->getFaultClass()
                  << std::right << std::setw(10) << std::fixed << std::setprecision(3) << s.pFaulty
                  << std::setw(10) << s.weight << std::setw(10) << (*it)->getTotalRequests() << std::endl;
    }
    DispatchStatistics stats = dispatcher.getStatistics();
    std::cout << std::endl << stats;
    return stats;
}
