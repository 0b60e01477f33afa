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

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <boost/filesystem/fstream.hpp>
#include "ConfigurationManager.hpp"
#include "config.h"
using namespace std;
using namespace boost::program_options;
namespace fs = boost::filesystem;


ConfigurationManager & ConfigurationManager::getInstance() {
    static ConfigurationManager instance;
    return instance;
}


ConfigurationManager::ConfigurationManager() : description("Allowed options") {
    // Default values
#ifdef _DEBUG_
    logString = "root=DEBUG";
#else
    logString = "root=WARN";
#endif
    nodeId = 1;
    port = 8001;
    workers = 8;
    faultsFile = ".env";
    realTime = true;
    prometheusHost = "localhost";
    prometheusPort = 9090;
    metricsWindow = 30.0;
    queryTimeout = 2.0;
    bandLow = 0.20;
    bandHigh = 0.60;
    weightTrusted = 1.0;
    weightSuspicious = 0.5;
    weightFaulty = 0.1;
    refreshPeriod = 5.0;
    classifyTimeout = 10.0;
    refreshWorkers = 16;
    numNodes = 15;
    nodeHost = "localhost";
    nodePort = 8001;
    dispatchPeriod = 0.5;
    requestTimeout = 5.0;
    dispatchWorkers = 8;
    frontendPort = 0;
    seed = 1;
    dispatches = 1500;
    numFaulty = 3;
    faultTypes = "crash,delay,error-500";
    simSeed = 0;

    options_description general("General");
    general.add_options()
    ("log,l", value<string>(&logString), "logging configuration, like root=WARN;Dsp=DEBUG")
    ("log_file", value<string>(&logFile), "also log to this file")
    ;

    options_description node("Node");
    node.add_options()
    ("id", value<uint32_t>(&nodeId), "node ID, from 1 to the number of nodes")
    ("port,p", value<uint16_t>(&port), "node HTTP port")
    ("workers", value<unsigned int>(&workers), "threads serving HTTP sessions")
    ("faults,f", value<string>(&faultsFile), ".env file with the NODE_<id>_FAULT assignment")
    ("real_time", value<bool>(&realTime), "really spend the time of each request")
    ;

    options_description metrics("Metrics");
    metrics.add_options()
    ("prometheus_host", value<string>(&prometheusHost), "Prometheus server host")
    ("prometheus_port", value<uint16_t>(&prometheusPort), "Prometheus server port")
    ("metrics_window", value<double>(&metricsWindow), "seconds aggregated in each observation")
    ("query_timeout", value<double>(&queryTimeout), "seconds to wait for a metrics query")
    ;

    options_description trust("Trust");
    trust.add_options()
    ("model_dir", value<string>(&modelDir), "directory with model.msgpack, scaler.msgpack and labels.msgpack")
    ("primary_fault", value<string>(&primaryFault), "fault class whose probability makes a node faulty")
    ("band_low", value<double>(&bandLow), "faulty probability from which a node is suspicious")
    ("band_high", value<double>(&bandHigh), "faulty probability from which a node is faulty")
    ("weight_trusted", value<double>(&weightTrusted), "weight of trusted nodes")
    ("weight_suspicious", value<double>(&weightSuspicious), "weight of suspicious nodes")
    ("weight_faulty", value<double>(&weightFaulty), "weight of faulty nodes")
    ("refresh_period", value<double>(&refreshPeriod), "seconds between weight refreshes")
    ("classify_timeout", value<double>(&classifyTimeout), "seconds to classify a node")
    ("refresh_workers", value<unsigned int>(&refreshWorkers), "threads classifying nodes")
    ;

    options_description dispatcher("Dispatcher");
    dispatcher.add_options()
    ("nodes,n", value<unsigned int>(&numNodes), "number of nodes")
    ("node_host", value<string>(&nodeHost), "host of the nodes")
    ("node_port", value<uint16_t>(&nodePort), "port of node 1, node i listens in node_port + i - 1")
    ("dispatch_period", value<double>(&dispatchPeriod), "seconds between dispatched requests")
    ("request_timeout", value<double>(&requestTimeout), "seconds to wait for a node")
    ("dispatch_workers", value<unsigned int>(&dispatchWorkers), "threads forwarding requests")
    ("frontend_port", value<uint16_t>(&frontendPort), "port for client requests, 0 disables it")
    ("seed", value<uint32_t>(&seed), "seed of the weighted selection")
    ;

    options_description sim("Simulator");
    sim.add_options()
    ("dispatches", value<unsigned long>(&dispatches), "number of requests to dispatch")
    ("faulty", value<unsigned int>(&numFaulty), "number of faulty nodes chosen at random")
    ("fault_types", value<string>(&faultTypes), "comma-separated fault classes to choose from")
    ("sim_seed", value<uint32_t>(&simSeed), "seed of the fault assignment, 0 for a random one")
    ("env_output", value<string>(&envOutput), "write the fault assignment to this file")
    ;

    description.add(general).add(node).add(metrics).add(trust).add(dispatcher).add(sim);
}


void ConfigurationManager::loadConfigFile(fs::path configFile) {
    fs::ifstream fileStream(configFile);
    variables_map vm;
    store(parse_config_file(fileStream, description), vm);
    notify(vm);
}


bool ConfigurationManager::loadCommandLine(int argc, char * argv[], const string & program) {
    options_description cmd_line(description);
    cmd_line.add_options()
    ("config,c", value<string>(), "alternative configuration file")
    ("version,v", "print version string")
    ("help", "produce help message")
    ;

    variables_map vm;
    store(parse_command_line(argc, argv, cmd_line), vm);

    if (vm.count("help")) {
        cerr << "Usage: " << program << " [options]" << endl;
        cerr << cmd_line << endl;
        return true;
    }
    if (vm.count("version")) {
        cerr << program << " v" << TRUSTLB_VERSION_MAJOR << '.' << TRUSTLB_VERSION_MINOR << endl;
        return true;
    }
    if (vm.count("config")) {
        fs::path configFile(vm["config"].as<string>());
        if (fs::exists(configFile)) {
            loadConfigFile(configFile);
        } else {
            cerr << "Config file not found: " << configFile << endl;
        }
    }
    // Command line overrides config file
    notify(vm);

    validate();
    return false;
}


void ConfigurationManager::validate() const {
    ostringstream error;
    if (nodeId == 0)
        error << "node ID must be at least 1";
    else if (numNodes == 0)
        error << "there must be at least one node";
    else if (!(bandLow >= 0.0 && bandLow <= bandHigh && bandHigh <= 1.0))
        error << "bands must satisfy 0 <= band_low <= band_high <= 1";
    else if (weightTrusted < 0.0 || weightSuspicious < 0.0 || weightFaulty < 0.0)
        error << "weights cannot be negative";
    else if (refreshPeriod <= 0.0 || dispatchPeriod < 0.0)
        error << "periods must be positive";
    else if (workers == 0 || refreshWorkers == 0 || dispatchWorkers == 0)
        error << "thread pools need at least one thread";
    else if (numFaulty > numNodes)
        error << "there cannot be more faulty nodes than nodes";
    if (!error.str().empty())
        throw invalid_argument(error.str());
}
