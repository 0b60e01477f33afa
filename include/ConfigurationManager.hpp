/*
 *  PeerComp - Highly Scalable Distributed Computing Architecture
 *  Copyright (C) 2007 Javier Celaya
 *
 *  This file is part of PeerComp.
 *
 *  PeerComp is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  PeerComp is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with PeerComp; if not, write to the Free Software Foundation, Inc.,
 *  51 Franklin St, Fifth Floor, Boston, MA  02110-1301  USA
 *
 */

#ifndef CONFIGURATIONMANAGER_H_
#define CONFIGURATIONMANAGER_H_

#include <string>
#include <stdint.h>
#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include "Time.hpp"


/**
 * Provides the configuration parameters of the node, the dispatcher and the simulator. They
 * can be set through a configuration file or the command line, which overrides the file.
 */
class ConfigurationManager {
    /// Options description
    boost::program_options::options_description description;

    // General
    std::string logString;          ///< Logging configuration string
    std::string logFile;            ///< Log file, empty for console only

    // Node
    uint32_t nodeId;                ///< ID of this node
    uint16_t port;                  ///< HTTP port of the node
    unsigned int workers;           ///< Threads serving HTTP sessions
    std::string faultsFile;         ///< .env file with the fault assignment
    bool realTime;                  ///< Whether the node really spends the time of each request

    // Metrics
    std::string prometheusHost;
    uint16_t prometheusPort;
    double metricsWindow;           ///< Seconds of history aggregated in each observation
    double queryTimeout;            ///< Seconds to wait for a metrics query

    // Trust
    std::string modelDir;           ///< Directory of the classifier artifacts
    std::string primaryFault;       ///< Class whose probability is the faulty probability, empty for 1 - P(benign)
    double bandLow, bandHigh;       ///< Cut points of the weight bands
    double weightTrusted, weightSuspicious, weightFaulty;
    double refreshPeriod;           ///< Seconds between weight refreshes
    double classifyTimeout;         ///< Seconds to wait for a node to be classified
    unsigned int refreshWorkers;

    // Dispatcher
    unsigned int numNodes;
    std::string nodeHost;
    uint16_t nodePort;              ///< Port of node 1, node i listens in nodePort + i - 1
    double dispatchPeriod;          ///< Seconds between two dispatched requests
    double requestTimeout;          ///< Seconds to wait for a node to answer
    unsigned int dispatchWorkers;
    uint16_t frontendPort;          ///< Port for client requests, 0 to disable
    uint32_t seed;                  ///< Seed of the weighted selection

    // Simulator
    unsigned long dispatches;
    unsigned int numFaulty;
    std::string faultTypes;         ///< Comma-separated fault classes to choose from
    uint32_t simSeed;
    std::string envOutput;          ///< Where to write the fault assignment, empty for nowhere

    /// default constructor, prevents instantiation
    ConfigurationManager();

public:

    /**
     * Provides the entry point for the singleton pattern.
     * @returns The singleton instance.
     */
    static ConfigurationManager & getInstance();

    /**
     * Loads configuration from a specific file
     */
    void loadConfigFile(boost::filesystem::path configFile);

    /**
     * Loads configuration from command line
     * @param program Name of the program, for the help and version messages.
     * @returns True if the program should exit, due to options like "help", "version", etc...
     * @throws std::invalid_argument If a value is out of range.
     */
    bool loadCommandLine(int argc, char * argv[], const std::string & program);

    /**
     * Checks that the values are consistent.
     * @throws std::invalid_argument If they are not.
     */
    void validate() const;

    /**
     * Returns the logging configuration string.
     */
    const std::string & getLogConfig() const {
        return logString;
    }

    /**
     * Sets the logging configuration string.
     */
    void setLogConfig(const std::string & s) {
        logString = s;
    }

    const std::string & getLogFile() const {
        return logFile;
    }

    uint32_t getNodeId() const {
        return nodeId;
    }

    void setNodeId(uint32_t id) {
        nodeId = id;
    }

    /**
     * Returns the port number.
     */
    uint16_t getPort() const {
        return port;
    }

    /**
     * Sets the port number.
     */
    void setPort(uint16_t p) {
        port = p;
    }

    unsigned int getWorkers() const {
        return workers;
    }

    const std::string & getFaultsFile() const {
        return faultsFile;
    }

    bool isRealTime() const {
        return realTime;
    }

    const std::string & getPrometheusHost() const {
        return prometheusHost;
    }

    uint16_t getPrometheusPort() const {
        return prometheusPort;
    }

    Duration getMetricsWindow() const {
        return Duration(metricsWindow);
    }

    Duration getQueryTimeout() const {
        return Duration(queryTimeout);
    }

    const std::string & getModelDir() const {
        return modelDir;
    }

    void setModelDir(const std::string & d) {
        modelDir = d;
    }

    const std::string & getPrimaryFault() const {
        return primaryFault;
    }

    double getBandLow() const {
        return bandLow;
    }

    double getBandHigh() const {
        return bandHigh;
    }

    double getWeightTrusted() const {
        return weightTrusted;
    }

    double getWeightSuspicious() const {
        return weightSuspicious;
    }

    double getWeightFaulty() const {
        return weightFaulty;
    }

    /**
     * Returns the time between two weight refreshes.
     */
    Duration getRefreshPeriod() const {
        return Duration(refreshPeriod);
    }

    Duration getClassifyTimeout() const {
        return Duration(classifyTimeout);
    }

    unsigned int getRefreshWorkers() const {
        return refreshWorkers;
    }

    unsigned int getNumNodes() const {
        return numNodes;
    }

    void setNumNodes(unsigned int n) {
        numNodes = n;
    }

    const std::string & getNodeHost() const {
        return nodeHost;
    }

    uint16_t getNodePort() const {
        return nodePort;
    }

    Duration getDispatchPeriod() const {
        return Duration(dispatchPeriod);
    }

    /**
     * Returns the time to wait for a node to answer a request.
     */
    Duration getRequestTimeout() const {
        return Duration(requestTimeout);
    }

    unsigned int getDispatchWorkers() const {
        return dispatchWorkers;
    }

    uint16_t getFrontendPort() const {
        return frontendPort;
    }

    uint32_t getSeed() const {
        return seed;
    }

    unsigned long getDispatches() const {
        return dispatches;
    }

    unsigned int getNumFaulty() const {
        return numFaulty;
    }

    const std::string & getFaultTypes() const {
        return faultTypes;
    }

    uint32_t getSimSeed() const {
        return simSeed;
    }

    const std::string & getEnvOutput() const {
        return envOutput;
    }
};

#endif /*CONFIGURATIONMANAGER_H_*/
