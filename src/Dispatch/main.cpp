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
#include <csignal>
#include <vector>
#include <boost/asio.hpp>
#include "ConfigurationManager.hpp"
#include "Logger.hpp"
#include "PrometheusMetricsSource.hpp"
#include "TrustClassifier.hpp"
#include "WeightBands.hpp"
#include "NodeGateway.hpp"
#include "LoadBalancer.hpp"
namespace fs = boost::filesystem;


int main(int argc, char * argv[]) {
    try {
        // Try to load default config file
        fs::path defaultConfigFile(".trustlbrc");
        if (fs::exists(defaultConfigFile))
            ConfigurationManager::getInstance().loadConfigFile(defaultConfigFile);
        // Command line overrides config file
        if (ConfigurationManager::getInstance().loadCommandLine(argc, argv, "trustlb-dispatcher")) return 0;
        ConfigurationManager & cfg = ConfigurationManager::getInstance();
        // Start logging
        LogMsg::initLog(cfg.getLogConfig());
        LogMsg::addConsoleLogging();
        if (!cfg.getLogFile().empty())
            LogMsg::addFileLogging(cfg.getLogFile());

        std::vector<uint32_t> nodes;
        for (uint32_t i = 1; i <= cfg.getNumNodes(); ++i)
            nodes.push_back(i);
        PrometheusMetricsSource source(cfg.getPrometheusHost(), cfg.getPrometheusPort(), cfg.getQueryTimeout());
        boost::shared_ptr<TrustClassifier> classifier = TrustClassifier::load(cfg.getModelDir());
        WeightBands bands(cfg.getBandLow(), cfg.getBandHigh(), cfg.getWeightTrusted(), cfg.getWeightSuspicious(),
                cfg.getWeightFaulty());
        HttpNodeGateway gateway(cfg.getNodeHost(), cfg.getNodePort(), cfg.getRequestTimeout());

        LoadBalancer lb(nodes, source, classifier, bands, gateway, cfg.getSeed(), cfg.getRefreshWorkers(),
                cfg.getDispatchWorkers());
        lb.getWeightEngine().setPrimaryFault(cfg.getPrimaryFault());
        lb.getWeightEngine().setMetricsWindow(cfg.getMetricsWindow());
        lb.getWeightEngine().setTimeout(cfg.getClassifyTimeout());

        // Run until interrupted
        boost::asio::io_context io;
        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&io] (const boost::system::error_code &, int) { io.stop(); });
        lb.start(cfg.getRefreshPeriod(), cfg.getDispatchPeriod(), cfg.getFrontendPort());
        io.run();

        lb.stop();
        std::cout << lb.getDispatcher().getStatistics();
        LogMsg("Dsp", INFO) << "Gracely exiting";
        return 0;
    } catch (std::exception & e) {
        std::cerr << "Exception caught: " << e.what() << std::endl;
        return 1;
    }
}
