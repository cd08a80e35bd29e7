#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "utils/config.hpp"
#include "utils/logger.hpp"
#include "utils/shutdown.hpp"
#include "version.h"

#include "Modules/RcBase.hpp"
#include "Modules/RcStreamViewer.hpp"


int main(int argc, char* argv[]) {
    Config::StreamConfig cfg;
    std::string error;

    const int parsed = Config::parseArgs(argc, argv, Config::Program::Viewer, cfg, error);
    if (parsed != 0) {
        if (parsed < 0) {
            std::cerr << error << "\n";
        }
        std::cout << Config::usage(Config::Program::Viewer, argv[0]);
        return parsed < 0 ? 1 : 0;
    }

    Logger* logger = Logger::getLoggerInst();
    logger->enableDebug(cfg.log.debug);
    logger->enableJournal(cfg.log.journal);
    logger->log(Logger::LOG_LVL_INFO, "RC Car video viewer V%u.%u.%u\r\n", VERSION_MAJOR, VERSION_MINOR, VERSION_BUILD);

    const std::vector<std::string> problems = Config::validate(cfg);
    if (!problems.empty()) {
        for (const auto& p : problems) {
            logger->log(Logger::LOG_LVL_ERROR, "Invalid configuration: %s\r\n", p.c_str());
        }
        return 1;
    }

    std::unique_ptr<Modules::StreamViewer> viewer =
        std::make_unique<Modules::StreamViewer>(Modules::STREAM_VIEWER, "StreamViewer", cfg.client);

    ShutdownSignal shutdown;

    if (viewer->init() < 0) {
        return 1;
    }
    viewer->trigger();

    // HighGUI must be driven from the main thread
    while (!shutdown.requested() && viewer->isRunning() && !viewer->finished()) {
        viewer->displayPending();
    }

    viewer->stop();
    return 0;
}
