#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "utils/config.hpp"
#include "utils/logger.hpp"
#include "utils/shutdown.hpp"
#include "version.h"

#include "Devices/CameraSource.hpp"
#include "Devices/RegisterMap.hpp"
#include "Modules/RcBase.hpp"
#include "Modules/RcStreamServer.hpp"


int main(int argc, char* argv[]) {
    Config::StreamConfig cfg;
    std::string error;

    const int parsed = Config::parseArgs(argc, argv, Config::Program::Streamer, cfg, error);
    if (parsed != 0) {
        if (parsed < 0) {
            std::cerr << error << "\n";
        }
        std::cout << Config::usage(Config::Program::Streamer, argv[0]);
        return parsed < 0 ? 1 : 0;
    }

    Logger* logger = Logger::getLoggerInst();
    logger->enableDebug(cfg.log.debug);
    logger->enableJournal(cfg.log.journal);
    logger->log(Logger::LOG_LVL_INFO, "RC Car video streamer V%u.%u.%u\r\n", VERSION_MAJOR, VERSION_MINOR, VERSION_BUILD);

    const std::vector<std::string> problems = Config::validate(cfg);
    if (!problems.empty()) {
        for (const auto& p : problems) {
            logger->log(Logger::LOG_LVL_ERROR, "Invalid configuration: %s\r\n", p.c_str());
        }
        return 1;
    }

    std::shared_ptr<Devices::CameraSource> camera = std::make_shared<Devices::CameraSource>(cfg.camera);
    std::unique_ptr<Modules::StreamServer> server;
    try {
        server = std::make_unique<Modules::StreamServer>(Modules::STREAM_SERVER, "StreamServer", cfg.server, camera);
    } catch (const std::invalid_argument& e) {
        logger->log(Logger::LOG_LVL_ERROR, "%s\r\n", e.what());
        return 1;
    }

    ShutdownSignal shutdown;

    if (server->init() < 0) {
        server->stop();
        return 1;
    }
    server->trigger();

    const std::optional<std::string> endpoint =
        RegisterMap::getInstance()->get<std::string>(RegisterMap::RegisterKeys::ServerEndpoint);
    logger->log(Logger::LOG_LVL_INFO, "Viewers connect to udp://%s\r\n", endpoint.value_or("?").c_str());

    shutdown.wait([&server]() { return server->isRunning(); });

    server->stop();
    return 0;
}
