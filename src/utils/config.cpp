#include "utils/config.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;


namespace Config {

namespace {

void readServer(const json& j, ServerConfig& s) {
    s.host             = j.value("host", s.host);
    s.port             = j.value("port", s.port);
    s.chunkSize        = j.value("chunk_size", s.chunkSize);
    s.maxFps           = j.value("max_fps", s.maxFps);
    s.sessionTimeoutMs = j.value("session_timeout_ms", s.sessionTimeoutMs);
    s.readTimeoutMs    = j.value("read_timeout_ms", s.readTimeoutMs);
    s.pacing           = j.value("pacing", s.pacing);
    s.statsPeriodMs    = j.value("stats_period_ms", s.statsPeriodMs);
    s.sendBufferSize   = j.value("send_buffer_size", s.sendBufferSize);
}

void readCamera(const json& j, CameraConfig& c) {
    c.device      = j.value("device", c.device);
    c.width       = j.value("width", c.width);
    c.height      = j.value("height", c.height);
    c.fps         = j.value("fps", c.fps);
    c.jpegQuality = j.value("jpeg_quality", c.jpegQuality);
    c.maxWidth    = j.value("max_width", c.maxWidth);
    c.flip        = j.value("flip", c.flip);
    c.overlay     = j.value("overlay", c.overlay);
    c.testPattern = j.value("test_pattern", c.testPattern);
}

void readClient(const json& j, ClientConfig& c) {
    c.host                 = j.value("host", c.host);
    c.port                 = j.value("port", c.port);
    c.handshakeTimeoutMs   = j.value("handshake_timeout_ms", c.handshakeTimeoutMs);
    c.readTimeoutMs        = j.value("read_timeout_ms", c.readTimeoutMs);
    c.keepAliveMs          = j.value("keep_alive_ms", c.keepAliveMs);
    c.stalenessMs          = j.value("staleness_ms", c.stalenessMs);
    c.maxHandshakeAttempts = j.value("max_handshake_attempts", c.maxHandshakeAttempts);
    c.retryBackoffMs       = j.value("retry_backoff_ms", c.retryBackoffMs);
    c.maxSilentTimeouts    = j.value("max_silent_timeouts", c.maxSilentTimeouts);
    c.headless             = j.value("headless", c.headless);
    c.reconnect            = j.value("reconnect", c.reconnect);
    c.showStats            = j.value("show_stats", c.showStats);
    c.windowName           = j.value("window_name", c.windowName);
}

void readBridge(const json& j, BridgeConfig& b) {
    b.wsHost             = j.value("websocket_host", b.wsHost);
    b.wsPort             = j.value("websocket_port", b.wsPort);
    b.stalenessMs        = j.value("staleness_ms", b.stalenessMs);
    b.idleTimeoutMs      = j.value("idle_timeout_ms", b.idleTimeoutMs);
    b.handshakeTimeoutMs = j.value("handshake_timeout_ms", b.handshakeTimeoutMs);
    b.keepAlivePings     = j.value("keep_alive_pings", b.keepAlivePings);
    b.maxQueuedMessages  = j.value("max_queued_messages", b.maxQueuedMessages);
    b.reconnectDelayMs   = j.value("reconnect_delay_ms", b.reconnectDelayMs);
}

int toInt(const std::string& flag, const std::string& text, int minValue, int maxValue, int& out, std::string& error) {
    try {
        std::size_t consumed = 0;
        const long value = std::stol(text, &consumed, 10);
        if (consumed != text.size() || value < minValue || value > maxValue) {
            error = "invalid value for " + flag + ": " + text;
            return -1;
        }
        out = static_cast<int>(value);
        return 0;
    } catch (const std::invalid_argument&) {
        error = "invalid value for " + flag + ": " + text;
    } catch (const std::out_of_range&) {
        error = "value out of range for " + flag + ": " + text;
    }
    return -1;
}

int toPort(const std::string& flag, const std::string& text, uint16_t& out, std::string& error) {
    int value = 0;
    if (toInt(flag, text, 0, std::numeric_limits<uint16_t>::max(), value, error) < 0) {
        return -1;
    }
    out = static_cast<uint16_t>(value);
    return 0;
}

}  // namespace


int loadFile(const std::string& path, StreamConfig& cfg, std::string& error) {
    std::ifstream in(path);
    if (!in.is_open()) {
        error = "cannot open config file " + path;
        return -1;
    }

    try {
        json j = json::parse(in);
        if (j.contains("server"))  readServer(j.at("server"), cfg.server);
        if (j.contains("camera"))  readCamera(j.at("camera"), cfg.camera);
        if (j.contains("client"))  readClient(j.at("client"), cfg.client);
        if (j.contains("bridge"))  readBridge(j.at("bridge"), cfg.bridge);
        if (j.contains("log")) {
            const json& log = j.at("log");
            cfg.log.debug   = log.value("debug", cfg.log.debug);
            cfg.log.journal = log.value("journal", cfg.log.journal);
        }
    } catch (const json::exception& e) {
        error = "bad config file " + path + ": " + e.what();
        return -1;
    }
    return 0;
}


int parseArgs(int argc, char** argv, Program program, StreamConfig& cfg, std::string& error) {
    // The config file is the base layer, so find it before anything else
    for (int i = 1; i < argc; i++) {
        if (std::string(argv[i]) == "--config") {
            if (i + 1 >= argc) {
                error = "missing value for --config";
                return -1;
            }
            if (loadFile(argv[i + 1], cfg, error) < 0) {
                return -1;
            }
        }
    }

    for (int i = 1; i < argc; i++) {
        const std::string a = argv[i];
        auto next = [&](std::string& value) -> bool {
            if (i + 1 < argc) {
                value = argv[++i];
                return true;
            }
            error = "missing value for " + a;
            return false;
        };

        std::string v;
        int status = 0;
        if (a == "-h" || a == "--help") {
            return 1;
        } else if (a == "--config") {
            ++i;  // already applied
        } else if (a == "--verbose" || a == "-v") {
            cfg.log.debug = true;
        } else if (a == "--no-journal") {
            cfg.log.journal = false;
        } else if (program == Program::Streamer) {
            if (a == "--host") {
                if (!next(cfg.server.host)) return -1;
            } else if (a == "--port") {
                if (!next(v)) return -1;
                status = toPort(a, v, cfg.server.port, error);
            } else if (a == "--fps") {
                if (!next(v)) return -1;
                status = toInt(a, v, 1, 240, cfg.server.maxFps, error);
            } else if (a == "--quality") {
                if (!next(v)) return -1;
                status = toInt(a, v, 1, 100, cfg.camera.jpegQuality, error);
            } else if (a == "--chunk-size") {
                if (!next(v)) return -1;
                int chunk = 0;
                status = toInt(a, v, 1, 65499, chunk, error);
                cfg.server.chunkSize = static_cast<uint16_t>(chunk);
            } else if (a == "--session-timeout") {
                if (!next(v)) return -1;
                status = toInt(a, v, 0, std::numeric_limits<int>::max(), cfg.server.sessionTimeoutMs, error);
            } else if (a == "--device") {
                if (!next(cfg.camera.device)) return -1;
            } else if (a == "--width") {
                if (!next(v)) return -1;
                status = toInt(a, v, 16, 8192, cfg.camera.width, error);
            } else if (a == "--height") {
                if (!next(v)) return -1;
                status = toInt(a, v, 16, 8192, cfg.camera.height, error);
            } else if (a == "--camera-fps") {
                if (!next(v)) return -1;
                status = toInt(a, v, 1, 240, cfg.camera.fps, error);
            } else if (a == "--test-pattern") {
                cfg.camera.testPattern = true;
            } else if (a == "--no-flip") {
                cfg.camera.flip = false;
            } else if (a == "--no-overlay") {
                cfg.camera.overlay = false;
            } else if (a == "--no-pacing") {
                cfg.server.pacing = false;
            } else {
                error = "unknown option " + a;
                return -1;
            }
        } else if (program == Program::Viewer) {
            if (a == "--host") {
                if (!next(cfg.client.host)) return -1;
            } else if (a == "--port") {
                if (!next(v)) return -1;
                status = toPort(a, v, cfg.client.port, error);
            } else if (a == "--headless") {
                cfg.client.headless = true;
            } else if (a == "--reconnect") {
                cfg.client.reconnect = true;
            } else if (a == "--no-stats") {
                cfg.client.showStats = false;
            } else {
                error = "unknown option " + a;
                return -1;
            }
        } else {
            if (a == "--udp-host") {
                if (!next(cfg.client.host)) return -1;
            } else if (a == "--udp-port") {
                if (!next(v)) return -1;
                status = toPort(a, v, cfg.client.port, error);
            } else if (a == "--websocket-host") {
                if (!next(cfg.bridge.wsHost)) return -1;
            } else if (a == "--websocket-port") {
                if (!next(v)) return -1;
                status = toPort(a, v, cfg.bridge.wsPort, error);
            } else if (a == "--idle-timeout") {
                if (!next(v)) return -1;
                status = toInt(a, v, 1000, std::numeric_limits<int>::max(), cfg.bridge.idleTimeoutMs, error);
            } else {
                error = "unknown option " + a;
                return -1;
            }
        }

        if (status < 0) {
            return -1;
        }
    }
    return 0;
}


std::string usage(Program program, const char* argv0) {
    std::ostringstream out;
    out << "Usage: " << argv0 << " [options]\n"
        << "  --config PATH           JSON configuration file\n"
        << "  -v, --verbose           enable debug logging\n"
        << "  --no-journal            do not forward logs to the systemd journal\n";

    switch (program) {
        case Program::Streamer:
            out << "  --host ADDR|IFACE       bind address (default 0.0.0.0)\n"
                << "  --port N                UDP port (default 9999)\n"
                << "  --fps N                 maximum broadcast rate (default 60)\n"
                << "  --quality N             JPEG quality 1-100 (default 30)\n"
                << "  --chunk-size N          payload bytes per datagram (default 1400)\n"
                << "  --session-timeout MS    drop silent viewers after MS, 0 disables (default 15000)\n"
                << "  --device DEV            camera index, path or pipeline (default 0)\n"
                << "  --width N / --height N  capture size (default 640x480)\n"
                << "  --camera-fps N          capture rate (default 30)\n"
                << "  --test-pattern          synthetic frames instead of a camera\n"
                << "  --no-flip               keep the camera image upright\n"
                << "  --no-overlay            no timestamp/caption overlay\n"
                << "  --no-pacing             send chunks back to back\n";
            break;

        case Program::Viewer:
            out << "  --host HOST             stream server (default 127.0.0.1)\n"
                << "  --port N                stream server port (default 9999)\n"
                << "  --headless              no window, log statistics only\n"
                << "  --reconnect             reconnect when the stream drops\n"
                << "  --no-stats              no statistics overlay\n";
            break;

        case Program::Bridge:
            out << "  --udp-host HOST         stream server (default 127.0.0.1)\n"
                << "  --udp-port N            stream server port (default 9999)\n"
                << "  --websocket-host ADDR   WebSocket bind address (default 0.0.0.0)\n"
                << "  --websocket-port N      WebSocket port (default 8765)\n"
                << "  --idle-timeout MS       WebSocket idle timeout (default 30000)\n";
            break;
    }
    return out.str();
}


std::vector<std::string> validate(const StreamConfig& cfg) {
    std::vector<std::string> problems;

    if (cfg.server.chunkSize == 0 || cfg.server.chunkSize > 65499) {
        problems.push_back("server.chunk_size must be between 1 and 65499");
    }
    if (cfg.server.maxFps <= 0) {
        problems.push_back("server.max_fps must be positive");
    }
    if (cfg.server.sessionTimeoutMs < 0) {
        problems.push_back("server.session_timeout_ms cannot be negative");
    }
    if (cfg.server.readTimeoutMs <= 0) {
        problems.push_back("server.read_timeout_ms must be positive");
    }
    if (cfg.camera.jpegQuality < 1 || cfg.camera.jpegQuality > 100) {
        problems.push_back("camera.jpeg_quality must be between 1 and 100");
    }
    if (cfg.camera.width <= 0 || cfg.camera.height <= 0) {
        problems.push_back("camera.width and camera.height must be positive");
    }
    if (cfg.camera.fps <= 0) {
        problems.push_back("camera.fps must be positive");
    }
    if (cfg.client.port == 0) {
        problems.push_back("client.port cannot be zero");
    }
    if (cfg.client.handshakeTimeoutMs <= 0 || cfg.client.readTimeoutMs <= 0 || cfg.client.keepAliveMs <= 0) {
        problems.push_back("client timeouts must be positive");
    }
    if (cfg.client.stalenessMs <= 0 || cfg.bridge.stalenessMs <= 0) {
        problems.push_back("staleness windows must be positive");
    }
    if (cfg.client.maxHandshakeAttempts <= 0) {
        problems.push_back("client.max_handshake_attempts must be positive");
    }
    if (cfg.bridge.maxQueuedMessages <= 0) {
        problems.push_back("bridge.max_queued_messages must be positive");
    }
    if (cfg.bridge.idleTimeoutMs <= 0 || cfg.bridge.handshakeTimeoutMs <= 0) {
        problems.push_back("bridge timeouts must be positive");
    }
    return problems;
}

}  // namespace Config
