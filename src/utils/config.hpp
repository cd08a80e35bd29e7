#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>


namespace Config {

struct ServerConfig {
    std::string host          = "0.0.0.0";
    uint16_t port             = 9999;
    uint16_t chunkSize        = 1400;
    int maxFps                = 60;
    int sessionTimeoutMs      = 15000;  // 0 disables inactivity eviction
    int readTimeoutMs         = 1000;
    bool pacing               = true;
    int statsPeriodMs         = 10000;
    std::size_t sendBufferSize = 1024 * 1024;
};

struct CameraConfig {
    std::string device = "0";  // V4L2 index, device path or capture pipeline
    int width          = 640;
    int height         = 480;
    int fps            = 30;
    int jpegQuality    = 30;
    int maxWidth       = 640;  // wider frames are downscaled before encoding
    bool flip          = true;
    bool overlay       = true;
    bool testPattern   = false;
};

struct ClientConfig {
    std::string host         = "127.0.0.1";
    uint16_t port            = 9999;
    int handshakeTimeoutMs   = 5000;
    int readTimeoutMs        = 1000;
    int keepAliveMs          = 2000;
    int stalenessMs          = 1000;
    int maxHandshakeAttempts = 5;
    int retryBackoffMs       = 500;
    int maxSilentTimeouts    = 10;
    bool headless            = false;
    bool reconnect           = false;
    bool showStats           = true;
    std::string windowName   = "RC Car Video Stream";
};

struct BridgeConfig {
    std::string wsHost      = "0.0.0.0";
    uint16_t wsPort         = 8765;
    int stalenessMs         = 2000;
    int idleTimeoutMs       = 30000;
    int handshakeTimeoutMs  = 10000;
    bool keepAlivePings     = true;
    int maxQueuedMessages   = 4;
    int reconnectDelayMs    = 1000;
};

struct LogConfig {
    bool debug   = false;
    bool journal = true;
};

/**
 * @brief Every tunable of the three executables. Each program reads the sections it needs.
 */
struct StreamConfig {
    ServerConfig server;
    CameraConfig camera;
    ClientConfig client;
    BridgeConfig bridge;
    LogConfig log;
};

enum class Program {
    Streamer,
    Viewer,
    Bridge
};

/**
 * @brief Overlay values from a JSON file onto cfg. Missing keys keep their current value.
 *
 * @param path File path
 * @param cfg Configuration to update
 * @param error Reason on failure
 * @return int 0 on success, -1 if the file cannot be read or parsed
 */
int loadFile(const std::string& path, StreamConfig& cfg, std::string& error);

/**
 * @brief Parse command line flags. A --config file is applied first, flags override it.
 *
 * @return int 0 to continue, 1 if help was printed, -1 on a bad flag or value
 */
int parseArgs(int argc, char** argv, Program program, StreamConfig& cfg, std::string& error);

std::string usage(Program program, const char* argv0);

/**
 * @brief Check value ranges
 *
 * @return std::vector<std::string> One message per problem, empty if valid
 */
std::vector<std::string> validate(const StreamConfig& cfg);

}  // namespace Config

#endif
