/**
 * @file RegisterMap.hpp
 * @brief Thread-safe process-wide register map for runtime facts shared between modules
 *        (bound endpoints, peer counts, stream counters).
 */

#ifndef REGISTERMAP_HPP
#define REGISTERMAP_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

class RegisterMap {
public:
    enum class RegisterKeys{
        ServerEndpoint,  // Bound UDP endpoint of the stream server, "ip:port"
        ActivePeers,     // Number of registered viewer sessions
        FramesSent,      // Frames broadcast by the stream server
        BytesSent,       // Bytes broadcast by the stream server
        FramesReceived,  // Frames delivered by the local stream receiver
        BridgePeer,      // Remote endpoint of the WebSocket peer, empty when none
        MaxKeys
    };

    struct RegisterKeyHash {
        std::size_t operator()(const RegisterKeys& key) const noexcept {
            return static_cast<std::size_t>(key);
        }
    };

    using Value = std::variant<double, bool, std::string, int64_t>;

    // Singleton access
    static RegisterMap* getInstance();


    // Store or overwrite a value
    void set(RegisterKeys key, Value value) {
        if (key == RegisterKeys::MaxKeys) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        map_[key] = std::move(value);
    }


    // Retrieve a typed value; returns std::nullopt if missing or wrong type
    template <typename T>
    std::optional<T> get(RegisterKeys key) {
        if (key == RegisterKeys::MaxKeys) {
            return std::nullopt;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) {
            return std::nullopt;
        }
        if (auto val = std::get_if<T>(&it->second)) {
            return *val;
        }
        return std::nullopt;
    }


    /**
     * @brief Add to an integer counter, creating it at zero if missing
     *
     * @param key Counter key
     * @param delta Amount to add
     * @return int64_t The new value, or -1 if the key holds a non-integer value
     */
    int64_t increment(RegisterKeys key, int64_t delta = 1);


    // Remove a key if present
    void erase(RegisterKeys key) {
        std::lock_guard<std::mutex> lock(mutex_);
        map_.erase(key);
    }


    // Remove every key
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        map_.clear();
    }

private:
    RegisterMap()  = default;
    ~RegisterMap() = default;

    std::unordered_map<RegisterKeys, Value, RegisterKeyHash> map_;
    std::mutex mutex_;
};

#endif
