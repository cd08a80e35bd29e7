#include "RegisterMap.hpp"


static RegisterMap* g_registerMap = nullptr;


/**
 * @brief Get the singleton instance of the RegisterMap
 *
 * @return RegisterMap* Pointer to the singleton RegisterMap instance
 */
RegisterMap* RegisterMap::getInstance() {
    static std::mutex instanceMutex;
    std::lock_guard<std::mutex> lock(instanceMutex);
    if (!g_registerMap) {
        g_registerMap = new RegisterMap();
    }
    return g_registerMap;
}


int64_t RegisterMap::increment(RegisterKeys key, int64_t delta) {
    if (key == RegisterKeys::MaxKeys) {
        return -1;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) {
        map_[key] = delta;
        return delta;
    }

    int64_t* counter = std::get_if<int64_t>(&it->second);
    if (!counter) {
        return -1;
    }
    *counter += delta;
    return *counter;
}

