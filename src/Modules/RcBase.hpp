#pragma once

#include <thread>
#include <mutex>
#include <condition_variable>
#include <vector>
#include <atomic>
#include <functional>
#include <string>
#include <chrono>

#include "RcMessageLib.hpp"


namespace Modules {

enum DeviceType {
    STREAM_SERVER,
    STREAM_VIEWER,
    STREAM_BRIDGE
};

class RcThread {
public:
    // Variadic template constructor that accepts any arguments
    // that the std::thread constructor would accept.
    template<typename F, typename... Args>
    explicit RcThread(F&& f, Args&&... args) {
        internal_thread = std::thread(std::forward<F>(f), std::forward<Args>(args)...);
    }

    // The destructor automatically joins the thread.
    ~RcThread() {
        join();
    }

    RcThread(const RcThread&) = delete;
    RcThread& operator=(const RcThread&) = delete;

    RcThread(RcThread&& other) noexcept
        : internal_thread(std::move(other.internal_thread)) {}

    RcThread& operator=(RcThread&& other) noexcept {
        if (this != &other) {
            join();
            internal_thread = std::move(other.internal_thread);
        }
        return *this;
    }

    void join() {
        if (internal_thread.joinable()) {
            internal_thread.join();
        }
    }

    bool joinable() const {
        return internal_thread.joinable();
    }

private:
    std::thread internal_thread;
};

/**
 * @brief Common skeleton of a long running module: a main processing loop, an optional
 *        periodic timer and any number of worker threads, all observing one running flag.
 *
 * Derived classes must call stop() from their destructor; the threads reference derived
 * members.
 */
class Base {
public:
    explicit Base(int moduleID_, const std::string& name);

    virtual ~Base();

    /**
     * @brief Acquire resources and start background workers
     *
     * @return int 0 on success, -1 on failure
     */
    virtual int init(void) = 0;

    /**
     * @brief Stop every loop and release resources. Safe to call more than once.
     *
     * @return int
     */
    virtual int stop(void) = 0;

    /**
     * @brief Start the main processing loop and the timer thread
     *
     * @return int 0 on success, -1 if already triggered
     */
    int trigger(void);

    /**
     * @brief Get the module name
     *
     * @return const std::string&
     */
    const std::string& getName(void) const {
        return m_name;
    }

    int getModuleID(void) const {
        return moduleID;
    }

    bool isRunning(void) const {
        return m_Running.load();
    }

protected:
    virtual void mainProc() = 0;

    virtual void OnTimer(void) {
        m_TimerCanRun = false; // If this method isn't overwritten, then exit thread
    }

    /**
     * @brief Set the sleep period for the timer
     *
     * @param period Period in milliseconds
     */
    void setPeriod(int period) {
        m_SleepPeriod.store(period);
    }

    void timerThread(void);

    /**
     * @brief Run a function on a module owned thread, joined by joinThreads()
     */
    void spawnWorker(std::function<void()> fn);

    /**
     * @brief Clear the running flag and wake every sleeper
     */
    void requestStop(void);

    /**
     * @brief Join the main, timer and worker threads. Must not be called from one of them.
     */
    void joinThreads(void);

    /**
     * @brief Sleep unless a stop is requested first
     *
     * @param duration Time to sleep
     * @return true if the full duration elapsed, false if woken by requestStop()
     */
    bool sleepFor(std::chrono::milliseconds duration);

    /**
     * @brief Timer thread keep-alive flag
     *
     */
    std::atomic<bool> m_TimerCanRun{true};

    /**
     * @brief Timer thread sleep period
     *
     */
    std::atomic<int> m_SleepPeriod{1}; // Default to 1ms

    /**
     * @brief Get the module ID
     *
     */
    const int moduleID = -1;

    /**
     * @brief Module name
     *
     */
    std::string m_name;

    std::atomic<bool> m_Running{true};

private:
    std::mutex m_WakeMutex;
    std::condition_variable m_WakeCv;

    std::mutex m_ThreadMutex;
    bool m_Triggered = false;
    std::vector<RcThread> m_Threads;
};

} // namespace Modules
