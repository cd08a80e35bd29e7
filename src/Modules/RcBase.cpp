#include "RcBase.hpp"

#include "utils/logger.hpp"

namespace Modules {
    Base::Base(int moduleID_, const std::string& name) : moduleID(moduleID_), m_name(name) {
    }


    Base::~Base() {
        requestStop();
        joinThreads();
    }


    int Base::trigger(void) {
        std::lock_guard<std::mutex> lock(m_ThreadMutex);
        if (m_Triggered) {
            Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "%s already triggered\r\n", m_name.c_str());
            return -1;
        }
        m_Triggered = true;

        m_Threads.emplace_back(&Base::mainProc, this);
        m_Threads.emplace_back(&Base::timerThread, this);
        return 0;
    }


    void Base::timerThread(void) {
        while (m_Running.load() && m_TimerCanRun.load()) {
            OnTimer();
            if (!sleepFor(std::chrono::milliseconds(m_SleepPeriod.load()))) {
                break;
            }
        }
    }


    void Base::spawnWorker(std::function<void()> fn) {
        std::lock_guard<std::mutex> lock(m_ThreadMutex);
        m_Threads.emplace_back(std::move(fn));
    }


    void Base::requestStop(void) {
        {
            std::lock_guard<std::mutex> lock(m_WakeMutex);
            m_Running.store(false);
        }
        m_WakeCv.notify_all();
    }


    void Base::joinThreads(void) {
        std::vector<RcThread> threads;
        {
            std::lock_guard<std::mutex> lock(m_ThreadMutex);
            threads.swap(m_Threads);
        }

        for (auto& worker : threads) {
            worker.join();
        }
    }


    bool Base::sleepFor(std::chrono::milliseconds duration) {
        std::unique_lock<std::mutex> lock(m_WakeMutex);
        return !m_WakeCv.wait_for(lock, duration, [this]() { return !m_Running.load(); });
    }
}
