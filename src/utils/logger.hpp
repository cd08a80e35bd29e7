#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <atomic>
#include <cstdarg>
#include <mutex>


class Logger {
public:
    Logger() {}
    ~Logger() {}

    static Logger* getLoggerInst(void);
    void log(int logLvl, const char* format, ...) __attribute__((format(printf, 3, 4)));

    /**
     * @brief Enable or disable DEBUG level output
     *
     * @param enable true to print debug messages
     */
    void enableDebug(bool enable) {
        m_DebugEnabled.store(enable);
    }

    /**
     * @brief Enable or disable forwarding to the systemd journal
     *
     * @param enable true to forward messages to the journal
     */
    void enableJournal(bool enable) {
        m_JournalEnabled.store(enable);
    }

    bool debugEnabled() const {
        return m_DebugEnabled.load();
    }
public:
    enum {
        LOG_LVL_INFO,
        LOG_LVL_WARN,
        LOG_LVL_ERROR,
        LOG_LVL_DEBUG
    };

private:
    std::mutex m_Mutex;
    std::atomic<bool> m_DebugEnabled{false};
    std::atomic<bool> m_JournalEnabled{true};
};

#endif
