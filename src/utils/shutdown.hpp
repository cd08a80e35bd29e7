#ifndef SHUTDOWN_HPP
#define SHUTDOWN_HPP

#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <thread>

#include <boost/asio.hpp>

#include "utils/logger.hpp"


/**
 * @brief Catches SIGINT/SIGTERM on a private io_context thread and raises a flag the
 *        main thread polls.
 */
class ShutdownSignal {
public:
    ShutdownSignal() : m_Signals(m_IoContext, SIGINT, SIGTERM) {
        m_Signals.async_wait([this](const boost::system::error_code& ec, int signo) {
            if (ec) {
                return;
            }
            Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Received signal %d, shutting down\r\n", signo);
            m_Requested.store(true);
        });
        m_Thread = std::thread([this]() { m_IoContext.run(); });
    }

    ~ShutdownSignal() {
        boost::system::error_code ec;
        m_Signals.cancel(ec);
        m_IoContext.stop();
        if (m_Thread.joinable()) {
            m_Thread.join();
        }
    }

    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    bool requested(void) const {
        return m_Requested.load();
    }

    /**
     * @brief Block until a signal arrives or keepWaiting returns false
     *
     * @param keepWaiting Polled every period
     * @param period Poll period
     */
    void wait(const std::function<bool()>& keepWaiting,
              std::chrono::milliseconds period = std::chrono::milliseconds(100)) const {
        while (!requested() && keepWaiting()) {
            std::this_thread::sleep_for(period);
        }
    }

private:
    boost::asio::io_context m_IoContext;
    boost::asio::signal_set m_Signals;
    std::thread m_Thread;
    std::atomic<bool> m_Requested{false};
};

#endif
