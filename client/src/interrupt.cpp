#include "skydrive/client/interrupt.hpp"

#include <csignal>

#include <spdlog/spdlog.h>

#include "skydrive/errors.hpp"

namespace skydrive::client
{

    InterruptMonitor::InterruptMonitor()
        : signals_(io_context_)
    {
        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int signal)
                            {
            if (!ec)
            {
                spdlog::warn("Received signal {}, aborting", signal);
                interrupt();
            } });
        thread_ = std::thread([this]
                              { io_context_.run(); });
    }

    InterruptMonitor::~InterruptMonitor()
    {
        io_context_.stop();
        if (thread_.joinable())
        {
            thread_.join();
        }
    }

    void InterruptMonitor::wait(std::chrono::seconds delay)
    {
        std::unique_lock lock(mutex_);
        wakeup_.wait_for(lock, delay, [this]
                         { return interrupted_.load(); });
        if (interrupted_.load())
        {
            throw InterruptedError();
        }
    }

    void InterruptMonitor::interrupt()
    {
        {
            std::lock_guard lock(mutex_);
            interrupted_.store(true);
        }
        wakeup_.notify_all();
    }

} // namespace skydrive::client
