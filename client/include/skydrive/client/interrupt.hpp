#pragma once

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace skydrive::client
{

    // Backoff waits of the upload state machine. Tests substitute a recorder.
    class Waiter
    {
    public:
        virtual ~Waiter() = default;

        // Throws InterruptedError when the wait is cancelled.
        virtual void wait(std::chrono::seconds delay) = 0;
    };

    // Turns SIGINT/SIGTERM into a flag that wakes every pending wait and
    // aborts in-flight transfers through CurlTransport's abort check.
    class InterruptMonitor : public Waiter
    {
    public:
        InterruptMonitor();
        ~InterruptMonitor() override;

        InterruptMonitor(const InterruptMonitor &) = delete;
        InterruptMonitor &operator=(const InterruptMonitor &) = delete;

        void wait(std::chrono::seconds delay) override;

        void interrupt();

        bool interrupted() const noexcept { return interrupted_.load(); }

    private:
        asio::io_context io_context_;
        asio::signal_set signals_;
        std::thread thread_;
        std::mutex mutex_;
        std::condition_variable wakeup_;
        std::atomic<bool> interrupted_{false};
    };

} // namespace skydrive::client
