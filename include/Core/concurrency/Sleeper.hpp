#pragma once
#include <boost/asio/io_context.hpp>
#include <chrono>

namespace CONCURRENCY {

class ISleeper {
public:
    virtual ~ISleeper() = default;
    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

// Blocking wait on a steady_timer
class AsioSleeper : public ISleeper {
public:
    AsioSleeper() = default;

    AsioSleeper(const AsioSleeper&) = delete;
    AsioSleeper& operator=(const AsioSleeper&) = delete;

    void sleepFor(std::chrono::milliseconds duration) override;

private:
    boost::asio::io_context io_ctx_;
};

} // namespace CONCURRENCY
