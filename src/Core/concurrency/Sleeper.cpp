#include "Core/concurrency/Sleeper.hpp"
#include <boost/asio/steady_timer.hpp>

namespace CONCURRENCY {

void AsioSleeper::sleepFor(std::chrono::milliseconds duration) {
    if (duration <= std::chrono::milliseconds::zero()) return;
    boost::asio::steady_timer timer(io_ctx_, duration);
    timer.wait();
}

} // namespace CONCURRENCY
