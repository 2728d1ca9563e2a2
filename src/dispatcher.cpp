#include "icepack/dispatcher.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <algorithm>
#include <exception>
#include <iostream>
#include <sstream>

namespace icepack {

Dispatcher::Dispatcher(std::size_t jobs, std::string label)
    : jobs_(std::max<std::size_t>(jobs, 1)), label_(std::move(label)) {}

void Dispatcher::process(const Handler& handle, const ByteRange& range) {
    std::ostringstream line;
    line << "[Dispatcher] start " << label_ << " part (" << range << ")\n";
    std::cout << line.str() << std::flush;

    try {
        handle(range);
        line.str("");
        line << "[Dispatcher] finish " << label_ << " part (" << range << ")\n";
        std::cout << line.str() << std::flush;
    } catch (const std::exception& e) {
        line.str("");
        line << "[Dispatcher] error " << label_ << " part (" << range << "): " << e.what() << "\n";
        std::cerr << line.str() << std::flush;
    } catch (...) {
        line.str("");
        line << "[Dispatcher] error " << label_ << " part (" << range << "): unknown error\n";
        std::cerr << line.str() << std::flush;
    }
}

void Dispatcher::run(const Producer& next_range, const Handler& handle) {
    boost::asio::thread_pool pool(jobs_);

    for (;;) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            slot_freed_.wait(lock, [this] { return in_flight_ < jobs_; });
        }

        std::optional<ByteRange> range = next_range();
        if (!range) {
            break;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++in_flight_;
        }

        boost::asio::post(pool, [this, &handle, r = *range]() {
            process(handle, r);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                --in_flight_;
            }
            slot_freed_.notify_one();
        });
    }

    pool.join();
}

} // namespace icepack
