#pragma once

#include "icepack/byte_range.hpp"
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace icepack {

// Runs a per-range handler on a fixed pool of worker threads.
//
// The producer is called on the thread that called run(), and only once a
// worker is free, so it needs no locking and ranges are handed out in the
// order it yields them. A handler that throws is logged together with its
// range; the range is not retried and the other ranges keep going.
// run() returns after every handed-out range has been processed.
class Dispatcher {
public:
    using Producer = std::function<std::optional<ByteRange>()>;
    using Handler = std::function<void(const ByteRange&)>;

    // `label` names the work in log lines ("uploading", "downloading").
    // A jobs value of 0 is treated as 1.
    Dispatcher(std::size_t jobs, std::string label);

    void run(const Producer& next_range, const Handler& handle);

    std::size_t jobs() const { return jobs_; }

private:
    void process(const Handler& handle, const ByteRange& range);

    std::size_t jobs_;
    std::string label_;

    std::mutex mutex_;
    std::condition_variable slot_freed_;
    std::size_t in_flight_ = 0;
};

} // namespace icepack
