#pragma once

#include <mutex>
#include <chrono>
#include <cstdint>
#include <condition_variable>


namespace lcr::sync {

// -----------------------------------------------------------------------------
// Ticket based wakeup primitive shared by several producers and one consumer.
//
// The consumer takes a ticket() before checking its sources and then calls
// wait(ticket). Any notify() issued after the ticket was taken makes wait()
// return immediately, so a wakeup raised between "check" and "sleep" is
// never lost.
// -----------------------------------------------------------------------------
class notifier {
public:
    notifier() = default;

    notifier(const notifier&) = delete;
    notifier& operator=(const notifier&) = delete;

    [[nodiscard]]
    inline std::uint64_t ticket() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return generation_;
    }

    inline void notify() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++generation_;
        }
        cv_.notify_all();
    }

    // Block until the generation moves past `ticket`
    inline void wait(std::uint64_t ticket) const {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return generation_ != ticket; });
    }

    // Returns false on timeout
    template <class Rep, class Period>
    [[nodiscard]]
    inline bool wait_for(std::uint64_t ticket, const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return generation_ != ticket; });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::uint64_t generation_{0};
};

} // namespace lcr::sync
