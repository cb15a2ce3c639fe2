/*
===============================================================================
 lcr::sync::bounded_channel
===============================================================================

Bounded multi-producer / single-consumer queue with explicit closure.

  • Sender handles are copyable; the channel closes for the consumer once the
    last Sender is destroyed (or close() is called on one of them).
  • The Receiver is move-only; destroying it (or calling close()) closes the
    channel for producers, waking any producer blocked in send().
  • send() blocks while the queue is full. try_send() never blocks.
  • try_recv() never blocks and distinguishes "nothing yet" from "no item will
    ever arrive again".
  • Every successful push and every closure rings the attached notifier, so a
    consumer can multiplex several channels on one wakeup primitive.

Items queued before closure are still delivered: the consumer observes
Disconnected only after the queue is drained.
===============================================================================
*/
#pragma once

#include <mutex>
#include <deque>
#include <memory>
#include <cstddef>
#include <utility>
#include <condition_variable>

#include "lcr/sync/notifier.hpp"


namespace lcr::sync {

enum class recv_status {
    Item,
    Empty,
    Disconnected
};

enum class send_status {
    Sent,
    Full,
    Closed
};

namespace detail {

template <typename T>
struct channel_state {
    channel_state(std::size_t cap, std::shared_ptr<notifier> n)
        : capacity(cap == 0 ? 1 : cap)
        , wake(std::move(n))
    {}

    std::mutex mutex;
    std::condition_variable not_full;
    std::deque<T> queue;
    const std::size_t capacity;
    std::size_t senders{0};
    bool receiver_alive{true};
    bool sender_closed{false};
    std::shared_ptr<notifier> wake;

    void ring() {
        if (wake) {
            wake->notify();
        }
    }
};

} // namespace detail


template <typename T>
class bounded_channel {
public:
    class Sender;
    class Receiver;

    // Creates a connected Sender / Receiver pair
    [[nodiscard]]
    static std::pair<Sender, Receiver> make(std::size_t capacity, std::shared_ptr<notifier> wake = nullptr) {
        auto state = std::make_shared<detail::channel_state<T>>(capacity, std::move(wake));
        return { Sender(state), Receiver(state) };
    }

    // -------------------------------------------------------------------------
    // Sender
    // -------------------------------------------------------------------------
    class Sender {
    public:
        Sender() = default;

        Sender(const Sender& other) : state_(other.state_) {
            acquire_();
        }

        Sender& operator=(const Sender& other) {
            if (this != &other) {
                release_();
                state_ = other.state_;
                acquire_();
            }
            return *this;
        }

        Sender(Sender&& other) noexcept : state_(std::move(other.state_)) {}

        Sender& operator=(Sender&& other) noexcept {
            if (this != &other) {
                release_();
                state_ = std::move(other.state_);
            }
            return *this;
        }

        ~Sender() {
            release_();
        }

        [[nodiscard]]
        bool valid() const noexcept { return state_ != nullptr; }

        // Blocks while the queue is full. Returns false once the channel is closed.
        [[nodiscard]]
        bool send(T item) {
            if (!state_) return false;
            {
                std::unique_lock<std::mutex> lock(state_->mutex);
                state_->not_full.wait(lock, [&] {
                    return !state_->receiver_alive || state_->sender_closed ||
                           state_->queue.size() < state_->capacity;
                });
                if (!state_->receiver_alive || state_->sender_closed) {
                    return false;
                }
                state_->queue.push_back(std::move(item));
            }
            state_->ring();
            return true;
        }

        [[nodiscard]]
        send_status try_send(T item) {
            if (!state_) return send_status::Closed;
            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                if (!state_->receiver_alive || state_->sender_closed) {
                    return send_status::Closed;
                }
                if (state_->queue.size() >= state_->capacity) {
                    return send_status::Full;
                }
                state_->queue.push_back(std::move(item));
            }
            state_->ring();
            return send_status::Sent;
        }

        // Close the channel for every producer; queued items remain readable
        void close() {
            if (!state_) return;
            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                state_->sender_closed = true;
            }
            state_->not_full.notify_all();
            state_->ring();
        }

        // Drop this handle
        void reset() {
            release_();
            state_.reset();
        }

    private:
        friend class bounded_channel;

        explicit Sender(std::shared_ptr<detail::channel_state<T>> state)
            : state_(std::move(state)) {
            acquire_();
        }

        void acquire_() {
            if (!state_) return;
            std::lock_guard<std::mutex> lock(state_->mutex);
            ++state_->senders;
        }

        void release_() {
            if (!state_) return;
            bool last = false;
            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                last = (--state_->senders == 0);
            }
            if (last) {
                state_->ring();
            }
        }

        std::shared_ptr<detail::channel_state<T>> state_;
    };

    // -------------------------------------------------------------------------
    // Receiver
    // -------------------------------------------------------------------------
    class Receiver {
    public:
        Receiver() = default;

        Receiver(const Receiver&) = delete;
        Receiver& operator=(const Receiver&) = delete;

        Receiver(Receiver&&) noexcept = default;

        Receiver& operator=(Receiver&& other) noexcept {
            if (this != &other) {
                close();
                state_ = std::move(other.state_);
            }
            return *this;
        }

        ~Receiver() {
            close();
        }

        [[nodiscard]]
        recv_status try_recv(T& out) {
            if (!state_) return recv_status::Disconnected;
            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                if (state_->queue.empty()) {
                    const bool open = state_->receiver_alive && !state_->sender_closed && state_->senders > 0;
                    return open ? recv_status::Empty : recv_status::Disconnected;
                }
                out = std::move(state_->queue.front());
                state_->queue.pop_front();
            }
            state_->not_full.notify_one();
            return recv_status::Item;
        }

        [[nodiscard]]
        std::size_t size() const {
            if (!state_) return 0;
            std::lock_guard<std::mutex> lock(state_->mutex);
            return state_->queue.size();
        }

        // Stop accepting items; blocked producers are released with failure
        void close() {
            if (!state_) return;
            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                state_->receiver_alive = false;
                state_->queue.clear();
            }
            state_->not_full.notify_all();
        }

    private:
        friend class bounded_channel;

        explicit Receiver(std::shared_ptr<detail::channel_state<T>> state)
            : state_(std::move(state)) {}

        std::shared_ptr<detail::channel_state<T>> state_;
    };
};

} // namespace lcr::sync
