#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <cstdint>
#include <ostream>
#include <utility>
#include <string_view>
#include <shared_mutex>


namespace wiregate::core::protocol::centrifugo {

// ===============================================================
// CONNECTION STATUS
// ===============================================================
enum class StatusKind : std::uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Error
};

[[nodiscard]]
inline constexpr std::string_view to_string(StatusKind k) noexcept {
    switch (k) {
        case StatusKind::Disconnected: return "disconnected";
        case StatusKind::Connecting:   return "connecting";
        case StatusKind::Connected:    return "connected";
        case StatusKind::Error:        return "error";
        default:                       return "unknown";
    }
}

struct ConnectionStatus {
    StatusKind kind{StatusKind::Disconnected};
    std::string message;    // only meaningful for StatusKind::Error

    static ConnectionStatus disconnected() { return {StatusKind::Disconnected, {}}; }
    static ConnectionStatus connecting()   { return {StatusKind::Connecting, {}}; }
    static ConnectionStatus connected()    { return {StatusKind::Connected, {}}; }
    static ConnectionStatus error(std::string msg) { return {StatusKind::Error, std::move(msg)}; }

    [[nodiscard]] bool is_error() const noexcept { return kind == StatusKind::Error; }

    [[nodiscard]] bool is_terminal() const noexcept {
        return kind == StatusKind::Error || kind == StatusKind::Disconnected;
    }

    bool operator==(const ConnectionStatus&) const = default;
};

// "connected", or "error: <message>"
[[nodiscard]]
inline std::string to_string(const ConnectionStatus& s) {
    std::string out(to_string(s.kind));
    if (s.kind == StatusKind::Error) {
        out += ": ";
        out += s.message;
    }
    return out;
}

inline std::ostream& operator<<(std::ostream& os, const ConnectionStatus& s) {
    return os << to_string(s);
}


// ---------------------------------------------------------------
// StatusCell
// ---------------------------------------------------------------
// Last-known status shared between the session (sole writer) and any number
// of reader threads.
class StatusCell {
public:
    StatusCell() = default;

    StatusCell(const StatusCell&) = delete;
    StatusCell& operator=(const StatusCell&) = delete;

    [[nodiscard]]
    ConnectionStatus load() const {
        std::shared_lock lock(mutex_);
        return value_;
    }

    void store(ConnectionStatus s) {
        std::unique_lock lock(mutex_);
        value_ = std::move(s);
    }

private:
    mutable std::shared_mutex mutex_;
    ConnectionStatus value_{};
};


// ---------------------------------------------------------------
// SubscriptionSnapshot
// ---------------------------------------------------------------
// handle -> logical name of the active subscriptions, readable from any
// thread. Written by the session on subscribe success / unsubscribe and
// cleared when the session ends.
class SubscriptionSnapshot {
public:
    using value_type = std::vector<std::pair<std::string, std::string>>;

    SubscriptionSnapshot() = default;

    SubscriptionSnapshot(const SubscriptionSnapshot&) = delete;
    SubscriptionSnapshot& operator=(const SubscriptionSnapshot&) = delete;

    void insert(const std::string& handle, const std::string& logical) {
        std::unique_lock lock(mutex_);
        entries_[handle] = logical;
    }

    void erase(const std::string& handle) {
        std::unique_lock lock(mutex_);
        entries_.erase(handle);
    }

    void clear() {
        std::unique_lock lock(mutex_);
        entries_.clear();
    }

    // Sorted by handle
    [[nodiscard]]
    value_type load() const {
        std::shared_lock lock(mutex_);
        return value_type(entries_.begin(), entries_.end());
    }

    [[nodiscard]]
    std::size_t size() const {
        std::shared_lock lock(mutex_);
        return entries_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::string> entries_;
};

} // namespace wiregate::core::protocol::centrifugo
