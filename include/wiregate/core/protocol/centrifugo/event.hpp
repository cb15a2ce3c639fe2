#pragma once

#include <string>
#include <cstdint>
#include <ostream>
#include <utility>
#include <functional>
#include <string_view>

#include "lcr/json.hpp"


namespace wiregate::core::protocol::centrifugo {

/*
===============================================================================
 Session events
===============================================================================

Notifications emitted by a session, in the order the inbound frames and
commands that caused them were processed:

    Connected                           handshake reply succeeded
    Disconnected { reason }             clean close / user disconnect
    Error { message }                   transport or handshake failure
    Subscribed { handle }               subscribe reply succeeded
    SubscriptionError { handle, msg }   subscribe reply carried an error
    Publication { handle, data }        push on a subscribed channel;
                                        data is the raw JSON of pub.data
===============================================================================
*/

enum class EventType : std::uint8_t {
    Connected,
    Disconnected,
    Error,
    Subscribed,
    SubscriptionError,
    Publication
};

// Kebab-case wire tag (also used as the "type" field of to_json())
[[nodiscard]]
inline constexpr std::string_view to_string(EventType t) noexcept {
    switch (t) {
        case EventType::Connected:         return "connected";
        case EventType::Disconnected:      return "disconnected";
        case EventType::Error:             return "error";
        case EventType::Subscribed:        return "subscribed";
        case EventType::SubscriptionError: return "subscription-error";
        case EventType::Publication:       return "publication";
        default:                           return "unknown";
    }
}

struct Event {
    EventType type{EventType::Connected};
    std::string handle;     // Subscribed, SubscriptionError, Publication
    std::string text;       // Disconnected reason, Error / SubscriptionError message
    std::string data;       // Publication payload (raw JSON)

    static Event connected() {
        return Event{EventType::Connected, {}, {}, {}};
    }

    static Event disconnected(std::string reason) {
        return Event{EventType::Disconnected, {}, std::move(reason), {}};
    }

    static Event error(std::string message) {
        return Event{EventType::Error, {}, std::move(message), {}};
    }

    static Event subscribed(std::string handle) {
        return Event{EventType::Subscribed, std::move(handle), {}, {}};
    }

    static Event subscription_error(std::string handle, std::string message) {
        return Event{EventType::SubscriptionError, std::move(handle), std::move(message), {}};
    }

    static Event publication(std::string handle, std::string data) {
        return Event{EventType::Publication, std::move(handle), {}, std::move(data)};
    }

    [[nodiscard]]
    bool is_terminal() const noexcept {
        return type == EventType::Disconnected || type == EventType::Error;
    }

    bool operator==(const Event&) const = default;
};

// Event fan-out, invoked on the session thread
using EventSink = std::function<void(const Event&)>;


// -----------------------------------------------------------------------------
// Tagged JSON rendering for host shells, e.g.
//   {"type":"publication","handle":"app","data":{"msg":"hi"}}
//   {"type":"disconnected","reason":"Connection closed"}
// -----------------------------------------------------------------------------
[[nodiscard]]
inline std::string to_json(const Event& ev) {
    std::string out;
    out.reserve(32 + ev.handle.size() + ev.text.size() + ev.data.size());
    out += "{\"type\":\"";
    out += to_string(ev.type);
    out += '"';
    switch (ev.type) {
        case EventType::Connected:
            break;
        case EventType::Disconnected:
            out += ",\"reason\":";
            lcr::json::append_string(out, ev.text);
            break;
        case EventType::Error:
            out += ",\"error\":";
            lcr::json::append_string(out, ev.text);
            break;
        case EventType::Subscribed:
            out += ",\"handle\":";
            lcr::json::append_string(out, ev.handle);
            break;
        case EventType::SubscriptionError:
            out += ",\"handle\":";
            lcr::json::append_string(out, ev.handle);
            out += ",\"error\":";
            lcr::json::append_string(out, ev.text);
            break;
        case EventType::Publication:
            out += ",\"handle\":";
            lcr::json::append_string(out, ev.handle);
            out += ",\"data\":";
            out += ev.data.empty() ? std::string_view{"null"} : std::string_view{ev.data};
            break;
    }
    out += '}';
    return out;
}

inline std::ostream& operator<<(std::ostream& os, const Event& ev) {
    os << "[Event] " << to_string(ev.type);
    switch (ev.type) {
        case EventType::Connected:
            break;
        case EventType::Disconnected:
        case EventType::Error:
            os << " {" << ev.text << "}";
            break;
        case EventType::Subscribed:
            os << " {handle=" << ev.handle << "}";
            break;
        case EventType::SubscriptionError:
            os << " {handle=" << ev.handle << ", error=" << ev.text << "}";
            break;
        case EventType::Publication:
            os << " {handle=" << ev.handle << ", data=" << ev.data << "}";
            break;
    }
    return os;
}

} // namespace wiregate::core::protocol::centrifugo
