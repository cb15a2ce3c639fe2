#pragma once

#include <string>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>

#include "wiregate/core/protocol/control/req_id.hpp"
#include "lcr/log/logger.hpp"


namespace wiregate::core::protocol::centrifugo::channel {

/*
===============================================================================
PendingRequests (request correlator)
===============================================================================

Tracks outbound requests awaiting their reply, keyed by request id.

Core Invariants
---------------
• Id 1 is reserved for the connect request and is never allocated here.
• Allocated ids start at 2, increase strictly and are never reused within
  one session.
• A request id appears at most once; take() removes it, so a duplicate or
  stale reply resolves to nothing.
• Not thread-safe (session thread only).
===============================================================================
*/

enum class RequestKind : std::uint8_t {
    Subscribe,
    Unsubscribe
};

struct PendingRequest {
    RequestKind kind{RequestKind::Subscribe};
    std::string handle;     // caller-chosen subscription handle
    std::string channel;    // server channel name ("<prefix>:<name>")
    std::string logical;    // logical name (subscribe only)
};

class PendingRequests {
public:
    PendingRequests() = default;

    // ------------------------------------------------------------
    // Allocate the next request id
    // ------------------------------------------------------------
    [[nodiscard]]
    inline ctrl::req_id_t next_id() noexcept {
        return next_id_++;
    }

    // Id the next call to next_id() will return
    [[nodiscard]]
    inline ctrl::req_id_t peek_next_id() const noexcept {
        return next_id_;
    }

    // ------------------------------------------------------------
    // Register a pending request
    // Returns false if the id is reserved or already pending
    // ------------------------------------------------------------
    inline bool add(ctrl::req_id_t req_id, PendingRequest request) {
        if (req_id < ctrl::PROTOCOL_BASE_REQ_ID) {
            WG_WARN("[PENDING] Refusing reserved request id " << req_id);
            return false;
        }
        auto [it, inserted] = requests_.try_emplace(req_id, std::move(request));
        if (!inserted) {
            WG_WARN("[PENDING] Duplicate request id " << req_id);
            return false;
        }
        return true;
    }

    // ------------------------------------------------------------
    // Remove and return the request answered by `req_id`
    // ------------------------------------------------------------
    [[nodiscard]]
    inline std::optional<PendingRequest> take(ctrl::req_id_t req_id) {
        auto it = requests_.find(req_id);
        if (it == requests_.end()) {
            return std::nullopt;
        }
        PendingRequest out = std::move(it->second);
        requests_.erase(it);
        return out;
    }

    // Drop a request without a reply (send failure)
    inline bool remove(ctrl::req_id_t req_id) noexcept {
        return requests_.erase(req_id) > 0;
    }

    // ------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------

    [[nodiscard]]
    inline bool contains(ctrl::req_id_t req_id) const noexcept {
        return requests_.contains(req_id);
    }

    [[nodiscard]]
    inline bool empty() const noexcept {
        return requests_.empty();
    }

    [[nodiscard]]
    inline std::size_t count() const noexcept {
        return requests_.size();
    }

    // Drop all pending requests (session termination)
    inline void clear() noexcept {
        requests_.clear();
    }

private:
    ctrl::req_id_t next_id_{ctrl::PROTOCOL_BASE_REQ_ID};
    std::unordered_map<ctrl::req_id_t, PendingRequest> requests_;
};

} // namespace wiregate::core::protocol::centrifugo::channel
