#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <utility>
#include <optional>
#include <unordered_map>

#include "lcr/log/logger.hpp"


namespace wiregate::core::protocol::centrifugo::channel {

/*
===============================================================================
Registry (active subscriptions)
===============================================================================

Bidirectional mapping between caller handles and server channel names.

Core Invariants
---------------
• A handle owns at most one channel and a channel is owned by at most one
  handle.
• by_channel_ and by_handle_ are mutual inverses at all times.
• Re-adding a handle replaces its previous channel; adding a channel owned by
  another handle transfers ownership (the previous owner is dropped).
• Not thread-safe (session thread only).
===============================================================================
*/

class Registry {
public:
    struct Entry {
        std::string channel;
        std::string logical;
    };

    Registry() = default;

    // ------------------------------------------------------------
    // Register handle <-> channel.
    // Returns the handle displaced from `channel`, if any.
    // ------------------------------------------------------------
    inline std::optional<std::string> add(const std::string& handle, const std::string& channel, const std::string& logical) {
        std::optional<std::string> displaced;

        // Handle re-subscribed elsewhere: release its previous channel
        if (auto h = by_handle_.find(handle); h != by_handle_.end() && h->second.channel != channel) {
            WG_DEBUG("[REGISTRY] Handle '" << handle << "' moves from '" << h->second.channel << "' to '" << channel << "'");
            by_channel_.erase(h->second.channel);
        }

        // Channel owned by another handle: transfer ownership
        if (auto c = by_channel_.find(channel); c != by_channel_.end() && c->second != handle) {
            WG_DEBUG("[REGISTRY] Channel '" << channel << "' taken over from '" << c->second << "' by '" << handle << "'");
            by_handle_.erase(c->second);
            displaced = c->second;
        }

        by_channel_[channel] = handle;
        by_handle_[handle] = Entry{channel, logical};
        return displaced;
    }

    // ------------------------------------------------------------
    // Remove a handle (both directions)
    // ------------------------------------------------------------
    inline std::optional<Entry> remove(const std::string& handle) {
        auto it = by_handle_.find(handle);
        if (it == by_handle_.end()) {
            return std::nullopt;
        }
        Entry entry = std::move(it->second);
        by_handle_.erase(it);
        by_channel_.erase(entry.channel);
        return entry;
    }

    // ------------------------------------------------------------
    // Lookups
    // ------------------------------------------------------------

    // Handle owning `channel`, or nullptr
    [[nodiscard]]
    inline const std::string* resolve(const std::string& channel) const noexcept {
        auto it = by_channel_.find(channel);
        return (it == by_channel_.end()) ? nullptr : &it->second;
    }

    // Entry of `handle`, or nullptr
    [[nodiscard]]
    inline const Entry* find(const std::string& handle) const noexcept {
        auto it = by_handle_.find(handle);
        return (it == by_handle_.end()) ? nullptr : &it->second;
    }

    [[nodiscard]]
    inline bool contains(const std::string& handle) const noexcept {
        return by_handle_.contains(handle);
    }

    [[nodiscard]]
    inline std::size_t size() const noexcept {
        return by_handle_.size();
    }

    [[nodiscard]]
    inline bool empty() const noexcept {
        return by_handle_.empty();
    }

    // (handle, logical name) pairs
    [[nodiscard]]
    inline std::vector<std::pair<std::string, std::string>> entries() const {
        std::vector<std::pair<std::string, std::string>> out;
        out.reserve(by_handle_.size());
        for (const auto& [handle, entry] : by_handle_) {
            out.emplace_back(handle, entry.logical);
        }
        return out;
    }

    inline void clear() noexcept {
        by_channel_.clear();
        by_handle_.clear();
    }

    // ------------------------------------------------------------
    // Invariant checker
    // ------------------------------------------------------------
    [[nodiscard]]
    inline bool is_consistent() const {
        if (by_channel_.size() != by_handle_.size()) {
            return false;
        }
        for (const auto& [handle, entry] : by_handle_) {
            auto it = by_channel_.find(entry.channel);
            if (it == by_channel_.end() || it->second != handle) {
                return false;
            }
        }
        return true;
    }

private:
    std::unordered_map<std::string, std::string> by_channel_;   // channel -> handle
    std::unordered_map<std::string, Entry> by_handle_;          // handle  -> channel, logical
};

} // namespace wiregate::core::protocol::centrifugo::channel
