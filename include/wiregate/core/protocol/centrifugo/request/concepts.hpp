#pragma once

#include <string>
#include <concepts>
#include <type_traits>

#include "wiregate/core/protocol/control/req_id.hpp"

namespace wiregate::core::protocol::centrifugo::request {

/*
===============================================================================
Request Concepts (Compile-time API Safety)
===============================================================================

These concepts constrain the session send path so that only valid request
types can be serialized and correlated.

Each request type must explicitly encode its intent by defining exactly one
of the following tags:
  - subscribe_tag
  - unsubscribe_tag
  - control_tag

and must carry its request id and serialize itself with to_json().
===============================================================================
*/

namespace detail {

// Count how many intent tags a type defines
template <typename T>
constexpr int intent_tag_count =
    (requires { typename T::subscribe_tag; }   ? 1 : 0) +
    (requires { typename T::unsubscribe_tag; } ? 1 : 0) +
    (requires { typename T::control_tag; }     ? 1 : 0);

} // namespace detail


// -----------------------------------------------------------------------------
// Subscription request
// -----------------------------------------------------------------------------
template <typename T>
concept Subscription =
    requires {
        typename T::subscribe_tag;
    };

// -----------------------------------------------------------------------------
// Unsubscription request
// -----------------------------------------------------------------------------
template <typename T>
concept Unsubscription =
    requires {
        typename T::unsubscribe_tag;
    };

// -----------------------------------------------------------------------------
// Control-plane request (connect)
// -----------------------------------------------------------------------------
template <typename T>
concept Control =
    requires {
        typename T::control_tag;
    };


// -----------------------------------------------------------------------------
// Validation helper
// -----------------------------------------------------------------------------
template <typename T>
concept ValidRequestIntent = detail::intent_tag_count<T> == 1;

// -----------------------------------------------------------------------------
// Anything the session may put on the wire
// -----------------------------------------------------------------------------
template <typename T>
concept Request =
    ValidRequestIntent<T> &&
    requires(const T& req) {
        { req.id } -> std::convertible_to<ctrl::req_id_t>;
        { req.to_json() } -> std::same_as<std::string>;
    };

} // namespace wiregate::core::protocol::centrifugo::request
