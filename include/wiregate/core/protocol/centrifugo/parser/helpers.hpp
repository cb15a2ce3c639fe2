#pragma once

#include <string>
#include <cstdint>
#include <string_view>

#include "wiregate/core/protocol/centrifugo/parser/result.hpp"
#include "lcr/optional.hpp"

#include <simdjson.h>

/*
================================================================================
Gateway JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Low-level helpers used by the reply and push parsers to extract primitive
values from simdjson DOM elements.

  • Enforce basic JSON structural rules (object presence, type correctness)
  • Provide strict optional-field handling: absent or null is Ok, present
    with the wrong type is InvalidSchema
  • Never log, never throw

Helpers MUST NOT interpret values semantically.
================================================================================
*/


namespace wiregate::core::protocol::centrifugo::parser::helper {

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline parser::Result require_object(const simdjson::dom::element& root) noexcept {
    return (root.type() == simdjson::dom::element_type::OBJECT) ? parser::Result::Ok : parser::Result::InvalidSchema;
}

// Field present with a non-null value
[[nodiscard]]
inline bool has_value(const simdjson::dom::element& obj, const char* key) noexcept {
    if (require_object(obj) != parser::Result::Ok) {
        return false;
    }
    simdjson::dom::element value;
    if (obj[key].get(value)) {
        return false;
    }
    return value.type() != simdjson::dom::element_type::NULL_VALUE;
}

// ------------------------------------------------------------
// OPTIONAL OBJECT FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline parser::Result parse_object_optional(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out, bool& present) noexcept {
    // Default: not present
    present = false;
    // Parent must be an object
    if (require_object(parent) != parser::Result::Ok) {
        return parser::Result::InvalidSchema;
    }
    // Lookup field
    if (parent[key].get(out)) {
        return parser::Result::Ok; // optional, not present
    }
    if (out.type() == simdjson::dom::element_type::NULL_VALUE) {
        return parser::Result::Ok; // null reads as absent
    }
    // Field must be an object
    if (require_object(out) != parser::Result::Ok) {
        return parser::Result::InvalidSchema;
    }
    present = true;
    return parser::Result::Ok;
}

// ============================================================================
// REQUIRED FIELD PARSERS
// ============================================================================

[[nodiscard]]
inline parser::Result parse_uint32_required(const simdjson::dom::element& obj, const char* key, std::uint32_t& out) noexcept {
    // Parent must be an object
    if (require_object(obj) != parser::Result::Ok) {
        return parser::Result::InvalidSchema;
    }
    // Lookup field
    auto field = obj[key];
    if (field.error()) {
        return parser::Result::InvalidSchema;
    }
    // Extract value (must fit in 32 bits)
    std::uint64_t tmp{};
    if (field.get(tmp) || tmp > UINT32_MAX) {
        return parser::Result::InvalidSchema;
    }
    out = static_cast<std::uint32_t>(tmp);
    return parser::Result::Ok;
}

[[nodiscard]]
inline parser::Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string_view& out) noexcept {
    // Parent must be an object
    if (require_object(obj) != parser::Result::Ok) {
        return parser::Result::InvalidSchema;
    }
    // Lookup field
    auto field = obj[key];
    if (field.error()) {
        return parser::Result::InvalidSchema;
    }
    // Extract string
    if (field.get(out)) {
        return parser::Result::InvalidSchema;
    }
    return parser::Result::Ok;
}

// ============================================================================
// OPTIONAL FIELD PARSERS
// ============================================================================

[[nodiscard]]
inline parser::Result parse_uint64_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::uint64_t>& out) noexcept {
    // Always reset output (streaming safety)
    out.reset();
    // Parent must be an object
    if (require_object(obj) != parser::Result::Ok) {
        return parser::Result::InvalidSchema;
    }
    // Lookup field
    simdjson::dom::element value;
    if (obj[key].get(value)) {
        return parser::Result::Ok; // optional, not present
    }
    if (value.type() == simdjson::dom::element_type::NULL_VALUE) {
        return parser::Result::Ok; // null reads as absent
    }
    // Extract value
    std::uint64_t tmp{};
    if (value.get(tmp)) {
        return parser::Result::InvalidSchema;
    }
    out = tmp;
    return parser::Result::Ok;
}

// Raw (minified) JSON text of an optional field of any type
[[nodiscard]]
inline parser::Result parse_raw_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::string>& out) {
    // Always reset output (streaming safety)
    out.reset();
    // Parent must be an object
    if (require_object(obj) != parser::Result::Ok) {
        return parser::Result::InvalidSchema;
    }
    // Lookup field
    simdjson::dom::element value;
    if (obj[key].get(value)) {
        return parser::Result::Ok; // optional, not present
    }
    out = simdjson::minify(value);
    return parser::Result::Ok;
}

} // namespace wiregate::core::protocol::centrifugo::parser::helper
