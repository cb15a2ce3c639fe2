#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>


namespace wiregate::core::protocol::centrifugo::parser {

/*
===============================================================================
Decode outcome of a single inbound JSON object
===============================================================================

Helpers report Ok / InvalidSchema for one field. Schema parsers report Parsed
for a fully decoded reply or push. The router reports Delivered once the
decoded value reached the session sink, and Ignored / InvalidJson for frames
that never got that far. None of these are errors towards the session:
malformed frames are logged and dropped.
===============================================================================
*/
enum class Result : std::uint8_t {
    Ok,             // field extracted, or optional field absent
    Parsed,         // reply / push decoded
    Delivered,      // handed to the sink (reply, push or ping)
    Ignored,        // well-formed JSON with no known shape
    InvalidJson,
    InvalidSchema   // required field missing or of the wrong type
};

[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Ok:            return "Ok";
        case Result::Parsed:        return "Parsed";
        case Result::Delivered:     return "Delivered";
        case Result::Ignored:       return "Ignored";
        case Result::InvalidJson:   return "InvalidJson";
        case Result::InvalidSchema: return "InvalidSchema";
    }
    return "Unknown";
}

inline std::ostream& operator<<(std::ostream& os, Result r) {
    return os << to_string(r);
}

} // namespace wiregate::core::protocol::centrifugo::parser
