#pragma once

#include <string>
#include <utility>
#include <type_traits>


namespace lcr {

// Presence flag plus an in-place value, for fields a frame may omit.
// Schema objects are reused across frames by the parser, so reset() puts the
// value back to T{} as well as clearing the flag.
template <typename T>
class optional {
public:
    optional() = default;

    [[nodiscard]] bool has() const noexcept { return has_; }

    // Defined only after has(); otherwise the default value.
    [[nodiscard]] const T& value() const noexcept { return value_; }

    void reset() {
        has_ = false;
        value_ = T{};
    }

    template <typename U>
        requires (!std::is_same_v<std::remove_cvref_t<U>, optional>)
    optional& operator=(U&& v) {
        value_ = std::forward<U>(v);
        has_ = true;
        return *this;
    }

private:
    bool has_{false};
    T value_{};
};


// "null" when absent; numbers bare, everything else quoted
template <typename T>
inline std::string to_string(const optional<T>& opt) {
    if (!opt.has()) {
        return "null";
    }
    if constexpr (std::is_arithmetic_v<T>) {
        return std::to_string(opt.value());
    }
    else {
        return "\"" + std::string(opt.value()) + "\"";
    }
}

} // namespace lcr
