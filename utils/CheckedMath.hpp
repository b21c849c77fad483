#pragma once

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

// 64-bit ledger arithmetic with 128-bit intermediates. Every narrowing back to
// 64 bits is range checked; callers never see a wrapped value.
namespace utils {

    using int128 = __int128;

    inline std::int64_t narrow(int128 value, const char* what = "value") {
        if (value > static_cast<int128>(std::numeric_limits<std::int64_t>::max()) ||
            value < static_cast<int128>(std::numeric_limits<std::int64_t>::min())) {
            throw std::overflow_error(std::string("int64 overflow: ") + what);
        }
        return static_cast<std::int64_t>(value);
    }

    inline std::int64_t checked_add(std::int64_t a, std::int64_t b, const char* what = "add") {
        return narrow(static_cast<int128>(a) + b, what);
    }

    inline std::int64_t checked_sub(std::int64_t a, std::int64_t b, const char* what = "sub") {
        return narrow(static_cast<int128>(a) - b, what);
    }

    inline std::int64_t checked_mul(std::int64_t a, std::int64_t b, const char* what = "mul") {
        return narrow(static_cast<int128>(a) * b, what);
    }

    // a * b / d, truncating toward zero.
    inline std::int64_t mul_div(std::int64_t a, std::int64_t b, std::int64_t d, const char* what = "mul_div") {
        if (d == 0) throw std::domain_error(std::string("division by zero: ") + what);
        return narrow(static_cast<int128>(a) * b / d, what);
    }

} // namespace utils
