#pragma once

#include <cstdint>
#include <compare>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

#include "Constants.hpp"

/**
 * @brief Arithmetic fault carried by every DecimalError.
 */
enum class MathFault : uint8_t {
    DIVISION_BY_ZERO,
    OVERFLOW,
    UNDERFLOW
};

class DecimalError : public std::runtime_error {
public:
    DecimalError(MathFault fault, const std::string& what)
        : std::runtime_error(what), fault_(fault) {}

    [[nodiscard]] MathFault fault() const noexcept { return fault_; }

private:
    MathFault fault_;
};

/**
 * @brief Unsigned 18-Decimal Fixed Point
 * @details A Decimal is a non-negative rational stored as a 256-bit integer
 * scaled by 10^18. Every operation is checked: results that would not fit,
 * go negative, or divide by zero raise DecimalError instead of wrapping.
 *
 * Products and quotients are computed in 512 bits and truncated (floor)
 * back to 256, so mul/div only fail when the final value is out of range.
 */
class Decimal {
public:
    using Raw  = boost::multiprecision::uint256_t;
    using Wide = boost::multiprecision::uint512_t;

    Decimal() = default;

    // --- Constructors ---
    static Decimal zero() { return Decimal{}; }
    static Decimal one() { return fromRaw(base()); }
    static Decimal max();
    static Decimal from(uint64_t whole);
    static Decimal fromRaw(const Raw& raw);

    /** @brief a / b as a Decimal, for integer operands. */
    static Decimal ratio(uint64_t a, uint64_t b);
    static Decimal ratio(const Decimal& a, const Decimal& b) { return a.div(b); }

    /**
     * @brief Parses "123", "0.05", "1.000000000000000001".
     * @return nullopt on anything else (signs, exponents, >18 fraction digits, overflow).
     */
    static std::optional<Decimal> parse(std::string_view text);

    // --- Arithmetic ---
    [[nodiscard]] Decimal add(const Decimal& b) const;
    [[nodiscard]] Decimal sub(const Decimal& b) const;
    [[nodiscard]] Decimal mul(const Decimal& b) const;
    [[nodiscard]] Decimal div(const Decimal& b) const;
    [[nodiscard]] Decimal pow(unsigned exponent) const;

    // Clamps at zero instead of raising UNDERFLOW.
    [[nodiscard]] Decimal saturatingSub(const Decimal& b) const;

    /**
     * @brief Newton square root, floor policy.
     * @details z = (x + 1) / 2; n = (x / z + z) / 2; while (n < z) { z = n; n = ...; }
     * Stops at the first non-decreasing estimate and returns the floor of the
     * fixed-point root for every x, including x < 1 (sqrt(0.25) == 0.5).
     */
    [[nodiscard]] Decimal sqrt() const;

    // --- Comparison ---
    bool lessThan(const Decimal& b) const { return value_ < b.value_; }
    bool greaterThan(const Decimal& b) const { return value_ > b.value_; }
    bool equals(const Decimal& b) const { return value_ == b.value_; }
    bool isZero() const { return value_.is_zero(); }

    std::strong_ordering operator<=>(const Decimal& other) const {
        if (value_ < other.value_) return std::strong_ordering::less;
        if (value_ > other.value_) return std::strong_ordering::greater;
        return std::strong_ordering::equal;
    }
    bool operator==(const Decimal& other) const { return value_ == other.value_; }

    // --- Conversion ---
    const Raw& raw() const { return value_; }
    uint64_t toUint64() const;     // floor; OVERFLOW if the integer part exceeds 64 bits
    double toDouble() const;       // display only
    std::string toString() const;

    static const Raw& base();

private:
    explicit Decimal(const Raw& raw) : value_(raw) {}

    static Decimal narrow(const Wide& wide, const char* op);

    Raw value_{0};
};

template <>
struct std::formatter<Decimal> : std::formatter<std::string> {
    auto format(const Decimal& d, std::format_context& ctx) const {
        return std::formatter<std::string>::format(d.toString(), ctx);
    }
};
