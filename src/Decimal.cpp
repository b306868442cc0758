#include "Decimal.hpp"

#include <limits>

namespace {
    const Decimal::Raw& maxRaw() {
        static const Decimal::Raw v = std::numeric_limits<Decimal::Raw>::max();
        return v;
    }
}

const Decimal::Raw& Decimal::base() {
    static const Raw v(std::string(Config::BASE_STRING).c_str());
    return v;
}

Decimal Decimal::max() {
    return Decimal{maxRaw()};
}

Decimal Decimal::from(uint64_t whole) {
    return Decimal{Raw(whole) * base()};
}

Decimal Decimal::fromRaw(const Raw& raw) {
    return Decimal{raw};
}

Decimal Decimal::ratio(uint64_t a, uint64_t b) {
    if (b == 0) [[unlikely]] {
        throw DecimalError(MathFault::DIVISION_BY_ZERO, "Decimal::ratio: zero denominator");
    }
    return Decimal{Raw(a) * base() / Raw(b)};
}

// Every widened result funnels through here before becoming a Decimal.
Decimal Decimal::narrow(const Wide& wide, const char* op) {
    if (wide > Wide(maxRaw())) [[unlikely]] {
        throw DecimalError(MathFault::OVERFLOW, std::format("Decimal::{}: result exceeds 256 bits", op));
    }
    return Decimal{Raw(wide)};
}

Decimal Decimal::add(const Decimal& b) const {
    return narrow(Wide(value_) + Wide(b.value_), "add");
}

Decimal Decimal::sub(const Decimal& b) const {
    if (b.value_ > value_) [[unlikely]] {
        throw DecimalError(MathFault::UNDERFLOW,
                           std::format("Decimal::sub: {} - {} is negative", toString(), b.toString()));
    }
    return Decimal{value_ - b.value_};
}

Decimal Decimal::saturatingSub(const Decimal& b) const {
    return (b.value_ >= value_) ? Decimal{} : Decimal{value_ - b.value_};
}

Decimal Decimal::mul(const Decimal& b) const {
    return narrow(Wide(value_) * Wide(b.value_) / Wide(base()), "mul");
}

Decimal Decimal::div(const Decimal& b) const {
    if (b.value_.is_zero()) [[unlikely]] {
        throw DecimalError(MathFault::DIVISION_BY_ZERO,
                           std::format("Decimal::div: {} / 0", toString()));
    }
    return narrow(Wide(value_) * Wide(base()) / Wide(b.value_), "div");
}

Decimal Decimal::pow(unsigned exponent) const {
    Decimal result = one();
    for (unsigned i = 0; i < exponent; ++i) {
        result = result.mul(*this);
    }
    return result;
}

Decimal Decimal::sqrt() const {
    if (value_.is_zero()) return zero();

    // Newton on the raw integers: floor(sqrt(raw * 10^18)) is the scaled root.
    // The (x + 1) / 2 seed is never below the root, so estimates only fall.
    const Wide scaled = Wide(value_) * Wide(base());
    Wide z = (Wide(value_) + Wide(base())) / 2;
    Wide next = (scaled / z + z) / 2;
    while (next < z) {
        z = next;
        next = (scaled / z + z) / 2;
    }
    return narrow(z, "sqrt");
}

uint64_t Decimal::toUint64() const {
    Raw whole = value_ / base();
    if (whole > Raw(std::numeric_limits<uint64_t>::max())) [[unlikely]] {
        throw DecimalError(MathFault::OVERFLOW, "Decimal::toUint64: integer part exceeds 64 bits");
    }
    return whole.convert_to<uint64_t>();
}

double Decimal::toDouble() const {
    return value_.convert_to<double>() / base().convert_to<double>();
}

std::string Decimal::toString() const {
    Raw whole = value_ / base();
    Raw frac  = value_ % base();

    std::string out = whole.str();
    if (frac.is_zero()) return out;

    std::string digits = frac.str();
    digits.insert(0, Config::DECIMALS - digits.size(), '0');
    digits.erase(digits.find_last_not_of('0') + 1);

    out += '.';
    out += digits;
    return out;
}

std::optional<Decimal> Decimal::parse(std::string_view text) {
    if (text.empty()) return std::nullopt;

    size_t dot = text.find('.');
    std::string_view wholePart = text.substr(0, dot);
    std::string_view fracPart = (dot == std::string_view::npos) ? std::string_view{} : text.substr(dot + 1);

    if (wholePart.empty() && fracPart.empty()) return std::nullopt;
    if (dot != std::string_view::npos && fracPart.empty()) return std::nullopt;   // "5."
    if (fracPart.size() > Config::DECIMALS) return std::nullopt;

    Wide acc = 0;
    const Wide limit(maxRaw());

    auto consume = [&](std::string_view digits) -> bool {
        for (char c : digits) {
            if (c < '0' || c > '9') return false;
            acc = acc * 10 + static_cast<unsigned>(c - '0');
            if (acc > limit) return false;
        }
        return true;
    };

    if (!consume(wholePart) || !consume(fracPart)) return std::nullopt;

    // Scale up by whatever fractional digits were omitted.
    for (size_t i = fracPart.size(); i < Config::DECIMALS; ++i) {
        acc *= 10;
        if (acc > limit) return std::nullopt;
    }
    return Decimal{Raw(acc)};
}
