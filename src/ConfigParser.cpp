#include "ConfigParser.hpp"

#include <charconv>
#include <format>
#include <system_error>

ConfigParser::ConfigParser(OutputHandler& handler) : outputHandler_(handler) {}

namespace {
    constexpr std::string_view kBlank = " \n\r\t";

    std::string_view trim(std::string_view text) {
        size_t first = text.find_first_not_of(kBlank);
        if (first == std::string_view::npos) return {};
        size_t last = text.find_last_not_of(kBlank);
        return text.substr(first, last - first + 1);
    }
}

/**
 * @brief Cuts the next field of a `key, value` line.
 * @details Returns the trimmed text up to the next comma and advances line
 * past that comma. The value field is the last one, so a non-empty remainder
 * after two calls means the line carried extra fields.
 */
std::string_view ConfigParser::next_field(std::string_view& line) {
    size_t comma = line.find(',');
    std::string_view field = line.substr(0, comma);
    line = (comma == std::string_view::npos) ? std::string_view{} : line.substr(comma + 1);
    return trim(field);
}

ConfigParser::LineResult ConfigParser::applyLine(std::string_view data, RegulatorConfig& config) {
    data = trim(data);
    if (data.empty() || data.front() == '#') return LineResult::SKIPPED;

    const std::string_view line = data;
    std::string_view key = next_field(data);
    std::string_view value = next_field(data);

    if (key.empty() || value.empty()) [[unlikely]] {
        outputHandler_.logError(std::format("Config Error: Expected 'key, value': {}", line));
        return LineResult::REJECTED;
    }

    if (!data.empty()) [[unlikely]] {
        outputHandler_.logError(std::format("Config Error: Extra fields in: {}", line));
        return LineResult::REJECTED;
    }

    return applySetting(key, value, config) ? LineResult::APPLIED : LineResult::REJECTED;
}

/**
 * @note Decimal keys accept fractional text ("0.03"); integer keys accept
 * plain unsigned integers only.
 */
bool ConfigParser::applySetting(std::string_view key, std::string_view value, RegulatorConfig& config) {
    Decimal* decimalField = nullptr;
    uint64_t* integerField = nullptr;

    if (key == "supplyChangeDivisor") decimalField = &config.supplyChangeDivisor;
    else if (key == "couponSupplyChangeDivisor") decimalField = &config.couponSupplyChangeDivisor;
    else if (key == "supplyChangeLimit") decimalField = &config.supplyChangeLimit;
    else if (key == "couponSupplyChangeLimit") decimalField = &config.couponSupplyChangeLimit;
    else if (key == "bootstrappingPrice") decimalField = &config.bootstrappingPrice;
    else if (key == "advanceIncentive") decimalField = &config.advanceIncentive;
    else if (key == "maxCouponYield") decimalField = &config.maxCouponYield;
    else if (key == "bootstrappingPeriod") integerField = &config.bootstrappingPeriod;
    else if (key == "oraclePoolRatio") integerField = &config.oraclePoolRatio;
    else if (key == "maxCouponExpiry") integerField = &config.maxCouponExpiry;
    else if (key == "maxBidsPerAuction") {
        uint64_t bids = 0;
        if (!try_parse_uint64_t(value, bids)) {
            outputHandler_.logError(std::format("Config Error: Invalid integer for {}: '{}'", key, value));
            return false;
        }
        config.maxBidsPerAuction = static_cast<std::size_t>(bids);
        return true;
    }
    else [[unlikely]] {
        outputHandler_.logError(std::format("Config Error: Unknown key '{}'", key));
        return false;
    }

    if (decimalField && !try_parse_decimal(value, *decimalField)) {
        outputHandler_.logError(std::format("Config Error: Invalid decimal for {}: '{}'", key, value));
        return false;
    }
    if (integerField && !try_parse_uint64_t(value, *integerField)) {
        outputHandler_.logError(std::format("Config Error: Invalid integer for {}: '{}'", key, value));
        return false;
    }
    return true;
}

bool ConfigParser::parseAndApply(const std::string& raw, RegulatorConfig& config) {
    RegulatorConfig staged = config;

    LineResult result = applyLine(raw, staged);
    if (result == LineResult::REJECTED) return false;
    if (result == LineResult::SKIPPED) return true;

    if (auto problem = staged.validate()) {
        outputHandler_.logError(std::format("Config Error: {}", *problem));
        return false;
    }

    config = staged;
    return true;
}

bool ConfigParser::load(std::istream& input, RegulatorConfig& config) {
    RegulatorConfig staged = config;
    std::string line;
    size_t lineNumber = 0;
    bool ok = true;

    while (std::getline(input, line)) {
        ++lineNumber;
        if (applyLine(line, staged) == LineResult::REJECTED) {
            outputHandler_.logError(std::format("Config Error: line {} rejected", lineNumber));
            ok = false;
        }
    }

    if (!ok) return false;

    if (auto problem = staged.validate()) {
        outputHandler_.logError(std::format("Config Error: {}", *problem));
        return false;
    }

    config = staged;
    return true;
}

bool ConfigParser::try_parse_uint64_t(std::string_view sv, uint64_t& value) {
    if (sv.empty()) [[unlikely]] return false;

    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    return (ec == std::errc{}) && (ptr == sv.data() + sv.size());
}

bool ConfigParser::try_parse_decimal(std::string_view sv, Decimal& value) {
    std::optional<Decimal> parsed = Decimal::parse(sv);
    if (!parsed) [[unlikely]] return false;

    value = *parsed;
    return true;
}
