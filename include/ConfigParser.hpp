#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <string_view>

#include "OutputHandler.hpp"
#include "RegulatorConfig.hpp"

/**
 * @brief `key, value` reader for RegulatorConfig.
 * @details One setting per line. Blank lines and lines starting with '#'
 * are skipped. Every rejection is reported through OutputHandler::logError.
 */
class ConfigParser {
public:
    explicit ConfigParser(OutputHandler& handler);

    /**
     * @brief Applies a single line to config.
     * @return false (config untouched) on a malformed line, an unknown key,
     * or a value that makes config fail validate().
     */
    bool parseAndApply(const std::string& raw, RegulatorConfig& config);

    /**
     * @brief Applies every line of input, all-or-nothing.
     * @details Lines are applied to a staged copy; config is only replaced
     * when every line parsed and the final result validates.
     */
    bool load(std::istream& input, RegulatorConfig& config);

protected:
    std::string_view next_field(std::string_view& line);
    bool try_parse_decimal(std::string_view sv, Decimal& value);
    bool try_parse_uint64_t(std::string_view sv, uint64_t& value);

private:
    enum class LineResult { APPLIED, SKIPPED, REJECTED };

    LineResult applyLine(std::string_view line, RegulatorConfig& config);
    bool applySetting(std::string_view key, std::string_view value, RegulatorConfig& config);

    OutputHandler& outputHandler_;
};
