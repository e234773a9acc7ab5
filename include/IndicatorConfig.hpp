#pragma once

#include "IndicatorRequest.hpp"
#include "IndicatorResult.hpp"
#include "Series.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tdcore {

/// Represents a single indicator definition from a config file
struct IndicatorDefinition {
    std::string variable_name;      // e.g., "TD_HA"
    std::string indicator_type;     // e.g., "TD SEQUENTIAL"
    std::vector<double> params;     // Numeric parameters
    std::map<std::string, std::string> flags;  // --key=value modifiers

    // Source line, kept for error reporting
    std::string source_line;
    int line_number = 0;
};

/// Result of parsing a config file
struct ConfigParseResult {
    bool success = false;
    std::vector<IndicatorDefinition> definitions;
    std::string error_message;

    // Statistics
    int total_lines = 0;
    int parsed_indicators = 0;
    int comment_lines = 0;
    int blank_lines = 0;
    int skipped_lines = 0;
};

/// Parser for var.txt style indicator lists
class IndicatorConfigParser {
public:
    /// Parse config file
    ///
    /// Syntax:
    ///   VARIABLE_NAME: INDICATOR_TYPE param1 param2 ... --flag=value
    ///
    /// Flags are written --key=value (or a bare --key). Any other token after
    /// the parameters makes the line malformed.
    ///
    /// Examples:
    ///   HA: HEIKEN ASHI
    ///   TD: TD SEQUENTIAL 4 2 --source=heiken_ashi
    ///   TD_LONG: TD SEQUENTIAL 4 2 9 13 8 --tdst=true_range
    ///   BB: BOLLINGER BANDS 20 1 2 3 --ma=ema
    ///
    /// TD SEQUENTIAL parameters are setup lookback, countdown lookback, setup
    /// target, countdown target and qualifier bar; BOLLINGER BANDS takes the
    /// period followed by the multipliers. Omitted values keep their defaults.
    static ConfigParseResult parse_file(const std::string& file_path);

    /// Parse a single line
    static std::optional<IndicatorDefinition> parse_line(
        const std::string& line,
        int line_number = 0
    );

    /// Validate that the type is known and the parameters fit it
    static bool validate_definition(const IndicatorDefinition& def, std::string& error);

    /// Build the request described by `def`
    static bool to_request(const IndicatorDefinition& def, IndicatorRequest& request, std::string& error);

private:
    /// Check if a token is a flag (starts with --)
    static bool is_flag(const std::string& token);

    /// Split `--key=value` into a lower-cased key and its value. A bare
    /// `--key` reads as "true"; an empty key or empty value is rejected.
    static std::optional<std::pair<std::string, std::string>> parse_flag(const std::string& token);
};

/// Write indicator results to CSV file
class IndicatorResultWriter {
public:
    /// One row per bar: bar, timestamp, open, high, low, close followed by the
    /// columns of every result, prefixed with the result name. Values an
    /// indicator does not define on a bar are written as empty cells; a result
    /// without output contributes empty columns.
    static bool write_csv(
        const std::string& output_path,
        const BarSeries& series,
        const std::vector<IndicatorResult>& results,
        std::string* error = nullptr
    );

    /// Column names write_csv() emits for `result`, without the bar columns.
    static std::vector<std::string> column_names(const IndicatorResult& result);
};

} // namespace tdcore
