#pragma once

#include "Series.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace tdcore {
namespace validation {

/**
 * @brief Parser for OHLCV text files
 *
 * Accepted row layouts, whitespace- or comma-separated:
 *   Date Time Open High Low Close [Volume]   e.g. 20241001 0000 63327.6 63606.0 63006.7 63531.99 1336.93
 *   Timestamp Open High Low Close [Volume]   e.g. 1727740800 63327.6 63606.0 63006.7 63531.99
 *
 * A leading header line is skipped. Rows with a missing or non-numeric price
 * ("nan", empty cell) are dropped and logged; any other malformed row fails
 * the whole file. Volume is read but not kept.
 */
class OhlcvParser {
public:
    /**
     * @brief Parse OHLCV data from file
     * @param filepath Path to the data file
     * @return Series in file order, or empty on error (see get_last_error())
     */
    static BarSeries parse_file(const std::string& filepath);

    /**
     * @brief Convert a YYYYMMDD date and HHMM or HHMMSS time to UTC epoch seconds
     */
    static std::optional<std::int64_t> to_epoch_seconds(const std::string& date, const std::string& time);

    /**
     * @brief Get last parse error message
     */
    static std::string get_last_error();

    /**
     * @brief Rows dropped for missing prices during the last parse
     */
    static std::size_t get_dropped_rows();

private:
    static std::string last_error_;
    static std::size_t dropped_rows_;
};

} // namespace validation
} // namespace tdcore
