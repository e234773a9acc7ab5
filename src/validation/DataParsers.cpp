#include "validation/DataParsers.hpp"

#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace tdcore {
namespace validation {

namespace {

std::string trim(const std::string& s)
{
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

/// Comma or semicolon separated lines keep empty cells; otherwise split on whitespace.
std::vector<std::string> split_fields(const std::string& line)
{
    std::vector<std::string> fields;
    const char separator = line.find(',') != std::string::npos ? ','
                         : line.find(';') != std::string::npos ? ';'
                         : '\0';

    if (separator == '\0') {
        std::istringstream iss(line);
        std::string token;
        while (iss >> token) {
            fields.push_back(token);
        }
        return fields;
    }

    std::string cell;
    std::istringstream iss(line);
    while (std::getline(iss, cell, separator)) {
        fields.push_back(trim(cell));
    }
    if (!line.empty() && line.back() == separator) {
        fields.emplace_back();
    }
    return fields;
}

bool all_digits(const std::string& s)
{
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::string strip(std::string s, char ch)
{
    s.erase(std::remove(s.begin(), s.end(), ch), s.end());
    return s;
}

bool is_missing(const std::string& token)
{
    std::string lower = token;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower.empty() || lower == "nan" || lower == "-nan" || lower == "na"
        || lower == "null" || lower == "none";
}

enum class PriceParse {
    Ok,
    Missing,
    Invalid,
};

PriceParse parse_price(const std::string& token, double& value)
{
    if (is_missing(token)) {
        return PriceParse::Missing;
    }
    char* end = nullptr;
    value = std::strtod(token.c_str(), &end);
    if (end == token.c_str() || *end != '\0') {
        return PriceParse::Invalid;
    }
    return std::isfinite(value) ? PriceParse::Ok : PriceParse::Missing;
}

bool parse_integer(const std::string& token, std::int64_t& value)
{
    char* end = nullptr;
    value = std::strtoll(token.c_str(), &end, 10);
    return end != token.c_str() && *end == '\0';
}

/// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d)
{
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

/// True when the first two fields look like a calendar date and a clock time.
bool has_date_time_layout(const std::vector<std::string>& fields)
{
    return fields.size() >= 6 && all_digits(strip(fields[0], '-')) && strip(fields[0], '-').size() == 8
        && all_digits(strip(fields[1], ':')) && strip(fields[1], ':').size() <= 6;
}

} // namespace

std::string OhlcvParser::last_error_;
std::size_t OhlcvParser::dropped_rows_ = 0;

std::optional<std::int64_t> OhlcvParser::to_epoch_seconds(const std::string& date, const std::string& time)
{
    const std::string d = strip(date, '-');
    std::string t = strip(time, ':');
    if (d.size() != 8 || !all_digits(d) || t.empty() || t.size() > 6 || !all_digits(t)) {
        return std::nullopt;
    }
    if (t.size() <= 4) {
        t = std::string(4 - t.size(), '0') + t + "00";
    } else if (t.size() == 5) {
        t = "0" + t;
    }

    const int year = std::stoi(d.substr(0, 4));
    const int month = std::stoi(d.substr(4, 2));
    const int day = std::stoi(d.substr(6, 2));
    const int hour = std::stoi(t.substr(0, 2));
    const int minute = std::stoi(t.substr(2, 2));
    const int second = std::stoi(t.substr(4, 2));

    if (month < 1 || month > 12 || day < 1 || day > 31
        || hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }

    return days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * 86400
         + hour * 3600 + minute * 60 + second;
}

BarSeries OhlcvParser::parse_file(const std::string& filepath)
{
    last_error_.clear();
    dropped_rows_ = 0;
    BarSeries series;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        last_error_ = "Failed to open file: " + filepath;
        return series;
    }

    std::string line;
    std::size_t line_num = 0;
    bool first_row = true;

    auto fail = [&](const std::string& message) {
        last_error_ = "Parse error at line " + std::to_string(line_num) + ": " + message;
        return BarSeries{};
    };

    while (std::getline(file, line)) {
        ++line_num;

        line = trim(line);
        if (line.empty()) {
            continue;
        }

        auto fields = split_fields(line);
        const bool header_candidate = first_row;
        first_row = false;

        // A header's first cell is neither a date nor a timestamp
        if (header_candidate && !all_digits(strip(fields[0], '-'))) {
            continue;
        }

        const bool date_time = has_date_time_layout(fields);
        const std::size_t price_offset = date_time ? 2 : 1;

        if (fields.size() < price_offset + 4) {
            ++dropped_rows_;
            Logger::Log(filepath + ":" + std::to_string(line_num) + ": dropped row with missing fields");
            continue;
        }

        Bar bar;
        if (date_time) {
            auto ts = to_epoch_seconds(fields[0], fields[1]);
            if (!ts) {
                return fail("invalid date/time '" + fields[0] + " " + fields[1] + "'");
            }
            bar.timestamp = *ts;
        } else if (!parse_integer(fields[0], bar.timestamp)) {
            return fail("invalid timestamp '" + fields[0] + "'");
        }

        double* const prices[] = {&bar.open, &bar.high, &bar.low, &bar.close};
        bool missing = false;
        for (std::size_t p = 0; p < 4; ++p) {
            const std::string& token = fields[price_offset + p];
            switch (parse_price(token, *prices[p])) {
                case PriceParse::Ok:
                    break;
                case PriceParse::Missing:
                    missing = true;
                    break;
                case PriceParse::Invalid:
                    return fail("invalid price '" + token + "'");
            }
        }

        if (missing) {
            ++dropped_rows_;
            Logger::Log(filepath + ":" + std::to_string(line_num) + ": dropped row with missing price");
            continue;
        }

        series.push_back(bar);
    }

    if (dropped_rows_ > 0) {
        Logger::Log("Dropped " + std::to_string(dropped_rows_) + " row(s) from " + filepath);
    }

    if (series.empty()) {
        last_error_ = "No data parsed from file";
    }

    return series;
}

std::string OhlcvParser::get_last_error()
{
    return last_error_;
}

std::size_t OhlcvParser::get_dropped_rows()
{
    return dropped_rows_;
}

} // namespace validation
} // namespace tdcore
