#include "IndicatorConfig.hpp"

#include "IndicatorId.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace tdcore {

namespace {

bool parse_number(const std::string& token, double& value)
{
    char* end = nullptr;
    value = std::strtod(token.c_str(), &end);
    return end != token.c_str() && *end == '\0';
}

bool to_int(double value, int& out)
{
    if (!std::isfinite(value) || std::floor(value) != value
        || value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

bool read_int_params(const IndicatorDefinition& def, std::vector<int>& out, std::string& error)
{
    out.clear();
    for (std::size_t i = 0; i < def.params.size(); ++i) {
        int value = 0;
        if (!to_int(def.params[i], value)) {
            std::ostringstream oss;
            oss << "Parameter " << (i + 1) << " of " << def.variable_name
                << " must be an integer, got " << def.params[i];
            error = oss.str();
            return false;
        }
        out.push_back(value);
    }
    return true;
}

bool apply_source_flag(const std::string& value, PriceSource& source, std::string& error)
{
    auto parsed = parse_price_source(value);
    if (!parsed) {
        error = "Unknown price source '" + value + "'";
        return false;
    }
    source = *parsed;
    return true;
}

bool build_sequential(const IndicatorDefinition& def, SequentialParameters& p, std::string& error)
{
    std::vector<int> values;
    if (!read_int_params(def, values, error)) {
        return false;
    }
    if (values.size() > 5) {
        error = "TD SEQUENTIAL takes at most 5 parameters, got " + std::to_string(values.size());
        return false;
    }

    int* const slots[] = {&p.setup_lookback, &p.countdown_lookback, &p.setup_target,
                          &p.countdown_target, &p.qualifier_bar};
    for (std::size_t i = 0; i < values.size(); ++i) {
        *slots[i] = values[i];
    }

    for (const auto& [key, value] : def.flags) {
        if (key == "source") {
            if (!apply_source_flag(value, p.source, error)) {
                return false;
            }
        } else if (key == "tdst") {
            auto parsed = parse_tdst_source(value);
            if (!parsed) {
                error = "Unknown TDST source '" + value + "'";
                return false;
            }
            p.tdst_source = *parsed;
        } else {
            error = "Unknown flag --" + key + " for TD SEQUENTIAL";
            return false;
        }
    }
    return true;
}

bool build_bands(const IndicatorDefinition& def, BandParameters& p, std::string& error)
{
    std::vector<int> values;
    if (!read_int_params(def, values, error)) {
        return false;
    }
    if (!values.empty()) {
        p.period = values.front();
    }
    if (values.size() > 1) {
        p.multipliers.assign(values.begin() + 1, values.end());
    }

    for (const auto& [key, value] : def.flags) {
        if (key == "source") {
            if (!apply_source_flag(value, p.source, error)) {
                return false;
            }
        } else if (key == "ma") {
            auto parsed = parse_moving_average_kind(value);
            if (!parsed) {
                error = "Unknown moving average '" + value + "'";
                return false;
            }
            p.ma_kind = *parsed;
        } else {
            error = "Unknown flag --" + key + " for BOLLINGER BANDS";
            return false;
        }
    }
    return true;
}

std::string column_prefix(const IndicatorResult& result)
{
    std::string prefix = result.name.empty() ? std::string(to_string(result.kind)) : result.name;
    std::replace(prefix.begin(), prefix.end(), ' ', '_');
    return prefix;
}

std::vector<int> band_multipliers(const BandOutput& output)
{
    for (const auto& state : output.bands) {
        if (state) {
            std::vector<int> out;
            for (const auto& line : state->lines) {
                out.push_back(line.multiplier);
            }
            return out;
        }
    }
    return {};
}

// Appends the cells of `result` for bar `row`, one per column_names() entry.
void write_cells(std::ostream& out, const IndicatorResult& result, std::size_t columns, std::size_t row)
{
    if (const auto* ha = std::get_if<HeikenAshiOutput>(&result.output)) {
        if (row < ha->candles.size()) {
            out << "," << ha->candles.open[row] << "," << ha->candles.high[row]
                << "," << ha->candles.low[row] << "," << ha->candles.close[row];
            return;
        }
    } else if (const auto* seq = std::get_if<SequentialOutput>(&result.output)) {
        if (row < seq->states.size()) {
            const auto& s = seq->states[row];
            out << "," << to_string(s.price_flip)
                << "," << to_string(s.setup_direction)
                << ",";
            if (s.setup_count > 0) {
                out << s.setup_count;
            }
            out << "," << (s.setup_perfected ? 1 : 0) << ",";
            if (s.tdst) {
                out << s.tdst->price;
            }
            out << ",";
            if (s.tdst) {
                out << to_string(s.tdst->side);
            }
            out << "," << to_string(s.countdown_direction)
                << "," << s.countdown.label()
                << "," << (s.countdown_cancelled ? 1 : 0)
                << "," << (s.countdown_completed ? 1 : 0);
            return;
        }
    } else if (const auto* bands = std::get_if<BandOutput>(&result.output)) {
        if (row < bands->bands.size() && bands->bands[row]) {
            const auto& b = *bands->bands[row];
            out << "," << b.basis << "," << b.stddev;
            for (const auto& line : b.lines) {
                out << "," << line.upper << "," << line.lower;
            }
            return;
        }
    }

    for (std::size_t c = 0; c < columns; ++c) {
        out << ",";
    }
}

} // namespace

ConfigParseResult IndicatorConfigParser::parse_file(const std::string& file_path)
{
    ConfigParseResult result;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        result.error_message = "Cannot open file: " + file_path;
        return result;
    }

    std::string line;
    int line_number = 0;

    while (std::getline(file, line)) {
        ++line_number;
        ++result.total_lines;

        line.erase(0, line.find_first_not_of(" \t\r\n"));
        line.erase(line.find_last_not_of(" \t\r\n") + 1);

        if (line.empty()) {
            ++result.blank_lines;
            continue;
        }

        // Comments start with ; or #
        if (line[0] == ';' || line[0] == '#') {
            ++result.comment_lines;
            continue;
        }

        auto def = parse_line(line, line_number);
        if (!def.has_value()) {
            ++result.skipped_lines;
            Logger::Log(file_path + ":" + std::to_string(line_number) + ": skipped malformed line '" + line + "'");
            continue;
        }

        std::string error;
        if (!validate_definition(*def, error)) {
            result.error_message = file_path + ":" + std::to_string(line_number) + ": " + error;
            result.definitions.clear();
            result.parsed_indicators = 0;
            return result;
        }

        result.definitions.push_back(std::move(*def));
        ++result.parsed_indicators;
    }

    result.success = true;
    return result;
}

std::optional<IndicatorDefinition> IndicatorConfigParser::parse_line(
    const std::string& line,
    int line_number)
{
    auto colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
        return std::nullopt;
    }

    IndicatorDefinition def;
    def.line_number = line_number;
    def.source_line = line;

    def.variable_name = line.substr(0, colon_pos);
    def.variable_name.erase(0, def.variable_name.find_first_not_of(" \t"));
    def.variable_name.erase(def.variable_name.find_last_not_of(" \t") + 1);

    if (def.variable_name.empty()) {
        return std::nullopt;
    }

    std::vector<std::string> tokens;
    std::istringstream iss(line.substr(colon_pos + 1));
    for (std::string token; iss >> token;) {
        tokens.push_back(token);
    }
    if (tokens.empty()) {
        return std::nullopt;
    }

    // Indicator type is every leading word up to the first number or flag
    std::size_t i = 0;
    double number = 0.0;
    while (i < tokens.size() && !is_flag(tokens[i]) && !parse_number(tokens[i], number)) {
        if (!def.indicator_type.empty()) {
            def.indicator_type += " ";
        }
        def.indicator_type += tokens[i];
        ++i;
    }

    for (; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        if (is_flag(token)) {
            auto flag = parse_flag(token);
            if (!flag) {
                return std::nullopt;
            }
            def.flags[flag->first] = flag->second;
        } else if (parse_number(token, number)) {
            def.params.push_back(number);
        } else {
            return std::nullopt;
        }
    }

    return def;
}

bool IndicatorConfigParser::validate_definition(
    const IndicatorDefinition& def,
    std::string& error)
{
    if (def.variable_name.empty()) {
        error = "Variable name is empty";
        return false;
    }

    if (def.indicator_type.empty()) {
        error = "Indicator type is empty";
        return false;
    }

    IndicatorRequest request;
    return to_request(def, request, error);
}

bool IndicatorConfigParser::to_request(
    const IndicatorDefinition& def,
    IndicatorRequest& request,
    std::string& error)
{
    auto kind = parse_indicator_kind(def.indicator_type);
    if (!kind) {
        error = "Unknown indicator type '" + def.indicator_type + "' for variable " + def.variable_name;
        return false;
    }

    IndicatorRequest out;
    out.name = def.variable_name;

    switch (*kind) {
        case IndicatorKind::HeikenAshi: {
            if (!def.params.empty() || !def.flags.empty()) {
                error = "HEIKEN ASHI takes no parameters or flags";
                return false;
            }
            out.params = HeikenAshiParameters{};
            break;
        }
        case IndicatorKind::Sequential: {
            SequentialParameters p;
            if (!build_sequential(def, p, error)) {
                return false;
            }
            out.params = p;
            break;
        }
        case IndicatorKind::Bands: {
            BandParameters p;
            if (!build_bands(def, p, error)) {
                return false;
            }
            out.params = p;
            break;
        }
    }

    if (!validate_parameters(out.params, error)) {
        error = def.variable_name + ": " + error;
        return false;
    }

    request = std::move(out);
    return true;
}

bool IndicatorConfigParser::is_flag(const std::string& token)
{
    return token.rfind("--", 0) == 0;
}

std::optional<std::pair<std::string, std::string>> IndicatorConfigParser::parse_flag(const std::string& token)
{
    const std::string body = token.substr(2);
    const auto eq_pos = body.find('=');

    std::string key = body.substr(0, eq_pos);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (key.empty()) {
        return std::nullopt;
    }
    if (eq_pos == std::string::npos) {
        return std::make_pair(key, std::string("true"));
    }

    std::string value = body.substr(eq_pos + 1);
    if (value.empty()) {
        return std::nullopt;
    }
    return std::make_pair(key, value);
}

std::vector<std::string> IndicatorResultWriter::column_names(const IndicatorResult& result)
{
    const std::string prefix = column_prefix(result);
    std::vector<std::string> names;

    switch (result.kind) {
        case IndicatorKind::HeikenAshi:
            for (const char* field : {"open", "high", "low", "close"}) {
                names.push_back(prefix + "_ha_" + field);
            }
            break;
        case IndicatorKind::Sequential:
            for (const char* field : {"flip", "setup_dir", "setup_count", "perfected", "tdst",
                                      "tdst_side", "countdown_dir", "countdown", "cancelled",
                                      "completed"}) {
                names.push_back(prefix + "_" + field);
            }
            break;
        case IndicatorKind::Bands:
            names.push_back(prefix + "_basis");
            names.push_back(prefix + "_stddev");
            if (const auto* bands = std::get_if<BandOutput>(&result.output)) {
                for (int k : band_multipliers(*bands)) {
                    names.push_back(prefix + "_upper_" + std::to_string(k));
                    names.push_back(prefix + "_lower_" + std::to_string(k));
                }
            }
            break;
    }

    return names;
}

bool IndicatorResultWriter::write_csv(
    const std::string& output_path,
    const BarSeries& series,
    const std::vector<IndicatorResult>& results,
    std::string* error)
{
    std::ofstream file(output_path);
    if (!file.is_open()) {
        if (error) {
            *error = "Cannot open output file: " + output_path;
        }
        return false;
    }

    file << std::setprecision(10);

    std::vector<std::size_t> widths;
    widths.reserve(results.size());

    file << "bar,timestamp,open,high,low,close";
    for (const auto& result : results) {
        auto names = column_names(result);
        widths.push_back(names.size());
        for (const auto& name : names) {
            file << "," << name;
        }
    }
    file << "\n";

    for (std::size_t row = 0; row < series.size(); ++row) {
        file << row << "," << series.timestamp[row] << "," << series.open[row] << ","
             << series.high[row] << "," << series.low[row] << "," << series.close[row];
        for (std::size_t r = 0; r < results.size(); ++r) {
            write_cells(file, results[r], widths[r], row);
        }
        file << "\n";
    }

    if (!file) {
        if (error) {
            *error = "Failed writing " + output_path;
        }
        return false;
    }
    return true;
}

} // namespace tdcore
