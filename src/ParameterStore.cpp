#include "ParameterStore.hpp"

#include <json/json.h>

#include <fstream>
#include <sstream>
#include <type_traits>

namespace tdcore {
namespace {

template <class>
inline constexpr bool kAlwaysFalse = false;

std::string SerializeJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}

void SetError(std::string* error, std::string message) {
    if (error) {
        *error = std::move(message);
    }
}

Json::Value RequestToJson(const IndicatorRequest& request) {
    Json::Value node(Json::objectValue);
    node["kind"] = std::string(to_string(kind_of(request.params)));
    if (!request.name.empty()) {
        node["name"] = request.name;
    }

    std::visit([&node](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, HeikenAshiParameters>) {
            // no parameters
        } else if constexpr (std::is_same_v<T, SequentialParameters>) {
            node["setup_lookback"] = p.setup_lookback;
            node["countdown_lookback"] = p.countdown_lookback;
            node["setup_target"] = p.setup_target;
            node["countdown_target"] = p.countdown_target;
            node["qualifier_bar"] = p.qualifier_bar;
            node["tdst_source"] = std::string(to_string(p.tdst_source));
            node["source"] = std::string(to_string(p.source));
        } else if constexpr (std::is_same_v<T, BandParameters>) {
            node["period"] = p.period;
            node["ma"] = std::string(to_string(p.ma_kind));
            Json::Value multipliers(Json::arrayValue);
            for (int k : p.multipliers) {
                multipliers.append(k);
            }
            node["multipliers"] = multipliers;
            node["source"] = std::string(to_string(p.source));
        } else {
            static_assert(kAlwaysFalse<T>, "indicator kind without a JSON form");
        }
    }, request.params);

    return node;
}

bool ReadInt(const Json::Value& node, const char* key, int* out, std::string* error) {
    if (!node.isMember(key)) {
        return true;
    }
    const Json::Value& value = node[key];
    if (!value.isInt()) {
        SetError(error, std::string("Field '") + key + "' must be an integer.");
        return false;
    }
    *out = value.asInt();
    return true;
}

bool ReadString(const Json::Value& node, const char* key, std::string* out, std::string* error) {
    if (!node.isMember(key)) {
        return true;
    }
    const Json::Value& value = node[key];
    if (!value.isString()) {
        SetError(error, std::string("Field '") + key + "' must be a string.");
        return false;
    }
    *out = value.asString();
    return true;
}

template <class Enum, class Parser>
bool ReadEnum(const Json::Value& node, const char* key, Enum* out, Parser parse, std::string* error) {
    if (!node.isMember(key)) {
        return true;
    }
    const Json::Value& value = node[key];
    if (!value.isString()) {
        SetError(error, std::string("Field '") + key + "' must be a string.");
        return false;
    }
    auto parsed = parse(value.asString());
    if (!parsed) {
        SetError(error, std::string("Unknown value '") + value.asString() + "' for field '" + key + "'.");
        return false;
    }
    *out = *parsed;
    return true;
}

bool ParseSequential(const Json::Value& node, SequentialParameters* p, std::string* error) {
    return ReadInt(node, "setup_lookback", &p->setup_lookback, error)
        && ReadInt(node, "countdown_lookback", &p->countdown_lookback, error)
        && ReadInt(node, "setup_target", &p->setup_target, error)
        && ReadInt(node, "countdown_target", &p->countdown_target, error)
        && ReadInt(node, "qualifier_bar", &p->qualifier_bar, error)
        && ReadEnum(node, "tdst_source", &p->tdst_source, parse_tdst_source, error)
        && ReadEnum(node, "source", &p->source, parse_price_source, error);
}

bool ParseBands(const Json::Value& node, BandParameters* p, std::string* error) {
    if (!ReadInt(node, "period", &p->period, error)
        || !ReadEnum(node, "ma", &p->ma_kind, parse_moving_average_kind, error)
        || !ReadEnum(node, "source", &p->source, parse_price_source, error)) {
        return false;
    }
    if (node.isMember("multipliers")) {
        const Json::Value& list = node["multipliers"];
        if (!list.isArray()) {
            SetError(error, "Field 'multipliers' must be an array.");
            return false;
        }
        p->multipliers.clear();
        for (const auto& item : list) {
            if (!item.isInt()) {
                SetError(error, "Band multipliers must be integers.");
                return false;
            }
            p->multipliers.push_back(item.asInt());
        }
    }
    return true;
}

bool RequestFromJson(const Json::Value& node, IndicatorRequest* request, std::string* error) {
    if (!node.isObject()) {
        SetError(error, "Indicator entry must be an object.");
        return false;
    }
    std::string kind_name;
    if (!ReadString(node, "kind", &kind_name, error)) {
        return false;
    }
    const auto kind = parse_indicator_kind(kind_name);
    if (!kind) {
        SetError(error, "Unknown indicator kind '" + kind_name + "'.");
        return false;
    }

    IndicatorRequest parsed;
    if (!ReadString(node, "name", &parsed.name, error)) {
        return false;
    }
    parsed.params = default_parameters(*kind);

    bool ok = true;
    if (auto* seq = std::get_if<SequentialParameters>(&parsed.params)) {
        ok = ParseSequential(node, seq, error);
    } else if (auto* bands = std::get_if<BandParameters>(&parsed.params)) {
        ok = ParseBands(node, bands, error);
    }
    if (!ok) {
        return false;
    }

    std::string message;
    if (!validate_parameters(parsed.params, message)) {
        SetError(error, std::string(to_string(*kind)) + ": " + message);
        return false;
    }

    *request = std::move(parsed);
    return true;
}

bool PopulateConfigFromJson(const Json::Value& root, PipelineConfig* config, std::string* error) {
    if (!config) {
        SetError(error, "Config pointer is null.");
        return false;
    }
    if (!root.isObject()) {
        SetError(error, "Indicator config JSON must be an object.");
        return false;
    }
    int version = kParameterStoreVersion;
    if (!ReadInt(root, "version", &version, error)) {
        return false;
    }
    if (version != kParameterStoreVersion) {
        SetError(error, "Unsupported indicator config version " + std::to_string(version) + ".");
        return false;
    }
    const Json::Value& list = root["indicators"];
    if (!list.isNull() && !list.isArray()) {
        SetError(error, "Field 'indicators' must be an array.");
        return false;
    }

    PipelineConfig parsed;
    for (Json::ArrayIndex i = 0; i < list.size(); ++i) {
        IndicatorRequest request;
        std::string message;
        if (!RequestFromJson(list[i], &request, &message)) {
            SetError(error, "Indicator " + std::to_string(i) + ": " + message);
            return false;
        }
        parsed.requests.push_back(std::move(request));
    }

    *config = std::move(parsed);
    if (error) {
        error->clear();
    }
    return true;
}

bool ParseJson(std::istream& in, Json::Value* root, const std::string& origin, std::string* error) {
    std::string errs;
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    if (!Json::parseFromStream(builder, in, root, &errs)) {
        SetError(error, errs.empty() ? "Failed to parse indicator config JSON from " + origin + "." : errs);
        return false;
    }
    return true;
}

}  // namespace

std::string ConfigToJsonString(const PipelineConfig& config) {
    Json::Value root(Json::objectValue);
    root["version"] = kParameterStoreVersion;
    Json::Value list(Json::arrayValue);
    for (const auto& request : config.requests) {
        list.append(RequestToJson(request));
    }
    root["indicators"] = list;
    return SerializeJson(root);
}

bool ConfigFromJsonString(const std::string& json,
                          PipelineConfig* config,
                          std::string* error) {
    std::istringstream in(json);
    Json::Value root;
    if (!ParseJson(in, &root, "string", error)) {
        return false;
    }
    return PopulateConfigFromJson(root, config, error);
}

bool WriteConfigFile(const PipelineConfig& config,
                     const std::filesystem::path& file_path,
                     std::string* error) {
    if (file_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file_path.parent_path(), ec);
        if (ec) {
            SetError(error, "Unable to create directory '" + file_path.parent_path().string() + "': " + ec.message());
            return false;
        }
    }
    std::ofstream out(file_path, std::ios::binary);
    if (!out) {
        SetError(error, "Unable to open config file '" + file_path.string() + "' for writing.");
        return false;
    }
    out << ConfigToJsonString(config);
    if (!out.good()) {
        SetError(error, "Failed to write config file '" + file_path.string() + "'.");
        return false;
    }
    if (error) {
        error->clear();
    }
    return true;
}

bool ReadConfigFile(const std::filesystem::path& file_path,
                    PipelineConfig* config,
                    std::string* error) {
    std::ifstream in(file_path, std::ios::binary);
    if (!in) {
        SetError(error, "Unable to open config file '" + file_path.string() + "' for reading.");
        return false;
    }
    Json::Value root;
    if (!ParseJson(in, &root, "'" + file_path.string() + "'", error)) {
        return false;
    }
    return PopulateConfigFromJson(root, config, error);
}

}  // namespace tdcore
