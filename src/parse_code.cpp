#include "parse_code.hpp"
#include "trace.hpp"
#include <nlohmann/json.hpp>
#include <fmt/core.h>
#include <cstdint>
#include <limits>

namespace funcobj {

static Ref value_from_json(const nlohmann::json& j) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
            return none();
        case nlohmann::json::value_t::boolean:
            return make_bool(j.get<bool>());
        case nlohmann::json::value_t::number_integer:
            return make_int(j.get<int64_t>());
        case nlohmann::json::value_t::number_unsigned: {
            uint64_t n = j.get<uint64_t>();
            if (n > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                throw CodeParseError(fmt::format("Integer out of range: {}", n));
            }
            return make_int(static_cast<int64_t>(n));
        }
        case nlohmann::json::value_t::number_float:
            return make_float(j.get<double>());
        case nlohmann::json::value_t::string:
            return make_string(j.get<std::string>());
        case nlohmann::json::value_t::array: {
            std::vector<Ref> items;
            for (const auto& item : j) {
                items.push_back(value_from_json(item));
            }
            return make_tuple(std::move(items));
        }
        case nlohmann::json::value_t::object: {
            DictRef dict = make_dict();
            for (const auto& [key, item] : j.items()) {
                dict->set(key, value_from_json(item));
            }
            return dict;
        }
        default:
            throw CodeParseError(fmt::format("Unsupported JSON value: {}", j.dump()));
    }
}

static const nlohmann::json& array_field(const nlohmann::json& j, const char* field, const std::string& idname) {
    const nlohmann::json& value = j.at(field);
    if (!value.is_array()) {
        throw CodeParseError(fmt::format("Bad code object for '{}': '{}' must be an array", idname, field));
    }
    return value;
}

ParseCode::ParseCode(const std::string& idname)
    : idname_(idname) {
}

CodeRef ParseCode::parse(const std::string& json_str) {
    try {
        nlohmann::json j = nlohmann::json::parse(json_str);

        std::string name = j.at("name").get<std::string>();

        std::vector<Ref> consts;
        if (j.contains("consts")) {
            for (const auto& item : array_field(j, "consts", idname_)) {
                consts.push_back(value_from_json(item));
            }
        }

        std::vector<std::string> freevars;
        if (j.contains("freevars")) {
            for (const auto& item : array_field(j, "freevars", idname_)) {
                freevars.push_back(item.get<std::string>());
            }
        }

        if constexpr (TRACE_BUNDLE_READER) {
            fmt::print("Parsed code for {}: name={}, {} consts, {} freevars\n",
                       idname_, name, consts.size(), freevars.size());
        }

        return make_code(name, std::move(consts), std::move(freevars));
    } catch (const nlohmann::json::exception& e) {
        throw CodeParseError(fmt::format("Bad code object for '{}': {}", idname_, e.what()));
    }
}

Ref parse_value(const std::string& json_str) {
    try {
        return value_from_json(nlohmann::json::parse(json_str));
    } catch (const nlohmann::json::exception& e) {
        throw CodeParseError(fmt::format("JSON parsing error: {}", e.what()));
    }
}

} // namespace funcobj
