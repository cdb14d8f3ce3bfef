#include "sensor_placement/flat_record.hpp"

#include <fmt/format.h>

namespace sensor_placement {

namespace {

constexpr char k_tag_int[] = "int64";
constexpr char k_tag_double[] = "float64";
constexpr char k_tag_string[] = "string";
constexpr char k_tag_int_array[] = "int64[]";
constexpr char k_tag_double_array[] = "float64[]";
constexpr char k_tag_string_array[] = "string[]";

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::int64_t decode_int(const nlohmann::json& value, const std::string& key) {
    if (!value.is_number_integer()) {
        throw RecordFormatError(fmt::format("Field '{}' must hold integers", key));
    }
    return value.get<std::int64_t>();
}

double decode_double(const nlohmann::json& value, const std::string& key) {
    if (!value.is_number()) {
        throw RecordFormatError(fmt::format("Field '{}' must hold numbers", key));
    }
    return value.get<double>();
}

std::string decode_string(const nlohmann::json& value, const std::string& key) {
    if (!value.is_string()) {
        throw RecordFormatError(fmt::format("Field '{}' must hold strings", key));
    }
    return value.get<std::string>();
}

template <typename T, typename Decoder>
std::vector<T> decode_array(const nlohmann::json& value, const std::string& key, Decoder decoder) {
    if (!value.is_array()) {
        throw RecordFormatError(fmt::format("Field '{}' must be an array", key));
    }
    std::vector<T> decoded;
    decoded.reserve(value.size());
    for (const auto& element : value) {
        decoded.push_back(decoder(element, key));
    }
    return decoded;
}

}  // namespace

nlohmann::json to_json(const FlatRecord& record) {
    nlohmann::json types = nlohmann::json::object();
    nlohmann::json values = nlohmann::json::object();
    for (const auto& entry_field : record) {
        const std::string& key = entry_field.first;
        std::visit(
            Overloaded{
                [&](const std::int64_t& value) { types[key] = k_tag_int; values[key] = value; },
                [&](const double& value) { types[key] = k_tag_double; values[key] = value; },
                [&](const std::string& value) { types[key] = k_tag_string; values[key] = value; },
                [&](const std::vector<std::int64_t>& value) { types[key] = k_tag_int_array; values[key] = value; },
                [&](const std::vector<double>& value) { types[key] = k_tag_double_array; values[key] = value; },
                [&](const std::vector<std::string>& value) { types[key] = k_tag_string_array; values[key] = value; },
            },
            entry_field.second
        );
    }
    return nlohmann::json{{"types", types}, {"values", values}};
}

FlatRecord flat_record_from_json(const nlohmann::json& document) {
    if (!document.is_object() || !document.contains("types") || !document.contains("values")) {
        throw RecordFormatError("Document must be an object with 'types' and 'values'");
    }
    const nlohmann::json& types = document.at("types");
    const nlohmann::json& values = document.at("values");
    if (!types.is_object() || !values.is_object()) {
        throw RecordFormatError("'types' and 'values' must be objects");
    }

    FlatRecord record;
    for (const auto& [key, tag_json] : types.items()) {
        if (!values.contains(key)) {
            throw RecordFormatError(fmt::format("Field '{}' has a type but no value", key));
        }
        const nlohmann::json& value = values.at(key);
        const std::string tag = decode_string(tag_json, key);
        if (tag == k_tag_int) {
            record[key] = decode_int(value, key);
        } else if (tag == k_tag_double) {
            record[key] = decode_double(value, key);
        } else if (tag == k_tag_string) {
            record[key] = decode_string(value, key);
        } else if (tag == k_tag_int_array) {
            record[key] = decode_array<std::int64_t>(value, key, decode_int);
        } else if (tag == k_tag_double_array) {
            record[key] = decode_array<double>(value, key, decode_double);
        } else if (tag == k_tag_string_array) {
            record[key] = decode_array<std::string>(value, key, decode_string);
        } else {
            throw RecordFormatError(fmt::format("Field '{}' has unknown type tag '{}'", key, tag));
        }
    }
    if (values.size() != types.size()) {
        throw RecordFormatError("Every value must have a type tag");
    }
    return record;
}

}  // namespace sensor_placement
