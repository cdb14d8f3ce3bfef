// === Flat Record =============================================================
//
// Format-neutral representation of results: a map of named scalars and
// one-dimensional arrays. Reporting and plotting collaborators choose the
// storage format; JSON encoding via nlohmann_json is provided here. Matrices
// are stored row-major alongside their shape fields.

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "sensor_placement/errors.hpp"

namespace sensor_placement {

using FlatValue = std::variant<
    std::int64_t,
    double,
    std::string,
    std::vector<std::int64_t>,
    std::vector<double>,
    std::vector<std::string>>;

using FlatRecord = std::map<std::string, FlatValue>;

/** @brief Typed lookup that raises RecordFormatError on a missing key or wrong type. */
template <typename T>
[[nodiscard]] const T& get_field(const FlatRecord& record, const std::string& key) {
    const auto iterator_field = record.find(key);
    if (iterator_field == record.end()) {
        throw RecordFormatError("Record has no field '" + key + "'");
    }
    const T* value = std::get_if<T>(&iterator_field->second);
    if (value == nullptr) {
        throw RecordFormatError("Record field '" + key + "' has an unexpected type");
    }
    return *value;
}

/**
 * @brief Encode as {"types": {key: tag}, "values": {key: value}}.
 *
 * The type tags keep empty arrays and integral doubles unambiguous so that
 * decoding reproduces the record exactly.
 */
[[nodiscard]] nlohmann::json to_json(const FlatRecord& record);
[[nodiscard]] FlatRecord flat_record_from_json(const nlohmann::json& document);

}  // namespace sensor_placement
