#include <cstdint>
#include <limits>

#include <catch2/catch.hpp>

#include "sensor_placement/errors.hpp"
#include "sensor_placement/flat_record.hpp"

using namespace sensor_placement;

namespace {
FlatRecord make_record() {
    FlatRecord record;
    record["n_sensors"] = std::int64_t{3};
    record["decay_param"] = 500.0;
    record["region_id"] = std::string{"E08000021"};
    record["sensors"] = std::vector<std::int64_t>{2, 4, 10};
    record["coverage_history"] = std::vector<double>{0.1, 1.0 / 3.0, std::numeric_limits<double>::min()};
    record["objectives"] = std::vector<std::string>{"workplace_workers"};
    record["empty"] = std::vector<double>{};
    return record;
}
}  // namespace

TEST_CASE("get_field returns typed values") {
    const FlatRecord record = make_record();
    CHECK(get_field<std::int64_t>(record, "n_sensors") == 3);
    CHECK(get_field<std::string>(record, "region_id") == "E08000021");
    CHECK(get_field<std::vector<std::int64_t>>(record, "sensors").size() == 3);
}

TEST_CASE("get_field reports missing keys and wrong types") {
    const FlatRecord record = make_record();
    REQUIRE_THROWS_AS(get_field<std::int64_t>(record, "missing"), RecordFormatError);
    REQUIRE_THROWS_AS(get_field<double>(record, "n_sensors"), RecordFormatError);
}

TEST_CASE("JSON encoding tags every field with its type") {
    const nlohmann::json document = to_json(make_record());
    CHECK(document.at("types").at("n_sensors") == "int64");
    CHECK(document.at("types").at("decay_param") == "float64");
    CHECK(document.at("types").at("region_id") == "string");
    CHECK(document.at("types").at("sensors") == "int64[]");
    CHECK(document.at("types").at("empty") == "float64[]");
    CHECK(document.at("types").at("objectives") == "string[]");
    CHECK(document.at("values").at("sensors") == nlohmann::json::array({2, 4, 10}));
}

TEST_CASE("JSON text round trip reproduces the record exactly") {
    const FlatRecord record = make_record();
    const std::string text = to_json(record).dump();
    const FlatRecord decoded = flat_record_from_json(nlohmann::json::parse(text));
    const bool identical = decoded == record;
    CHECK(identical);
}

TEST_CASE("Integral doubles stay doubles") {
    FlatRecord record;
    record["decay_param"] = 2.0;
    const FlatRecord decoded = flat_record_from_json(nlohmann::json::parse(to_json(record).dump()));
    CHECK(std::holds_alternative<double>(decoded.at("decay_param")));
}

TEST_CASE("Malformed JSON documents are rejected") {
    REQUIRE_THROWS_AS(flat_record_from_json(nlohmann::json::array()), RecordFormatError);
    REQUIRE_THROWS_AS(flat_record_from_json(nlohmann::json{{"types", nlohmann::json::object()}}), RecordFormatError);

    nlohmann::json wrong_tag = to_json(make_record());
    wrong_tag["types"]["n_sensors"] = "int32";
    REQUIRE_THROWS_AS(flat_record_from_json(wrong_tag), RecordFormatError);

    nlohmann::json wrong_value = to_json(make_record());
    wrong_value["values"]["n_sensors"] = "three";
    REQUIRE_THROWS_AS(flat_record_from_json(wrong_value), RecordFormatError);

    nlohmann::json untyped = to_json(make_record());
    untyped["values"]["extra"] = 1;
    REQUIRE_THROWS_AS(flat_record_from_json(untyped), RecordFormatError);

    nlohmann::json missing_value = to_json(make_record());
    missing_value["values"].erase("sensors");
    REQUIRE_THROWS_AS(flat_record_from_json(missing_value), RecordFormatError);
}
