// === Errors ==================================================================
//
// Exception taxonomy raised at the boundary of the component that detects the
// problem. None of these are caught inside the library.

#pragma once

#include <stdexcept>
#include <string>

namespace sensor_placement {

/** @brief Non-positive decay parameter, mismatched array lengths, bad weights. */
class InvalidParameterError final : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

/** @brief Requested sensor count is not in [1, number of candidates]. */
class InvalidSensorCountError final : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

/** @brief Objective weights sum to zero when the objective is evaluated. */
class DegenerateObjectiveError final : public std::domain_error {
  public:
    using std::domain_error::domain_error;
};

/** @brief Flat record or JSON document missing a key or holding the wrong type. */
class RecordFormatError final : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

}  // namespace sensor_placement
