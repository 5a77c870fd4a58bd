/**
 * @file statement_record.hpp
 * @brief One toll-usage event parsed from a statement CSV
 */

#pragma once

#include <hashing/blake3_pipeline.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Meisai {

/**
 * @brief Toll-usage statement record.
 *
 * Business fields (date, time, entry/exit points, amount, vehicle and card
 * number) determine content_hash. Only external_reference_number may change
 * after the record is persisted.
 */
struct StatementRecord {
    int64_t id = 0;                 // 0 until persisted

    std::string date;               // YYYY-MM-DD
    std::string time;               // HH:MM
    std::string exit_date;
    std::string exit_time;
    std::string entry_point;
    std::string exit_point;
    std::string toll_station;
    int64_t toll_amount = 0;
    std::string usage_category;
    std::string vehicle_class;
    std::string vehicle_number;
    std::string card_number;
    std::string remarks;

    BLAKE3Pipeline::Hash content_hash{};
    std::optional<std::string> external_reference_number;

    /**
     * @brief Reasons this record is not storable; empty when valid.
     */
    std::vector<std::string> validation_errors() const;

    bool is_valid() const { return validation_errors().empty(); }

    /**
     * @brief Throw MeisaiError(Validation) listing every problem.
     */
    void validate() const;

    /**
     * @brief Minutes since 1970-01-01 for date + time, if both parse.
     */
    std::optional<int64_t> epoch_minutes() const;
};

/**
 * @brief Minutes since 1970-01-01 for a YYYY-MM-DD date and HH:MM time.
 */
std::optional<int64_t> epoch_minutes(const std::string& date, const std::string& time);

} // namespace Meisai
