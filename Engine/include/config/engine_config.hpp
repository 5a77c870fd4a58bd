/**
 * @file engine_config.hpp
 * @brief Runtime configuration from MEISAI_* environment variables and JSON files
 */

#pragma once

#include <export.hpp>
#include <ingestion/import_service.hpp>
#include <matching/match_engine.hpp>
#include <utils/logger.hpp>
#include <string>

namespace Meisai {

struct MEISAI_API EngineConfig {
    // libpq conninfo; empty selects the in-memory repositories
    std::string conninfo;

    size_t workers = 4;
    size_t task_queue_capacity = 16;
    size_t chunk_queue_capacity = 64;
    size_t progress_queue_capacity = 256;

    SessionMismatchPolicy mismatch_policy = SessionMismatchPolicy::Reject;
    double max_error_rate = 1.0;
    bool skip_duplicates = true;
    bool update_existing = false;

    bool detect_changes = false;
    std::string snapshot_path;

    Logger::Level log_level = Logger::Level::Info;

    MatchConfig match;

    /**
     * @brief Defaults overridden by MEISAI_* variables. MEISAI_DATABASE=1
     *        fills conninfo from the PG* variables.
     * @throws MeisaiError(Validation) for unparsable values
     */
    static EngineConfig from_env();

    /**
     * @brief Defaults overridden by the keys present in a JSON document.
     *        Unknown keys are ignored.
     * @throws MeisaiError(Validation) for unreadable files, bad JSON or wrong value types
     */
    static EngineConfig from_json_file(const std::string& path);
    static EngineConfig from_json_string(const std::string& text);

    /**
     * @brief Apply JSON keys on top of this config.
     */
    void merge_json(const std::string& text);

    /**
     * @throws MeisaiError(Validation)
     */
    void validate() const;

    HashIndexOptions index_options() const;
    PipelineOptions pipeline_options() const;
    ServiceOptions service_options() const;
};

SessionMismatchPolicy parse_mismatch_policy(const std::string& s);
Logger::Level parse_log_level(const std::string& s);

} // namespace Meisai
