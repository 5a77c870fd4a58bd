/**
 * @file engine_config.cpp
 */

#include <config/engine_config.hpp>
#include <core/errors.hpp>
#include <database/postgres_connection.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace Meisai {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

size_t env_size(const char* name, size_t fallback) {
    const char* v = env(name);
    if (!v) return fallback;
    try {
        size_t pos = 0;
        long long n = std::stoll(v, &pos);
        if (pos != std::string(v).size() || n < 0) throw std::invalid_argument(v);
        return static_cast<size_t>(n);
    } catch (const std::exception&) {
        throw MeisaiError(ErrorKind::Validation, std::string("expected a non-negative integer in ") + name,
                          {{"field", name}, {"value", v}});
    }
}

double env_double(const char* name, double fallback) {
    const char* v = env(name);
    if (!v) return fallback;
    try {
        size_t pos = 0;
        double d = std::stod(v, &pos);
        if (pos != std::string(v).size()) throw std::invalid_argument(v);
        return d;
    } catch (const std::exception&) {
        throw MeisaiError(ErrorKind::Validation, std::string("expected a number in ") + name,
                          {{"field", name}, {"value", v}});
    }
}

bool env_bool(const char* name, bool fallback) {
    const char* v = env(name);
    if (!v) return fallback;
    std::string s = lower(v);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    throw MeisaiError(ErrorKind::Validation, std::string("expected a boolean in ") + name,
                      {{"field", name}, {"value", v}});
}

template <typename T>
void read_key(const nlohmann::json& json, const char* key, T& out) {
    if (!json.contains(key) || json[key].is_null()) return;
    try {
        out = json[key].get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw MeisaiError(ErrorKind::Validation, std::string("bad value for '") + key + "': " + e.what(),
                          {{"field", key}});
    }
}

void read_match(const nlohmann::json& json, MatchConfig& m) {
    if (!json.is_object()) {
        throw MeisaiError(ErrorKind::Validation, "'match' must be an object", {{"field", "match"}});
    }
    read_key(json, "time_tolerance_minutes", m.time_tolerance_minutes);
    read_key(json, "time_confidence_max", m.time_confidence_max);
    read_key(json, "time_confidence_min", m.time_confidence_min);
    read_key(json, "amount_tolerance", m.amount_tolerance);
    read_key(json, "amount_confidence_max", m.amount_confidence_max);
    read_key(json, "amount_confidence_min", m.amount_confidence_min);
    read_key(json, "fuzzy_min_similarity", m.fuzzy_min_similarity);
    read_key(json, "fuzzy_weight", m.fuzzy_weight);
    read_key(json, "acceptance_threshold", m.acceptance_threshold);

    if (json.contains("amount_tolerance_percent")) {
        if (json["amount_tolerance_percent"].is_null()) {
            m.amount_tolerance_percent.reset();
        } else {
            double pct = 0;
            read_key(json, "amount_tolerance_percent", pct);
            m.amount_tolerance_percent = pct;
        }
    }
}

} // anonymous namespace

SessionMismatchPolicy parse_mismatch_policy(const std::string& s) {
    std::string v = lower(s);
    if (v == "reject") return SessionMismatchPolicy::Reject;
    if (v == "ignore") return SessionMismatchPolicy::Ignore;
    throw MeisaiError(ErrorKind::Validation, "unknown mismatch policy: " + s, {{"field", "mismatch_policy"}});
}

Logger::Level parse_log_level(const std::string& s) {
    std::string v = lower(s);
    if (v == "info") return Logger::Level::Info;
    if (v == "step") return Logger::Level::Step;
    if (v == "success") return Logger::Level::Success;
    if (v == "warning" || v == "warn") return Logger::Level::Warning;
    if (v == "error") return Logger::Level::Error;
    throw MeisaiError(ErrorKind::Validation, "unknown log level: " + s, {{"field", "log_level"}});
}

EngineConfig EngineConfig::from_env() {
    EngineConfig c;

    if (const char* ci = env("MEISAI_CONNINFO")) {
        c.conninfo = ci;
    } else if (env_bool("MEISAI_DATABASE", false)) {
        c.conninfo = PostgresConnection::conninfo_from_env();
    }

    c.workers = env_size("MEISAI_WORKERS", c.workers);
    c.task_queue_capacity = env_size("MEISAI_TASK_QUEUE", c.task_queue_capacity);
    c.chunk_queue_capacity = env_size("MEISAI_CHUNK_QUEUE", c.chunk_queue_capacity);
    c.progress_queue_capacity = env_size("MEISAI_PROGRESS_QUEUE", c.progress_queue_capacity);

    if (const char* p = env("MEISAI_MISMATCH_POLICY")) c.mismatch_policy = parse_mismatch_policy(p);
    c.max_error_rate = env_double("MEISAI_MAX_ERROR_RATE", c.max_error_rate);
    c.skip_duplicates = env_bool("MEISAI_SKIP_DUPLICATES", c.skip_duplicates);
    c.update_existing = env_bool("MEISAI_UPDATE_EXISTING", c.update_existing);
    c.detect_changes = env_bool("MEISAI_DETECT_CHANGES", c.detect_changes);
    if (const char* p = env("MEISAI_SNAPSHOT")) c.snapshot_path = p;
    if (const char* l = env("MEISAI_LOG_LEVEL")) c.log_level = parse_log_level(l);

    c.match.time_tolerance_minutes =
        static_cast<int64_t>(env_size("MEISAI_MATCH_TIME_TOLERANCE", static_cast<size_t>(c.match.time_tolerance_minutes)));
    c.match.amount_tolerance =
        static_cast<int64_t>(env_size("MEISAI_MATCH_AMOUNT_TOLERANCE", static_cast<size_t>(c.match.amount_tolerance)));
    c.match.acceptance_threshold = env_double("MEISAI_MATCH_THRESHOLD", c.match.acceptance_threshold);

    c.validate();
    return c;
}

EngineConfig EngineConfig::from_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw MeisaiError(ErrorKind::Validation, "cannot open config file: " + path, {{"path", path}});
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return from_json_string(buffer.str());
}

EngineConfig EngineConfig::from_json_string(const std::string& text) {
    EngineConfig c;
    c.merge_json(text);
    return c;
}

void EngineConfig::merge_json(const std::string& text) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw MeisaiError(ErrorKind::Validation, std::string("invalid config JSON: ") + e.what());
    }
    if (!json.is_object()) {
        throw MeisaiError(ErrorKind::Validation, "config JSON must be an object");
    }

    if (json.contains("database")) {
        const auto& db = json["database"];
        if (db.is_string()) {
            conninfo = db.get<std::string>();
        } else if (db.is_object()) {
            read_key(db, "conninfo", conninfo);
            bool from_env = false;
            read_key(db, "from_env", from_env);
            if (from_env) conninfo = PostgresConnection::conninfo_from_env();
        } else if (!db.is_null()) {
            throw MeisaiError(ErrorKind::Validation, "'database' must be a string or object", {{"field", "database"}});
        }
    }

    read_key(json, "workers", workers);
    read_key(json, "task_queue_capacity", task_queue_capacity);
    read_key(json, "chunk_queue_capacity", chunk_queue_capacity);
    read_key(json, "progress_queue_capacity", progress_queue_capacity);

    std::string text_value;
    if (json.contains("mismatch_policy")) {
        read_key(json, "mismatch_policy", text_value);
        mismatch_policy = parse_mismatch_policy(text_value);
    }
    read_key(json, "max_error_rate", max_error_rate);
    read_key(json, "skip_duplicates", skip_duplicates);
    read_key(json, "update_existing", update_existing);
    read_key(json, "detect_changes", detect_changes);
    read_key(json, "snapshot_path", snapshot_path);
    if (json.contains("log_level")) {
        read_key(json, "log_level", text_value);
        log_level = parse_log_level(text_value);
    }

    if (json.contains("match")) read_match(json["match"], match);

    validate();
}

void EngineConfig::validate() const {
    if (workers == 0) {
        throw MeisaiError(ErrorKind::Validation, "workers must be at least 1", {{"field", "workers"}});
    }
    if (task_queue_capacity == 0 || chunk_queue_capacity == 0 || progress_queue_capacity == 0) {
        throw MeisaiError(ErrorKind::Validation, "queue capacities must be at least 1");
    }
    if (!(max_error_rate >= 0.0 && max_error_rate <= 1.0)) {
        throw MeisaiError(ErrorKind::Validation, "max_error_rate must be within [0, 1]",
                          {{"field", "max_error_rate"}, {"value", std::to_string(max_error_rate)}});
    }
    match.validate();
}

HashIndexOptions EngineConfig::index_options() const {
    HashIndexOptions o;
    o.detect_changes = detect_changes;
    return o;
}

PipelineOptions EngineConfig::pipeline_options() const {
    PipelineOptions o;
    o.mismatch_policy = mismatch_policy;
    o.max_error_rate = max_error_rate;
    o.skip_duplicates = skip_duplicates;
    o.update_existing = update_existing;
    return o;
}

ServiceOptions EngineConfig::service_options() const {
    ServiceOptions o;
    o.workers = workers;
    o.task_queue_capacity = task_queue_capacity;
    o.chunk_queue_capacity = chunk_queue_capacity;
    o.progress_queue_capacity = progress_queue_capacity;
    o.pipeline = pipeline_options();
    return o;
}

} // namespace Meisai
