#include <storage/postgres_repository.hpp>
#include <database/bulk_copy.hpp>
#include <storage/format_utils.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <sstream>

namespace Meisai {

namespace {

constexpr const char* kSchemaSql = R"SQL(
CREATE TABLE IF NOT EXISTS statement_records (
    id                        BIGSERIAL PRIMARY KEY,
    usage_date                DATE NOT NULL,
    usage_time                VARCHAR(5) NOT NULL,
    exit_date                 VARCHAR(10),
    exit_time                 VARCHAR(5),
    entry_point               TEXT NOT NULL,
    exit_point                TEXT NOT NULL,
    toll_station              TEXT,
    toll_amount               BIGINT NOT NULL CHECK (toll_amount >= 0),
    usage_category            TEXT,
    vehicle_class             TEXT,
    vehicle_number            TEXT,
    card_number               TEXT NOT NULL,
    remarks                   TEXT,
    content_hash              BYTEA NOT NULL UNIQUE,
    external_reference_number TEXT
);

CREATE INDEX IF NOT EXISTS statement_records_usage_idx
    ON statement_records (usage_date, card_number);

CREATE TABLE IF NOT EXISTS statement_mappings (
    id                   BIGSERIAL PRIMARY KEY,
    statement_record_id  BIGINT NOT NULL REFERENCES statement_records(id) ON DELETE CASCADE,
    external_entity_id   TEXT NOT NULL,
    external_entity_type VARCHAR(50) NOT NULL,
    confidence           DOUBLE PRECISION CHECK (confidence BETWEEN 0 AND 1),
    match_type           VARCHAR(10) NOT NULL,
    status               VARCHAR(10) NOT NULL,
    rejection_reason     TEXT,
    created_by           VARCHAR(100),
    notes                TEXT,
    created_at_ms        BIGINT NOT NULL,
    updated_at_ms        BIGINT NOT NULL
);

CREATE UNIQUE INDEX IF NOT EXISTS statement_mappings_one_active
    ON statement_mappings (statement_record_id, external_entity_type)
    WHERE status = 'active';

CREATE INDEX IF NOT EXISTS statement_mappings_record_idx
    ON statement_mappings (statement_record_id);
)SQL";

const std::vector<std::string> kRecordColumns = {
    "usage_date", "usage_time", "exit_date", "exit_time", "entry_point", "exit_point",
    "toll_station", "toll_amount", "usage_category", "vehicle_class", "vehicle_number",
    "card_number", "remarks", "content_hash", "external_reference_number"
};

constexpr const char* kRecordSelect =
    "SELECT id, to_char(usage_date, 'YYYY-MM-DD'), usage_time, exit_date, exit_time, "
    "entry_point, exit_point, toll_station, toll_amount, usage_category, vehicle_class, "
    "vehicle_number, card_number, remarks, content_hash, external_reference_number "
    "FROM statement_records ";

constexpr const char* kMappingSelect =
    "SELECT id, statement_record_id, external_entity_id, external_entity_type, confidence, "
    "match_type, status, rejection_reason, created_by, notes, created_at_ms, updated_at_ms "
    "FROM statement_mappings ";

std::vector<std::string> record_values(const StatementRecord& r) {
    return {
        r.date, r.time, r.exit_date, r.exit_time, r.entry_point, r.exit_point,
        r.toll_station, std::to_string(r.toll_amount), r.usage_category, r.vehicle_class,
        r.vehicle_number, r.card_number, r.remarks, hash_to_bytea_hex(r.content_hash),
        r.external_reference_number.value_or("")
    };
}

StatementRecord record_from_row(const PostgresConnection::Row& row) {
    StatementRecord r;
    r.id = std::stoll(row[0]);
    r.date = row[1];
    r.time = row[2];
    r.exit_date = row[3];
    r.exit_time = row[4];
    r.entry_point = row[5];
    r.exit_point = row[6];
    r.toll_station = row[7];
    r.toll_amount = std::stoll(row[8]);
    r.usage_category = row[9];
    r.vehicle_class = row[10];
    r.vehicle_number = row[11];
    r.card_number = row[12];
    r.remarks = row[13];
    r.content_hash = bytea_hex_to_hash(row[14]);
    if (!row[15].empty()) r.external_reference_number = row[15];
    return r;
}

std::string hex_array_literal(const std::vector<BLAKE3Pipeline::Hash>& hashes) {
    std::string out = "{";
    for (size_t i = 0; i < hashes.size(); ++i) {
        if (i) out += ',';
        out += BLAKE3Pipeline::to_hex(hashes[i]);
    }
    out += '}';
    return out;
}

// SQL types of kRecordColumns; empty text parameters become NULL
const std::vector<std::string> kRecordTypes = {
    "date", "varchar", "varchar", "varchar", "text", "text",
    "text", "bigint", "text", "text", "text",
    "text", "text", "bytea", "text"
};

std::string record_param(size_t index) {
    return "NULLIF($" + std::to_string(index + 1) + ", '')::" + kRecordTypes[index];
}

MappingRecord mapping_from_row(const PostgresConnection::Row& row) {
    MappingRecord m;
    m.id = std::stoll(row[0]);
    m.statement_record_id = std::stoll(row[1]);
    m.external_entity_id = row[2];
    m.external_entity_type = row[3];
    if (!row[4].empty()) m.confidence = std::stod(row[4]);
    auto type = parse_match_type(row[5]);
    auto status = parse_mapping_status(row[6]);
    if (!type || !status) {
        throw MeisaiError(ErrorKind::Storage, "corrupt mapping row",
                          {{"mapping_id", row[0]}, {"match_type", row[5]}, {"status", row[6]}});
    }
    m.match_type = *type;
    m.status = *status;
    m.rejection_reason = row[7];
    m.created_by = row[8];
    m.notes = row[9];
    m.created_at = from_unix_ms(std::stoll(row[10]));
    m.updated_at = from_unix_ms(std::stoll(row[11]));
    return m;
}

std::string confidence_param(const MappingRecord& m) {
    if (!m.confidence) return "";
    std::ostringstream ss;
    ss.precision(17);
    ss << *m.confidence;
    return ss.str();
}

// Unique violation on statement_mappings_one_active
[[noreturn]] void rethrow_mapping_error(const MeisaiError& e, const MappingRecord& m) {
    if (e.kind() == ErrorKind::Storage && e.context_value("sqlstate") == "23505") {
        throw MeisaiError(ErrorKind::MappingConflict, "another mapping is already active",
                          {{"mapping_id", std::to_string(m.id)},
                           {"statement_record_id", std::to_string(m.statement_record_id)},
                           {"entity_type", m.external_entity_type}});
    }
    throw e;
}

} // namespace

void ensure_schema(PostgresConnection& db) {
    db.execute(kSchemaSql);
    Logger::step("Schema ready: statement_records, statement_mappings");
}

// ---------------------------------------------------------------------------
// PostgresStatementRepository
// ---------------------------------------------------------------------------

PostgresStatementRepository::PostgresStatementRepository(PostgresConnection& db) : db_(db) {}

std::optional<StatementRecord> PostgresStatementRepository::fetch_one(const std::string& where,
                                                                      const std::vector<std::string>& params) {
    std::optional<StatementRecord> out;
    db_.query(std::string(kRecordSelect) + where, params, [&](const PostgresConnection::Row& row) {
        out = record_from_row(row);
    });
    return out;
}

int64_t PostgresStatementRepository::create(StatementRecord& record) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    std::ostringstream sql;
    sql << "INSERT INTO statement_records (";
    for (size_t i = 0; i < kRecordColumns.size(); ++i) {
        if (i) sql << ", ";
        sql << kRecordColumns[i];
    }
    sql << ") VALUES (";
    for (size_t i = 0; i < kRecordColumns.size(); ++i) {
        if (i) sql << ", ";
        sql << record_param(i);
    }
    sql << ") RETURNING id";

    auto id = db_.query_single(sql.str(), record_values(record));
    if (!id) {
        throw MeisaiError(ErrorKind::Storage, "INSERT returned no id");
    }
    record.id = std::stoll(*id);
    return record.id;
}

std::optional<StatementRecord> PostgresStatementRepository::get(int64_t id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return fetch_one("WHERE id = $1", {std::to_string(id)});
}

void PostgresStatementRepository::update(const StatementRecord& record) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    std::ostringstream sql;
    sql << "UPDATE statement_records SET ";
    for (size_t i = 0; i < kRecordColumns.size(); ++i) {
        if (i) sql << ", ";
        sql << kRecordColumns[i] << " = " << record_param(i);
    }
    sql << " WHERE id = $" << (kRecordColumns.size() + 1);

    auto params = record_values(record);
    params.push_back(std::to_string(record.id));
    if (db_.execute_count(sql.str(), params) == 0) {
        throw MeisaiError(ErrorKind::RecordNotFound, "statement record not found",
                          {{"record_id", std::to_string(record.id)}});
    }
}

bool PostgresStatementRepository::remove(int64_t id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return db_.execute_count("DELETE FROM statement_records WHERE id = $1", {std::to_string(id)}) > 0;
}

size_t PostgresStatementRepository::bulk_insert(std::vector<StatementRecord>& records) {
    if (records.empty()) return 0;

    size_t inserted = 0;
    with_transaction([&](IStatementRepository&) {
        std::unordered_map<BLAKE3Pipeline::Hash, int64_t, HashHasher> ids;

        BulkCopy copy(db_, "statement_records", kRecordColumns);
        copy.on_conflict("ON CONFLICT (content_hash) DO NOTHING");
        copy.returning({"id", "content_hash"});
        for (const auto& r : records) {
            copy.add_row(record_values(r));
        }
        copy.commit([&](const PostgresConnection::Row& row) {
            ids[bytea_hex_to_hash(row[1])] = std::stoll(row[0]);
        });

        for (auto& r : records) {
            auto it = ids.find(r.content_hash);
            if (it == ids.end()) {
                r.id = 0;
                continue;
            }
            r.id = it->second;
            ids.erase(it);     // an in-batch duplicate keeps id 0
            ++inserted;
        }
    });

    Logger::bulk("Inserted " + std::to_string(inserted) + "/" + std::to_string(records.size()) + " statement records");
    return inserted;
}

std::optional<StatementRecord> PostgresStatementRepository::get_by_hash(const BLAKE3Pipeline::Hash& hash) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return fetch_one("WHERE content_hash = $1::bytea", {hash_to_bytea_hex(hash)});
}

IStatementRepository::HashPresence PostgresStatementRepository::check_duplicates_by_hash(
    const std::vector<BLAKE3Pipeline::Hash>& hashes) {
    HashPresence out;
    for (const auto& h : hashes) out[h] = false;
    if (hashes.empty()) return out;

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    db_.query("SELECT content_hash FROM statement_records "
              "WHERE content_hash IN (SELECT decode(h, 'hex') FROM unnest($1::text[]) AS h)",
              {hex_array_literal(hashes)},
              [&](const PostgresConnection::Row& row) {
                  out[bytea_hex_to_hash(row[0])] = true;
              });
    return out;
}

void PostgresStatementRepository::set_external_reference(int64_t id, const std::string& reference) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    size_t n = db_.execute_count("UPDATE statement_records SET external_reference_number = $1 WHERE id = $2",
                                 {reference, std::to_string(id)});
    if (n == 0) {
        throw MeisaiError(ErrorKind::RecordNotFound, "statement record not found",
                          {{"record_id", std::to_string(id)}});
    }
}

void PostgresStatementRepository::with_transaction(const std::function<void(IStatementRepository&)>& fn) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (tx_depth_ > 0) {
        // Nested: joins the outer transaction
        fn(*this);
        return;
    }

    PostgresConnection::Transaction txn(db_);
    ++tx_depth_;
    try {
        fn(*this);
    } catch (const std::exception&) {
        --tx_depth_;
        throw;      // txn destructor rolls back
    }
    --tx_depth_;
    txn.commit();
}

void PostgresStatementRepository::for_each(const std::function<void(const StatementRecord&)>& fn) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    db_.stream_query(std::string(kRecordSelect) + "ORDER BY id", [&](const PostgresConnection::Row& row) {
        fn(record_from_row(row));
    });
}

size_t PostgresStatementRepository::count() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto n = db_.query_single("SELECT count(*) FROM statement_records");
    return n ? std::stoull(*n) : 0;
}

// ---------------------------------------------------------------------------
// PostgresMappingRepository
// ---------------------------------------------------------------------------

PostgresMappingRepository::PostgresMappingRepository(PostgresConnection& db) : db_(db) {}

std::vector<MappingRecord> PostgresMappingRepository::select(const std::string& where,
                                                             const std::vector<std::string>& params) {
    std::vector<MappingRecord> out;
    db_.query(std::string(kMappingSelect) + where, params, [&](const PostgresConnection::Row& row) {
        out.push_back(mapping_from_row(row));
    });
    return out;
}

int64_t PostgresMappingRepository::create(MappingRecord& mapping) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mapping.created_at == Timestamp{}) mapping.created_at = now();
    mapping.updated_at = mapping.created_at;

    try {
        auto id = db_.query_single(
            "INSERT INTO statement_mappings (statement_record_id, external_entity_id, external_entity_type, "
            "confidence, match_type, status, rejection_reason, created_by, notes, created_at_ms, updated_at_ms) "
            "VALUES ($1, $2, $3, NULLIF($4, '')::double precision, $5, $6, NULLIF($7, ''), NULLIF($8, ''), "
            "NULLIF($9, ''), $10, $11) RETURNING id",
            {std::to_string(mapping.statement_record_id), mapping.external_entity_id,
             mapping.external_entity_type, confidence_param(mapping), to_string(mapping.match_type),
             to_string(mapping.status), mapping.rejection_reason, mapping.created_by, mapping.notes,
             std::to_string(to_unix_ms(mapping.created_at)), std::to_string(to_unix_ms(mapping.updated_at))});
        if (!id) {
            throw MeisaiError(ErrorKind::Storage, "INSERT returned no id");
        }
        mapping.id = std::stoll(*id);
    } catch (const MeisaiError& e) {
        rethrow_mapping_error(e, mapping);
    }
    return mapping.id;
}

std::optional<MappingRecord> PostgresMappingRepository::get(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto rows = select("WHERE id = $1", {std::to_string(id)});
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

void PostgresMappingRepository::update(const MappingRecord& mapping) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    try {
        n = db_.execute_count(
            "UPDATE statement_mappings SET external_entity_id = $2, external_entity_type = $3, "
            "confidence = NULLIF($4, '')::double precision, match_type = $5, status = $6, "
            "rejection_reason = NULLIF($7, ''), created_by = NULLIF($8, ''), notes = NULLIF($9, ''), "
            "updated_at_ms = $10 WHERE id = $1",
            {std::to_string(mapping.id), mapping.external_entity_id, mapping.external_entity_type,
             confidence_param(mapping), to_string(mapping.match_type), to_string(mapping.status),
             mapping.rejection_reason, mapping.created_by, mapping.notes, std::to_string(to_unix_ms(now()))});
    } catch (const MeisaiError& e) {
        rethrow_mapping_error(e, mapping);
    }
    if (n == 0) {
        throw MeisaiError(ErrorKind::MappingNotFound, "mapping not found",
                          {{"mapping_id", std::to_string(mapping.id)}});
    }
}

bool PostgresMappingRepository::remove(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_.execute_count("DELETE FROM statement_mappings WHERE id = $1", {std::to_string(id)}) > 0;
}

std::vector<MappingRecord> PostgresMappingRepository::list(const MappingFilter& filter) {
    std::vector<std::string> clauses;
    std::vector<std::string> params;
    auto bind = [&](const std::string& column, std::string value) {
        params.push_back(std::move(value));
        clauses.push_back(column + " = $" + std::to_string(params.size()));
    };

    if (filter.statement_record_id) bind("statement_record_id", std::to_string(*filter.statement_record_id));
    if (filter.match_type) bind("match_type", to_string(*filter.match_type));
    if (filter.status) bind("status", to_string(*filter.status));
    if (filter.entity_type) bind("external_entity_type", *filter.entity_type);

    std::ostringstream where;
    for (size_t i = 0; i < clauses.size(); ++i) {
        where << (i ? " AND " : "WHERE ") << clauses[i];
    }
    where << " ORDER BY id";
    if (filter.limit) where << " LIMIT " << filter.limit;
    if (filter.offset) where << " OFFSET " << filter.offset;

    std::lock_guard<std::mutex> lock(mutex_);
    return select(where.str(), params);
}

std::optional<MappingRecord> PostgresMappingRepository::find_active(int64_t statement_record_id,
                                                                    const std::string& entity_type) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto rows = select("WHERE statement_record_id = $1 AND external_entity_type = $2 AND status = 'active'",
                       {std::to_string(statement_record_id), entity_type});
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

} // namespace Meisai
