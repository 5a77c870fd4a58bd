/**
 * @file import_pipeline.cpp
 * @brief Row-by-row ingestion for one session
 */

#include <ingestion/import_pipeline.hpp>
#include <core/errors.hpp>
#include <hashing/record_hasher.hpp>
#include <utils/logger.hpp>
#include <sstream>

namespace Meisai {

namespace {

bool is_unique_violation(const MeisaiError& e) {
    return e.kind() == ErrorKind::Storage && e.context_value("sqlstate") == "23505";
}

// Errors that cost one row, not the session
bool is_row_level(ErrorKind kind) {
    return kind == ErrorKind::RowParse || kind == ErrorKind::Validation ||
           kind == ErrorKind::Storage || kind == ErrorKind::RecordNotFound;
}

} // namespace

SessionIngestor::SessionIngestor(std::shared_ptr<ImportSession> session,
                                 HashIndex& index,
                                 IStatementRepository& repository,
                                 PipelineOptions options,
                                 ProgressSink sink)
    : session_(std::move(session)),
      index_(index),
      repository_(repository),
      options_(options),
      sink_(std::move(sink)),
      reassembler_(session_->id(), options.mismatch_policy) {
    if (options_.progress_every == 0) options_.progress_every = 1;
}

void SessionIngestor::feed(const Chunk& chunk) {
    if (done()) {
        Logger::warn("Session " + session_->id() + " is finished; dropping chunk " +
                     std::to_string(chunk.chunk_number));
        return;
    }
    if (check_cancel()) return;

    try {
        auto rows = reassembler_.feed(chunk);
        process_rows(std::move(rows), reassembler_.finished());
    } catch (const MeisaiError& e) {
        fail(e.what());
    }
}

void SessionIngestor::import_content(const std::string& content) {
    Chunk whole;
    whole.session_id = session_->id();
    whole.chunk_number = 1;
    whole.data = content;
    whole.is_last = true;
    feed(whole);
}

void SessionIngestor::abort(const std::string& reason) {
    if (done()) return;
    fail(reason);
}

void SessionIngestor::process_rows(std::vector<std::string> rows, bool last) {
    size_t begin = 0;

    if (!header_checked_ && !rows.empty()) {
        header_checked_ = true;
        auto fields = CsvRowParser::tokenize(rows.front());
        if (CsvRowParser::is_header(fields)) {
            ++row_number_;
            if (fields.size() < CsvRowParser::COLUMN_COUNT) {
                fail("malformed header: expected " + std::to_string(CsvRowParser::COLUMN_COUNT) +
                     " columns, got " + std::to_string(fields.size()));
                return;
            }
            begin = 1;
        }
    }

    if (last) {
        size_t total = session_->progress().processed_rows + (rows.size() - begin);
        session_->confirm_total(total);
        counts_.total = total;
    }

    for (size_t i = begin; i < rows.size(); ++i) {
        if (check_cancel()) return;
        process_row(rows[i], ++row_number_);
        emit(false);
    }

    if (last) finish();
}

void SessionIngestor::process_row(const std::string& row, size_t row_number) {
    try {
        StatementRecord record = parser_.parse_line(row, row_number);
        classify_and_store(record);
    } catch (const MeisaiError& e) {
        if (!is_row_level(e.kind())) throw;
        session_->record_error(row_number, to_string(e.kind()), e.what());
        ++counts_.error;
    }
}

void SessionIngestor::classify_and_store(StatementRecord& record) {
    if (options_.validate_only) {
        // The index is untouched, so repeats within this run are tracked here.
        Classification kind = index_.peek(record.content_hash, record);
        if (!validated_hashes_.insert(record.content_hash).second) {
            kind = Classification::Duplicate;
        } else if (index_.change_detection() &&
                   !validated_keys_.insert(RecordHasher::natural_key(record)).second &&
                   kind == Classification::New) {
            kind = Classification::Changed;
        }
        switch (kind) {
            case Classification::Duplicate:
                session_->record_duplicate();
                ++counts_.duplicate;
                break;
            case Classification::Changed:
                session_->record_success(options_.update_existing);
                ++(options_.update_existing ? counts_.updated : counts_.added);
                break;
            case Classification::New:
                session_->record_success();
                ++counts_.added;
                break;
        }
        return;
    }

    HashIndex::Decision d = index_.classify(record.content_hash, record);

    switch (d.kind) {
        case Classification::Duplicate: {
            if (!options_.skip_duplicates && !repository_.get(d.existing_record_id)) {
                restore_missing(record);
                return;
            }
            session_->record_duplicate();
            ++counts_.duplicate;
            return;
        }

        case Classification::Changed: {
            if (options_.update_existing) {
                if (auto stored = repository_.get(d.existing_record_id)) {
                    record.id = stored->id;
                    record.external_reference_number = stored->external_reference_number;
                    repository_.update(record);
                    d.reservation.commit(record.id);
                    session_->record_success(true);
                    ++counts_.updated;
                    return;
                }
            }
            persist_new(record, d.reservation);
            return;
        }

        case Classification::New:
            persist_new(record, d.reservation);
            return;
    }
}

void SessionIngestor::persist_new(StatementRecord& record, HashIndex::Reservation& reservation) {
    try {
        repository_.create(record);
    } catch (const MeisaiError& e) {
        if (!is_unique_violation(e)) throw;     // reservation is released on unwind
        // Stored by someone the index did not hear about
        auto existing = repository_.get_by_hash(record.content_hash);
        if (!existing) throw;
        reservation.commit(existing->id);
        session_->record_duplicate();
        ++counts_.duplicate;
        return;
    }
    reservation.commit(record.id);
    session_->record_success();
    ++counts_.added;
}

// Indexed but gone from storage: store it again
void SessionIngestor::restore_missing(StatementRecord& record) {
    record.id = 0;
    try {
        repository_.create(record);
    } catch (const MeisaiError& e) {
        if (!is_unique_violation(e)) throw;
        // Restored concurrently, or stored under an id the index does not know
        if (auto existing = repository_.get_by_hash(record.content_hash)) {
            index_.insert(*existing);
        }
        session_->record_duplicate();
        ++counts_.duplicate;
        return;
    }
    index_.insert(record);
    session_->record_success();
    ++counts_.added;
}

void SessionIngestor::finish() {
    ProgressSnapshot p = session_->progress();
    if (p.processed_rows > 0) {
        double rate = static_cast<double>(p.error_rows) / static_cast<double>(p.processed_rows);
        if (rate > options_.max_error_rate) {
            std::ostringstream reason;
            reason << "error rate " << rate << " exceeds limit " << options_.max_error_rate;
            fail(reason.str());
            return;
        }
    }

    if (session_->complete()) {
        Logger::success("Import session " + session_->id() + " completed: " +
                        std::to_string(p.processed_rows) + " rows, " +
                        std::to_string(p.success_rows) + " stored, " +
                        std::to_string(p.duplicate_rows) + " duplicates, " +
                        std::to_string(p.error_rows) + " errors");
    }
    emit(true);
}

void SessionIngestor::fail(const std::string& reason) {
    reassembler_.reset();
    if (session_->fail(reason)) {
        Logger::error("Import session " + session_->id() + " failed: " + reason);
        emit(true);
    }
}

bool SessionIngestor::check_cancel() {
    if (!session_->cancel_requested()) return false;
    fail("cancelled");
    return true;
}

void SessionIngestor::emit(bool force) {
    if (!sink_) return;
    ProgressSnapshot p = session_->progress();
    if (force || p.processed_rows % options_.progress_every == 0) {
        sink_(p);
    }
}

} // namespace Meisai
