/**
 * @file chunk_reassembler.cpp
 * @brief Quote-aware row framing over chunk boundaries
 */

#include <ingestion/chunk_reassembler.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <utility>

namespace Meisai {

namespace {
const std::string kUtf8Bom = "\xEF\xBB\xBF";
}

ChunkReassembler::ChunkReassembler(std::string session_id, SessionMismatchPolicy policy)
    : session_id_(std::move(session_id)), policy_(policy) {}

void ChunkReassembler::check_sequence(const Chunk& chunk) {
    MeisaiError::Context ctx = {
        {"session_id", session_id_},
        {"chunk_number", std::to_string(chunk.chunk_number)}
    };

    if (finished_) {
        throw MeisaiError(ErrorKind::SessionFailure, "chunk received after the final chunk", ctx);
    }

    if (!started_) {
        if (chunk.chunk_number != 0 && chunk.chunk_number != 1) {
            throw MeisaiError(ErrorKind::SessionFailure, "stream must start at chunk 0 or 1", ctx);
        }
        return;
    }

    if (chunk.chunk_number <= last_number_) {
        ctx["expected"] = std::to_string(last_number_ + 1);
        throw MeisaiError(ErrorKind::SessionFailure, "chunk number regressed", ctx);
    }
    if (chunk.chunk_number != last_number_ + 1) {
        ctx["expected"] = std::to_string(last_number_ + 1);
        throw MeisaiError(ErrorKind::SessionFailure, "gap in chunk sequence", ctx);
    }
}

std::vector<std::string> ChunkReassembler::feed(const Chunk& chunk) {
    std::vector<std::string> rows;

    if (chunk.session_id != session_id_) {
        MeisaiError::Context ctx = {
            {"session_id", session_id_},
            {"received_session_id", chunk.session_id},
            {"chunk_number", std::to_string(chunk.chunk_number)}
        };
        if (policy_ == SessionMismatchPolicy::Reject) {
            throw MeisaiError(ErrorKind::SessionFailure, "chunk belongs to a different session", ctx);
        }
        ++ignored_;
        Logger::warn("Ignoring chunk " + std::to_string(chunk.chunk_number) + " for session " +
                     chunk.session_id + " on stream " + session_id_);
        return rows;
    }

    check_sequence(chunk);
    started_ = true;
    last_number_ = chunk.chunk_number;

    pending_.append(chunk.data);

    if (!bom_checked_) {
        if (pending_.size() < kUtf8Bom.size() && !chunk.is_last) {
            return rows;
        }
        if (pending_.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0) {
            pending_.erase(0, kUtf8Bom.size());
        }
        bom_checked_ = true;
    }

    drain_rows(rows);

    if (chunk.is_last) {
        finished_ = true;
        std::string tail = std::move(pending_);
        pending_.clear();
        scan_pos_ = 0;
        in_quotes_ = false;
        field_start_ = true;
        emit(rows, std::move(tail));
    }
    return rows;
}

// Same quoting rules as CsvRowParser::tokenize: a field is quoted only when its
// first non-space byte is '"'; a quote anywhere else is literal. Inside a quoted
// field "" is an escaped quote and a quote before ',', CR or LF closes it.
void ChunkReassembler::drain_rows(std::vector<std::string>& rows) {
    size_t row_start = 0;
    size_t i = scan_pos_;
    while (i < pending_.size()) {
        char c = pending_[i];
        if (in_quotes_) {
            if (c == '"') {
                if (i + 1 >= pending_.size()) break;   // decided by the next chunk
                char next = pending_[i + 1];
                if (next == '"') {
                    i += 2;
                    continue;
                }
                if (next == ',' || next == '\r' || next == '\n') in_quotes_ = false;
            }
            ++i;
            continue;
        }

        if (c == '"' && field_start_) {
            in_quotes_ = true;
            field_start_ = false;
        } else if (c == ',') {
            field_start_ = true;
        } else if (c == '\n') {
            emit(rows, pending_.substr(row_start, i - row_start));
            row_start = i + 1;
            field_start_ = true;
        } else if (c != ' ') {
            field_start_ = false;
        }
        ++i;
    }
    pending_.erase(0, row_start);
    scan_pos_ = i - row_start;
}

void ChunkReassembler::emit(std::vector<std::string>& rows, std::string row) {
    if (!row.empty() && row.back() == '\r') row.pop_back();
    if (row.find_first_not_of(" \t\r") == std::string::npos) return;
    rows.push_back(std::move(row));
}

void ChunkReassembler::reset() {
    pending_.clear();
    pending_.shrink_to_fit();
    scan_pos_ = 0;
    in_quotes_ = false;
    field_start_ = true;
    finished_ = true;
}

} // namespace Meisai
