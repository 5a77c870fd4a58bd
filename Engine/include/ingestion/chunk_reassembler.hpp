/**
 * @file chunk_reassembler.hpp
 * @brief Rebuilds complete CSV rows from an ordered stream of upload chunks
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace Meisai {

/**
 * @brief One network fragment of a streamed upload. Not row-aligned.
 */
struct Chunk {
    std::string session_id;
    int64_t chunk_number = 0;
    std::string data;
    bool is_last = false;
};

enum class SessionMismatchPolicy {
    Reject,   // a foreign session id fails the stream
    Ignore    // a foreign chunk is logged and dropped
};

/**
 * @brief Row framing across chunk boundaries for a single session.
 *
 * Chunk numbers must be consecutive; the first chunk is numbered 0 or 1.
 * Gaps, regressions, chunks after the last one and (under Reject) foreign
 * session ids throw MeisaiError(SessionFailure).
 *
 * A row ends at a newline outside a quoted field, so quoted fields may span
 * lines and chunks. A field is quoted only when it opens with a double quote;
 * a stray quote inside an unquoted field is an ordinary character. CR before LF is dropped, blank lines are skipped, and a
 * leading UTF-8 BOM is removed even when split across chunks.
 */
class ChunkReassembler {
public:
    explicit ChunkReassembler(std::string session_id,
                              SessionMismatchPolicy policy = SessionMismatchPolicy::Reject);

    /**
     * @brief Accept a chunk and return every row it completes.
     *
     * On the last chunk the unterminated tail is returned as a final row.
     */
    std::vector<std::string> feed(const Chunk& chunk);

    bool finished() const noexcept { return finished_; }

    /**
     * @brief Bytes held back waiting for the rest of a row.
     */
    size_t buffered_bytes() const noexcept { return pending_.size(); }

    size_t ignored_chunks() const noexcept { return ignored_; }

    int64_t last_chunk_number() const noexcept { return last_number_; }

    /**
     * @brief Drop buffered bytes; no further chunks are accepted.
     */
    void reset();

    const std::string& session_id() const noexcept { return session_id_; }

private:
    void check_sequence(const Chunk& chunk);
    void drain_rows(std::vector<std::string>& rows);
    void emit(std::vector<std::string>& rows, std::string row);

    std::string session_id_;
    SessionMismatchPolicy policy_;

    std::string pending_;
    size_t scan_pos_ = 0;
    bool in_quotes_ = false;
    bool field_start_ = true;
    bool bom_checked_ = false;

    bool started_ = false;
    bool finished_ = false;
    int64_t last_number_ = -1;
    size_t ignored_ = 0;
};

} // namespace Meisai
