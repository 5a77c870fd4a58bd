/**
 * @file errors.hpp
 * @brief Closed error taxonomy for ingestion, dedup and mapping
 */

#pragma once

#include <map>
#include <stdexcept>
#include <string>

namespace Meisai {

enum class ErrorKind {
    RowParse,         // malformed row, recovered by the caller
    Validation,       // bad input to an operation
    SessionNotFound,
    MappingNotFound,
    RecordNotFound,
    MappingConflict,  // another active mapping holds the (record, entity type) slot
    SessionFailure,   // stream corruption, session mismatch, cancellation
    Storage           // repository I/O
};

const char* to_string(ErrorKind kind);

/**
 * @brief Exception carrying an ErrorKind and structured context.
 *
 * Callers branch on kind(); what() is for humans only.
 */
class MeisaiError : public std::runtime_error {
public:
    using Context = std::map<std::string, std::string>;

    MeisaiError(ErrorKind kind, const std::string& message, Context context = {});

    ErrorKind kind() const noexcept { return kind_; }
    const Context& context() const noexcept { return context_; }

    /**
     * @brief Context value for @p key, or empty string.
     */
    std::string context_value(const std::string& key) const;

    bool is_not_found() const noexcept {
        return kind_ == ErrorKind::SessionNotFound ||
               kind_ == ErrorKind::MappingNotFound ||
               kind_ == ErrorKind::RecordNotFound;
    }

private:
    static std::string format(ErrorKind kind, const std::string& message);

    ErrorKind kind_;
    Context context_;
};

} // namespace Meisai
