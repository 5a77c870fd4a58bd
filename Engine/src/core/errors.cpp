#include <core/errors.hpp>
#include <utility>

namespace Meisai {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::RowParse:        return "RowParseError";
        case ErrorKind::Validation:      return "ValidationError";
        case ErrorKind::SessionNotFound: return "SessionNotFound";
        case ErrorKind::MappingNotFound: return "MappingNotFound";
        case ErrorKind::RecordNotFound:  return "RecordNotFound";
        case ErrorKind::MappingConflict: return "MappingConflict";
        case ErrorKind::SessionFailure:  return "SessionFailure";
        case ErrorKind::Storage:         return "StorageError";
    }
    return "Unknown";
}

MeisaiError::MeisaiError(ErrorKind kind, const std::string& message, Context context)
    : std::runtime_error(format(kind, message)), kind_(kind), context_(std::move(context)) {}

std::string MeisaiError::context_value(const std::string& key) const {
    auto it = context_.find(key);
    return it == context_.end() ? std::string() : it->second;
}

std::string MeisaiError::format(ErrorKind kind, const std::string& message) {
    return std::string(to_string(kind)) + ": " + message;
}

} // namespace Meisai
