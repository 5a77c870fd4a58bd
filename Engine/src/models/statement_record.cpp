#include <models/statement_record.hpp>
#include <core/errors.hpp>
#include <cstdio>

namespace Meisai {

namespace {

// Howard Hinnant's days_from_civil.
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

} // namespace

std::vector<std::string> StatementRecord::validation_errors() const {
    std::vector<std::string> errors;
    if (date.empty())        errors.push_back("date is required");
    if (time.empty())        errors.push_back("time is required");
    if (entry_point.empty()) errors.push_back("entry point is required");
    if (exit_point.empty())  errors.push_back("exit point is required");
    if (card_number.empty()) errors.push_back("card number is required");
    if (toll_amount < 0)     errors.push_back("toll amount must be non-negative");
    return errors;
}

void StatementRecord::validate() const {
    auto errors = validation_errors();
    if (errors.empty()) return;

    std::string message;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i) message += "; ";
        message += errors[i];
    }
    throw MeisaiError(ErrorKind::Validation, message, {{"field", errors.front()}});
}

std::optional<int64_t> StatementRecord::epoch_minutes() const {
    return Meisai::epoch_minutes(date, time);
}

std::optional<int64_t> epoch_minutes(const std::string& date, const std::string& time) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0;
    if (std::sscanf(date.c_str(), "%4d-%2d-%2d", &y, &mo, &d) != 3) return std::nullopt;
    if (std::sscanf(time.c_str(), "%2d:%2d", &h, &mi) != 2) return std::nullopt;
    if (mo < 1 || mo > 12 || d < 1 || d > 31 || h < 0 || h > 23 || mi < 0 || mi > 59) return std::nullopt;

    int64_t days = days_from_civil(y, static_cast<unsigned>(mo), static_cast<unsigned>(d));
    return days * 1440 + h * 60 + mi;
}

} // namespace Meisai
