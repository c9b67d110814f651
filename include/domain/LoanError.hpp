#pragma once

#include "enums/ErrorCode.hpp"
#include <string>

namespace loan::domain {

/**
 * @brief Ошибка валидации входных данных кредита
 *
 * Все ошибки локальные и не требуют повтора: клиент получает 400
 * с текстом из message.
 */
class LoanError {
public:
    ErrorCode code = ErrorCode::INVALID_INPUT;
    std::string field;      ///< Имя поля с ошибкой (пусто, если не относится к полю)
    std::string message;

    LoanError() = default;

    LoanError(ErrorCode c, const std::string& f, const std::string& msg)
        : code(c), field(f), message(msg) {}

    static LoanError invalidNumber(const std::string& field) {
        return {ErrorCode::INVALID_INPUT, field, "Invalid numeric input for " + field};
    }

    static LoanError invalidInteger(const std::string& field) {
        return {ErrorCode::INVALID_INPUT, field, "Invalid integer input for " + field};
    }

    static LoanError invalidDate() {
        return {ErrorCode::INVALID_DATE, "start_date", "Invalid start_date format, use YYYY-MM-DD"};
    }

    static LoanError invalidTerm() {
        return {ErrorCode::INVALID_TERM, "", "Term must be positive"};
    }
};

} // namespace loan::domain
