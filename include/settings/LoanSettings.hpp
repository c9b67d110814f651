#pragma once

#include <cstdint>
#include <cstdlib>
#include <string>

namespace loan::settings {

/**
 * @brief Настройки расчёта кредитов
 *
 * Читает из ENV:
 * - LOAN_MAX_PAYMENTS (default: 1200) - максимальная длина графика
 */
class LoanSettings {
public:
    LoanSettings() {
        if (const char* val = std::getenv("LOAN_MAX_PAYMENTS")) {
            maxPayments_ = std::stoll(val);
        }
    }

    int64_t getMaxPayments() const { return maxPayments_; }

private:
    int64_t maxPayments_ = 1200;
};

} // namespace loan::settings
