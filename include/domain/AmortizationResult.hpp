#pragma once

#include "PaymentLine.hpp"
#include <vector>
#include <optional>

namespace loan::domain {

/**
 * @brief Итог расчёта аннуитетного кредита
 */
class AmortizationResult {
public:
    double payment = 0.0;           ///< Аннуитетный платёж (до корректировки последнего)
    double totalInterest = 0.0;
    double totalPayment = 0.0;      ///< principal + totalInterest
    std::optional<std::vector<PaymentLine>> schedule;   ///< Только при includeSchedule

    AmortizationResult() = default;
};

} // namespace loan::domain
