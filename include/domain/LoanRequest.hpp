#pragma once

#include "Date.hpp"
#include <cmath>
#include <cstdint>
#include <limits>

namespace loan::domain {

/**
 * @brief Нормализованный запрос на расчёт графика погашения
 */
class LoanRequest {
public:
    double principal = 0.0;
    double annualRatePercent = 0.0;     ///< 6.0 означает 6% годовых
    double termYears = 0.0;
    int paymentsPerYear = 12;
    Date startDate;
    bool includeSchedule = true;

    LoanRequest() = default;

    /**
     * @brief Количество платежей: round(termYears * paymentsPerYear)
     *
     * Округление к ближайшему, половины к чётному (2.5 -> 2).
     * Значения за пределами int64 насыщаются.
     */
    int64_t paymentCount() const {
        double periods = std::nearbyint(termYears * paymentsPerYear);
        if (periods >= 9.2e18) return std::numeric_limits<int64_t>::max();
        if (periods <= -9.2e18) return std::numeric_limits<int64_t>::min();
        return static_cast<int64_t>(periods);
    }

    /**
     * @brief Ставка за период: (годовая / 100) / платежей в год
     */
    double periodicRate() const {
        return (annualRatePercent / 100.0) / paymentsPerYear;
    }
};

} // namespace loan::domain
