#pragma once

namespace loan::domain {

/**
 * @brief Запрос на расчёт простых процентов
 */
class SimpleInterestRequest {
public:
    double principal = 0.0;
    double rate = 0.0;      ///< Процент в год
    double time = 0.0;      ///< Срок в годах

    SimpleInterestRequest() = default;

    SimpleInterestRequest(double p, double r, double t)
        : principal(p), rate(r), time(t) {}
};

/**
 * @brief Результат расчёта простых процентов
 */
class SimpleInterestResult {
public:
    double simpleInterest = 0.0;
    double totalAmount = 0.0;

    SimpleInterestResult() = default;
};

} // namespace loan::domain
