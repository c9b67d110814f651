#pragma once

#include "domain/SimpleInterest.hpp"
#include "domain/LoanError.hpp"
#include <nlohmann/json.hpp>

namespace loan::ports::input {

/**
 * @brief Результат нормализации полей для простых процентов
 */
struct SimpleInterestNormalizeResult {
    bool success = false;
    domain::SimpleInterestRequest request;
    domain::LoanError error;
};

/**
 * @brief Интерфейс сервиса простых процентов
 */
class IInterestService {
public:
    virtual ~IInterestService() = default;

    /**
     * @brief Привести поля principal, rate, time к SimpleInterestRequest
     */
    virtual SimpleInterestNormalizeResult normalize(const nlohmann::json& fields) = 0;

    /**
     * @brief simple_interest = principal * rate * time / 100
     */
    virtual domain::SimpleInterestResult calculate(const domain::SimpleInterestRequest& request) = 0;
};

} // namespace loan::ports::input
