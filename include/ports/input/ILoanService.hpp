#pragma once

#include "domain/LoanRequest.hpp"
#include "domain/AmortizationResult.hpp"
#include "domain/LoanError.hpp"
#include <nlohmann/json.hpp>

namespace loan::ports::input {

/**
 * @brief Результат нормализации входных полей
 */
struct NormalizeResult {
    bool success = false;
    domain::LoanRequest request;
    domain::LoanError error;
};

/**
 * @brief Результат расчёта графика погашения
 */
struct AmortizeResult {
    bool success = false;
    domain::AmortizationResult result;
    domain::LoanError error;
};

/**
 * @brief Интерфейс сервиса расчёта аннуитетного кредита
 */
class ILoanService {
public:
    virtual ~ILoanService() = default;

    /**
     * @brief Привести сырые поля запроса к LoanRequest
     *
     * @param fields JSON объект: значения могут отсутствовать, быть null,
     *               пустой строкой, строкой или числом
     */
    virtual NormalizeResult normalize(const nlohmann::json& fields) = 0;

    /**
     * @brief Рассчитать аннуитетный платёж и график погашения
     */
    virtual AmortizeResult amortize(const domain::LoanRequest& request) = 0;
};

} // namespace loan::ports::input
