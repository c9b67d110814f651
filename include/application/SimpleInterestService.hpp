#pragma once

#include "ports/input/IInterestService.hpp"
#include "application/InputNormalizer.hpp"
#include "domain/Money.hpp"
#include <iostream>

namespace loan::application {

/**
 * @brief Сервис простых процентов
 */
class SimpleInterestService : public ports::input::IInterestService {
public:
    SimpleInterestService() {
        std::cout << "[SimpleInterestService] Created" << std::endl;
    }

    ports::input::SimpleInterestNormalizeResult normalize(const nlohmann::json& fields) override {
        return InputNormalizer::normalizeSimpleInterest(fields);
    }

    domain::SimpleInterestResult calculate(const domain::SimpleInterestRequest& request) override {
        double interest = (request.principal * request.rate * request.time) / 100;

        domain::SimpleInterestResult result;
        result.simpleInterest = domain::Money::roundCents(interest);
        result.totalAmount = domain::Money::roundCents(request.principal + interest);
        return result;
    }
};

} // namespace loan::application
