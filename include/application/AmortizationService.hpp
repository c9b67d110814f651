#pragma once

#include "ports/input/ILoanService.hpp"
#include "ports/output/IClock.hpp"
#include "application/InputNormalizer.hpp"
#include "domain/Money.hpp"
#include <memory>
#include <vector>
#include <cmath>
#include <iostream>

namespace loan::application {

/**
 * @brief Расчёт аннуитетного кредита и графика погашения
 *
 * Алгоритм:
 * 1. r = (годовая ставка / 100) / платежей в год
 * 2. Платёж: P * r / (1 - (1 + r)^-n), при r = 0 просто P / n
 * 3. По периодам: проценты = остаток * r, тело = платёж - проценты.
 *    Последний платёж гасит весь остаток, чтобы не накапливалась
 *    ошибка округления.
 *
 * Все суммы округляются до копеек на каждом шаге. Состояния нет,
 * сервис можно вызывать из разных потоков.
 */
class AmortizationService : public ports::input::ILoanService {
public:
    explicit AmortizationService(
        std::shared_ptr<ports::output::IClock> clock
    ) : clock_(std::move(clock))
    {
        std::cout << "[AmortizationService] Created" << std::endl;
    }

    ports::input::NormalizeResult normalize(const nlohmann::json& fields) override {
        return InputNormalizer::normalizeLoan(fields, *clock_);
    }

    ports::input::AmortizeResult amortize(const domain::LoanRequest& request) override {
        ports::input::AmortizeResult out;

        int64_t n = request.paymentCount();
        if (n <= 0 || request.paymentsPerYear <= 0) {
            out.error = domain::LoanError::invalidTerm();
            return out;
        }

        double rate = request.periodicRate();
        double payment = levelPayment(request.principal, rate, n);

        double balance = request.principal;
        double totalInterest = 0.0;
        std::vector<domain::PaymentLine> schedule;
        if (request.includeSchedule) {
            schedule.reserve(static_cast<size_t>(n));
        }

        for (int64_t i = 1; i <= n; ++i) {
            double interest = domain::Money::roundCents(balance * rate);
            double principalPaid = domain::Money::roundCents(payment - interest);
            double linePayment = payment;

            if (i == n) {
                principalPaid = domain::Money::roundCents(balance);
                linePayment = domain::Money::roundCents(principalPaid + interest);
                balance = 0.0;
            } else {
                balance = domain::Money::roundCents(balance - principalPaid);
            }

            totalInterest += interest;

            if (request.includeSchedule) {
                schedule.emplace_back(
                    i,
                    request.startDate.plusMonths(static_cast<int>(i - 1)),
                    domain::Money::roundCents(linePayment),
                    interest,
                    principalPaid,
                    domain::Money::roundCents(balance));
            }
        }

        out.result.payment = domain::Money::roundCents(payment);
        out.result.totalInterest = domain::Money::roundCents(totalInterest);
        out.result.totalPayment = domain::Money::roundCents(request.principal + totalInterest);
        if (request.includeSchedule) {
            out.result.schedule = std::move(schedule);
        }
        out.success = true;
        return out;
    }

    /**
     * @brief Аннуитетный платёж, округлённый до копеек
     *
     * Платёж в конце периода. При нулевой ставке основной долг делится поровну.
     */
    static double levelPayment(double principal, double rate, int64_t n) {
        if (rate == 0.0) {
            return domain::Money::roundCents(principal / static_cast<double>(n));
        }
        double discount = 1.0 - std::pow(1.0 + rate, -static_cast<double>(n));
        return domain::Money::roundCents(principal * rate / discount);
    }

private:
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace loan::application
