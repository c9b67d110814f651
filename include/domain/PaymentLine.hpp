#pragma once

#include "Date.hpp"
#include <cstdint>

namespace loan::domain {

/**
 * @brief Строка графика погашения (один платёж)
 *
 * Все суммы округлены до 2 знаков.
 */
class PaymentLine {
public:
    int64_t paymentNo = 0;      ///< Номер платежа, начиная с 1
    Date date;
    double payment = 0.0;
    double interest = 0.0;
    double principal = 0.0;
    double balance = 0.0;       ///< Остаток долга после платежа

    PaymentLine() = default;

    PaymentLine(int64_t no, const Date& d, double pay, double interestPart,
                double principalPart, double remaining)
        : paymentNo(no), date(d), payment(pay), interest(interestPart)
        , principal(principalPart), balance(remaining)
    {}
};

} // namespace loan::domain
