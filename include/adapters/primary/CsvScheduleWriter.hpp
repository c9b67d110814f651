#pragma once

#include "domain/PaymentLine.hpp"
#include "domain/Money.hpp"
#include <string>
#include <vector>
#include <sstream>

namespace loan::adapters::primary {

/**
 * @brief Выгрузка графика погашения в CSV
 *
 * Заголовок: payment_no,date,payment,interest,principal,balance.
 * Суммы ровно с 2 знаками, строки завершаются CRLF.
 */
class CsvScheduleWriter {
public:
    static constexpr const char* CONTENT_TYPE = "text/csv";
    static constexpr const char* FILE_NAME = "simple_loan_schedule.csv";

    static std::string write(const std::vector<domain::PaymentLine>& schedule) {
        std::ostringstream out;
        out << "payment_no,date,payment,interest,principal,balance\r\n";

        for (const auto& line : schedule) {
            out << line.paymentNo << ','
                << line.date.toString() << ','
                << domain::Money::format(line.payment) << ','
                << domain::Money::format(line.interest) << ','
                << domain::Money::format(line.principal) << ','
                << domain::Money::format(line.balance) << "\r\n";
        }
        return out.str();
    }
};

} // namespace loan::adapters::primary
