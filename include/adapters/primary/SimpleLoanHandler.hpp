#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ILoanService.hpp"
#include "settings/LoanSettings.hpp"
#include "adapters/primary/RequestFields.hpp"
#include "adapters/primary/CsvScheduleWriter.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <vector>
#include <memory>
#include <iostream>

namespace loan::adapters::primary
{

    /**
     * @brief POST /api/simple_loan - график погашения аннуитетного кредита
     *
     * Тело (JSON или форма):
     *   principal, annual_rate (rate), term_years (time), payments_per_year,
     *   start_date (YYYY-MM-DD), include_schedule, export ("json" | "csv")
     *
     * Response (200 OK):
     * {
     *   "payment": 106.62,
     *   "total_interest": 79.42,
     *   "total_payment": 1279.42,
     *   "schedule": [{"payment_no": 1, "date": "2024-01-01", ...}]
     * }
     *
     * При export=csv возвращается файл simple_loan_schedule.csv.
     * Ошибки валидации: 400 {"error": "..."}.
     */
    class SimpleLoanHandler : public IHttpHandler
    {
    public:
        SimpleLoanHandler(
            std::shared_ptr<ports::input::ILoanService> loanService,
            std::shared_ptr<settings::LoanSettings> settings) : loanService_(std::move(loanService)), settings_(std::move(settings))
        {
            std::cout << "[SimpleLoanHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "POST")
            {
                sendError(res, 405, "Method not allowed");
                return;
            }

            try
            {
                auto fields = RequestFields::fromRequest(req);
                if (!fields)
                {
                    sendError(res, 400, "Invalid JSON");
                    return;
                }

                auto normalized = loanService_->normalize(*fields);
                if (!normalized.success)
                {
                    std::cout << "[SimpleLoanHandler] Rejected " << domain::toString(normalized.error.code)
                              << ": " << normalized.error.message << std::endl;
                    sendError(res, 400, normalized.error.message);
                    return;
                }

                bool csv = isCsvExport(*fields);
                domain::LoanRequest request = normalized.request;
                if (csv)
                {
                    // CSV всегда содержит полный график
                    request.includeSchedule = true;
                }

                if (request.paymentCount() > settings_->getMaxPayments())
                {
                    sendError(res, 400, "Too many payments, maximum is " + std::to_string(settings_->getMaxPayments()));
                    return;
                }

                auto amortized = loanService_->amortize(request);
                if (!amortized.success)
                {
                    std::cout << "[SimpleLoanHandler] Rejected " << domain::toString(amortized.error.code)
                              << ": " << amortized.error.message << std::endl;
                    sendError(res, 400, amortized.error.message);
                    return;
                }

                if (csv)
                {
                    const auto &schedule = amortized.result.schedule;
                    res.setStatus(200);
                    res.setHeader("Content-Type", CsvScheduleWriter::CONTENT_TYPE);
                    res.setHeader("Content-Disposition",
                                  std::string("attachment; filename=") + CsvScheduleWriter::FILE_NAME);
                    res.setBody(CsvScheduleWriter::write(schedule ? *schedule : std::vector<domain::PaymentLine>{}));
                    return;
                }

                res.setResult(200, "application/json", toJson(amortized.result).dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[SimpleLoanHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::ILoanService> loanService_;
        std::shared_ptr<settings::LoanSettings> settings_;

        static bool isCsvExport(const nlohmann::json &fields)
        {
            auto it = fields.find("export");
            if (it == fields.end() || !it->is_string())
            {
                return false;
            }
            std::string value = it->get<std::string>();
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value == "csv";
        }

        static nlohmann::json toJson(const domain::AmortizationResult &result)
        {
            nlohmann::json response;
            response["payment"] = result.payment;
            response["total_interest"] = result.totalInterest;
            response["total_payment"] = result.totalPayment;

            if (result.schedule)
            {
                response["schedule"] = nlohmann::json::array();
                for (const auto &line : *result.schedule)
                {
                    nlohmann::json l;
                    l["payment_no"] = line.paymentNo;
                    l["date"] = line.date.toString();
                    l["payment"] = line.payment;
                    l["interest"] = line.interest;
                    l["principal"] = line.principal;
                    l["balance"] = line.balance;
                    response["schedule"].push_back(l);
                }
            }
            return response;
        }

        void sendError(IResponse &res, int status, const std::string &message)
        {
            nlohmann::json error;
            error["error"] = message;
            res.setResult(status, "application/json", error.dump());
        }
    };

} // namespace loan::adapters::primary
