#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IInterestService.hpp"
#include "adapters/primary/RequestFields.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace loan::adapters::primary
{

    /**
     * @brief POST /api/calc - простые проценты
     *
     * Тело: {"principal": 1000, "rate": 5, "time": 2}
     * Response (200 OK): {"simple_interest": 100.0, "total_amount": 1100.0}
     */
    class SimpleInterestHandler : public IHttpHandler
    {
    public:
        explicit SimpleInterestHandler(
            std::shared_ptr<ports::input::IInterestService> interestService) : interestService_(std::move(interestService))
        {
            std::cout << "[SimpleInterestHandler] Created" << std::endl;
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

                auto normalized = interestService_->normalize(*fields);
                if (!normalized.success)
                {
                    std::cout << "[SimpleInterestHandler] Rejected " << domain::toString(normalized.error.code)
                              << ": " << normalized.error.message << std::endl;
                    sendError(res, 400, normalized.error.message);
                    return;
                }

                auto result = interestService_->calculate(normalized.request);

                nlohmann::json response;
                response["simple_interest"] = result.simpleInterest;
                response["total_amount"] = result.totalAmount;
                res.setResult(200, "application/json", response.dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[SimpleInterestHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IInterestService> interestService_;

        void sendError(IResponse &res, int status, const std::string &message)
        {
            nlohmann::json error;
            error["error"] = message;
            res.setResult(status, "application/json", error.dump());
        }
    };

} // namespace loan::adapters::primary
