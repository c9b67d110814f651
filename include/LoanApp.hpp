// include/LoanApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/LoanSettings.hpp"

// Ports
#include "ports/input/ILoanService.hpp"
#include "ports/input/IInterestService.hpp"
#include "ports/output/IClock.hpp"

// Application
#include "application/AmortizationService.hpp"
#include "application/SimpleInterestService.hpp"

// Secondary Adapters
#include "adapters/secondary/SystemClock.hpp"

// Primary Adapters
#include "adapters/primary/SimpleInterestHandler.hpp"
#include "adapters/primary/SimpleLoanHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace loan
{

    /**
     * @brief Loan Service Application
     *
     * HTTP:
     * - POST /api/calc         - простые проценты
     * - POST /api/simple_loan  - график погашения (JSON или CSV)
     */
    class LoanApp : public BoostBeastApplication
    {
    public:
        LoanApp() { std::cout << "[LoanApp] Initializing..." << std::endl; }
        ~LoanApp() override { std::cout << "[LoanApp] Shutting down..." << std::endl; }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[LoanApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[LoanApp] Configuring DI..." << std::endl;

            auto injector = di::make_injector(
                di::bind<settings::LoanSettings>().in(di::singleton),
                di::bind<ports::output::IClock>().to<adapters::secondary::SystemClock>().in(di::singleton),
                di::bind<ports::input::ILoanService>().to<application::AmortizationService>().in(di::singleton),
                di::bind<ports::input::IInterestService>().to<application::SimpleInterestService>().in(di::singleton));

            handlers_[getHandlerKey("POST", "/api/calc")] = injector.create<std::shared_ptr<adapters::primary::SimpleInterestHandler>>();
            handlers_[getHandlerKey("POST", "/api/simple_loan")] = injector.create<std::shared_ptr<adapters::primary::SimpleLoanHandler>>();

            auto settings = injector.create<std::shared_ptr<settings::LoanSettings>>();
            std::cout << "[LoanApp] Max payments per schedule: " << settings->getMaxPayments() << std::endl;
            std::cout << "[LoanApp] Ready" << std::endl;
        }
    };

} // namespace loan
