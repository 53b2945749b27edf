#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/LoanSettings.hpp"
#include "settings/ServerSettings.hpp"

// Ports
#include "ports/input/ILoanService.hpp"
#include "ports/output/ILoanStore.hpp"
#include "ports/output/ICashMovementRecorder.hpp"

// Application
#include "application/LoanService.hpp"

// Secondary Adapters
#include "adapters/secondary/PostgresLoanStore.hpp"
#include "adapters/secondary/PostgresCashMovementRecorder.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/CalculatorHandler.hpp"
#include "adapters/primary/LoanHandler.hpp"
#include "adapters/primary/LoanPaymentHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace loans
{

    /**
     * @brief Loan Service Application
     *
     * Займы, графики погашения и платежи с проводками по денежным счетам.
     * Остаток долга пересчитывается из истории платежей на каждом чтении.
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
                di::bind<settings::DbSettings>().in(di::singleton),
                di::bind<settings::LoanSettings>().in(di::singleton),
                di::bind<settings::ServerSettings>().in(di::singleton),

                di::bind<ports::output::ILoanStore>()
                    .to<adapters::secondary::PostgresLoanStore>()
                    .in(di::singleton),
                di::bind<ports::output::ICashMovementRecorder>()
                    .to<adapters::secondary::PostgresCashMovementRecorder>()
                    .in(di::singleton),

                di::bind<ports::input::ILoanService>().to<application::LoanService>().in(di::singleton));

            auto server = injector.create<std::shared_ptr<settings::ServerSettings>>();
            std::cout << "[LoanApp] Listening on " << server->getHost() << ":" << server->getPort() << std::endl;

            // HTTP Handlers
            handlers_[getHandlerKey("GET", "/health")] = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();

            auto calculatorHandler = injector.create<std::shared_ptr<adapters::primary::CalculatorHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/calculator/payment")] = calculatorHandler;
            handlers_[getHandlerKey("POST", "/api/v1/calculator/schedule")] = calculatorHandler;

            auto loanHandler = injector.create<std::shared_ptr<adapters::primary::LoanHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/loans")] = loanHandler;
            handlers_[getHandlerKey("POST", "/api/v1/loans")] = loanHandler;
            handlers_[getHandlerKey("GET", "/api/v1/loans/*")] = loanHandler;
            handlers_[getHandlerKey("PUT", "/api/v1/loans/*")] = loanHandler;
            handlers_[getHandlerKey("DELETE", "/api/v1/loans/*")] = loanHandler;
            handlers_[getHandlerKey("GET", "/api/v1/loans/*/schedule")] = loanHandler;

            auto paymentHandler = injector.create<std::shared_ptr<adapters::primary::LoanPaymentHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/loans/*/payments/suggestion")] = paymentHandler;
            handlers_[getHandlerKey("GET", "/api/v1/loans/*/payments/allocation")] = paymentHandler;
            handlers_[getHandlerKey("POST", "/api/v1/loans/*/payments")] = paymentHandler;
            handlers_[getHandlerKey("PUT", "/api/v1/payments/*")] = paymentHandler;
            handlers_[getHandlerKey("DELETE", "/api/v1/payments/*")] = paymentHandler;

            std::cout << "[LoanApp] Ready" << std::endl;
        }
    };

} // namespace loans
