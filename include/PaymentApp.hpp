// include/PaymentApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <HttpClient.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/AuthClientSettings.hpp"
#include "settings/CatalogClientSettings.hpp"
#include "settings/GatewayClientSettings.hpp"
#include "settings/PaymentSettings.hpp"
#include "settings/RabbitMQSettings.hpp"
#include "settings/CacheSettings.hpp"
#include "settings/DbSettings.hpp"

// Ports
#include "ports/input/IPaymentService.hpp"
#include "ports/input/ICartService.hpp"
#include "ports/input/IOrderQueryService.hpp"
#include "ports/output/IOrderStore.hpp"
#include "ports/output/ITransactionLedger.hpp"
#include "ports/output/IPaymentMethodRegistry.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "ports/output/IPaymentGateway.hpp"
#include "ports/output/IDelayer.hpp"
#include "ports/output/IAuthClient.hpp"
#include "ports/output/ICustomerDirectory.hpp"
#include "ports/output/ICatalogClient.hpp"
#include "ports/output/IEventPublisher.hpp"

// Application
#include "application/PaymentService.hpp"
#include "application/CartService.hpp"
#include "application/OrderQueryService.hpp"

// Secondary Adapters
#include "adapters/secondary/HttpPaymentGateway.hpp"
#include "adapters/secondary/RetryingPaymentGateway.hpp"
#include "adapters/secondary/ThreadDelayer.hpp"
#include "adapters/secondary/HttpAuthClient.hpp"
#include "adapters/secondary/HttpCustomerDirectory.hpp"
#include "adapters/secondary/HttpCatalogClient.hpp"
#include "adapters/secondary/CachedPaymentMethodRegistry.hpp"
#include "adapters/secondary/events/RabbitMQAdapter.hpp"
#include "adapters/secondary/persistence/PostgresSession.hpp"
#include "adapters/secondary/persistence/PostgresOrderStore.hpp"
#include "adapters/secondary/persistence/PostgresTransactionLedger.hpp"
#include "adapters/secondary/persistence/PostgresPaymentMethodRegistry.hpp"
#include "adapters/secondary/persistence/InMemoryOrderStore.hpp"
#include "adapters/secondary/persistence/InMemoryTransactionLedger.hpp"
#include "adapters/secondary/persistence/InMemoryUnitOfWork.hpp"
#include "adapters/secondary/persistence/InMemoryPaymentMethodRegistry.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/ChainHandler.hpp"
#include "adapters/primary/CustomerIdExtractorMiddleware.hpp"
#include "adapters/primary/GetPaymentMethodsHandler.hpp"
#include "adapters/primary/ProcessPaymentHandler.hpp"
#include "adapters/primary/CartHandler.hpp"
#include "adapters/primary/OrderHistoryHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace payment
{

    /**
     * @brief Payment Service Application
     *
     * Корзина → оформление → оплата (Bank / IBox terminal / Visa).
     * Публикует: invoice.issued, payment.completed, payment.failed (в payment.events)
     */
    class PaymentApp : public BoostBeastApplication
    {
    public:
        PaymentApp() { std::cout << "[PaymentApp] Initializing..." << std::endl; }
        ~PaymentApp() override { std::cout << "[PaymentApp] Shutting down..." << std::endl; }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[PaymentApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[PaymentApp] Configuring DI..." << std::endl;

            // Шаг 1: Настройки с несколькими конструкторами создаём явно
            auto paymentSettings = std::make_shared<settings::PaymentSettings>();
            auto cacheSettings = std::make_shared<settings::CacheSettings>();

            // Шаг 2: Хранилище (postgres | memory)
            Storage storage = paymentSettings->useInMemoryStorage()
                ? createInMemoryStorage()
                : createPostgresStorage();

            auto methodRegistry = std::make_shared<adapters::secondary::CachedPaymentMethodRegistry>(
                storage.methods, cacheSettings);

            // Шаг 3: RabbitMQAdapter через DI
            auto rabbitInjector = di::make_injector(
                di::bind<settings::RabbitMQSettings>().in(di::singleton));
            auto rabbitMQAdapter = rabbitInjector.create<std::shared_ptr<adapters::secondary::RabbitMQAdapter>>();

            // Шаг 4: Основной injector с instance binding для хранилища и RabbitMQ
            auto injector = di::make_injector(
                di::bind<settings::AuthClientSettings>().in(di::singleton),
                di::bind<settings::CatalogClientSettings>().in(di::singleton),
                di::bind<settings::IGatewayClientSettings>().to<settings::GatewayClientSettings>().in(di::singleton),
                di::bind<settings::PaymentSettings>().to(paymentSettings),

                di::bind<ports::output::IOrderStore>().to(storage.orders),
                di::bind<ports::output::ITransactionLedger>().to(storage.ledger),
                di::bind<ports::output::IUnitOfWork>().to(storage.unitOfWork),
                di::bind<ports::output::IPaymentMethodRegistry>().to(methodRegistry),

                di::bind<IHttpClient>().to<HttpClient>().in(di::singleton),
                di::bind<ports::output::IDelayer>().to<adapters::secondary::ThreadDelayer>().in(di::singleton),
                di::bind<adapters::secondary::HttpPaymentGateway>().in(di::singleton),
                di::bind<ports::output::IPaymentGateway>().to<adapters::secondary::RetryingPaymentGateway>().in(di::singleton),
                di::bind<ports::output::IAuthClient>().to<adapters::secondary::HttpAuthClient>().in(di::singleton),
                di::bind<ports::output::ICustomerDirectory>().to<adapters::secondary::HttpCustomerDirectory>().in(di::singleton),
                di::bind<ports::output::ICatalogClient>().to<adapters::secondary::HttpCatalogClient>().in(di::singleton),

                di::bind<ports::output::IEventPublisher>().to(rabbitMQAdapter),

                di::bind<ports::input::IPaymentService>().to<application::PaymentService>().in(di::singleton),
                di::bind<ports::input::ICartService>().to<application::CartService>().in(di::singleton),
                di::bind<ports::input::IOrderQueryService>().to<application::OrderQueryService>().in(di::singleton));

            // Шаг 5: HTTP Handlers
            handlers_[getHandlerKey("GET", "/health")] = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();

            handlers_[getHandlerKey("GET", "/api/orders/payment-methods")] =
                injector.create<std::shared_ptr<adapters::primary::GetPaymentMethodsHandler>>();

            auto customerIdMiddleware = injector.create<std::shared_ptr<adapters::primary::CustomerIdExtractorMiddleware>>();

            auto paymentHandler = std::make_shared<adapters::primary::ChainHandler>(
                customerIdMiddleware,
                injector.create<std::shared_ptr<adapters::primary::ProcessPaymentHandler>>());
            handlers_[getHandlerKey("POST", "/api/orders/payment")] = paymentHandler;

            auto cartHandler = std::make_shared<adapters::primary::ChainHandler>(
                customerIdMiddleware,
                injector.create<std::shared_ptr<adapters::primary::CartHandler>>());
            handlers_[getHandlerKey("GET", "/api/orders/cart")] = cartHandler;
            handlers_[getHandlerKey("DELETE", "/api/orders/cart")] = cartHandler;
            handlers_[getHandlerKey("DELETE", "/api/orders/cart/*")] = cartHandler;
            handlers_[getHandlerKey("PUT", "/api/orders/cart/*/quantity")] = cartHandler;
            handlers_[getHandlerKey("POST", "/api/games/*/buy")] = cartHandler;

            auto historyHandler = std::make_shared<adapters::primary::ChainHandler>(
                customerIdMiddleware,
                injector.create<std::shared_ptr<adapters::primary::OrderHistoryHandler>>());
            handlers_[getHandlerKey("GET", "/api/orders")] = historyHandler;
            handlers_[getHandlerKey("GET", "/api/orders/history")] = historyHandler;
            handlers_[getHandlerKey("GET", "/api/orders/*")] = historyHandler;
            handlers_[getHandlerKey("GET", "/api/orders/*/transactions")] = historyHandler;

            // Шаг 6: Запускаем RabbitMQ ПОСЛЕ регистрации всех handlers
            std::cout << "[PaymentApp] Starting RabbitMQ..." << std::endl;
            rabbitMQAdapter->start();

            std::cout << "[PaymentApp] Ready (storage: " << paymentSettings->getStorage() << ")" << std::endl;
        }

    private:
        struct Storage
        {
            std::shared_ptr<ports::output::IOrderStore> orders;
            std::shared_ptr<ports::output::ITransactionLedger> ledger;
            std::shared_ptr<ports::output::IUnitOfWork> unitOfWork;
            std::shared_ptr<ports::output::IPaymentMethodRegistry> methods;
        };

        Storage createPostgresStorage()
        {
            auto session = std::make_shared<adapters::secondary::PostgresSession>(
                std::make_shared<settings::DbSettings>());

            Storage storage;
            storage.orders = std::make_shared<adapters::secondary::PostgresOrderStore>(session);
            storage.ledger = std::make_shared<adapters::secondary::PostgresTransactionLedger>(session);
            storage.methods = std::make_shared<adapters::secondary::PostgresPaymentMethodRegistry>(session);
            storage.unitOfWork = session;
            return storage;
        }

        Storage createInMemoryStorage()
        {
            auto orders = std::make_shared<adapters::secondary::InMemoryOrderStore>();
            auto ledger = std::make_shared<adapters::secondary::InMemoryTransactionLedger>();

            Storage storage;
            storage.orders = orders;
            storage.ledger = ledger;
            storage.methods = std::make_shared<adapters::secondary::InMemoryPaymentMethodRegistry>();
            storage.unitOfWork = std::make_shared<adapters::secondary::InMemoryUnitOfWork>(orders, ledger);
            return storage;
        }
    };

} // namespace payment
