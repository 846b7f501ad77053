// include/InventoryApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/StorageSettings.hpp"
#include "settings/CacheSettings.hpp"
#include "settings/ReservationSettings.hpp"
#include "settings/SweeperSettings.hpp"
#include "settings/RabbitMQSettings.hpp"

// Ports
#include "ports/input/IReservationService.hpp"
#include "ports/input/IDeductionService.hpp"
#include "ports/input/IInventoryService.hpp"
#include "ports/output/IInventoryStore.hpp"
#include "ports/output/IReservationRepository.hpp"
#include "ports/output/ITransactionLedger.hpp"
#include "ports/output/IEventPublisher.hpp"

// Application
#include "application/InventoryEventEmitter.hpp"
#include "application/ReservationManager.hpp"
#include "application/DeductionService.hpp"
#include "application/InventoryService.hpp"
#include "application/ExpirationSweeper.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/PostgresInventoryStore.hpp"
#include "adapters/secondary/persistence/PostgresReservationRepository.hpp"
#include "adapters/secondary/persistence/PostgresTransactionLedger.hpp"
#include "adapters/secondary/persistence/InMemoryInventoryStore.hpp"
#include "adapters/secondary/persistence/InMemoryReservationRepository.hpp"
#include "adapters/secondary/persistence/InMemoryTransactionLedger.hpp"
#include "adapters/secondary/CachedInventoryStore.hpp"
#include "adapters/secondary/events/RabbitMQAdapter.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/GetStockHandler.hpp"
#include "adapters/primary/GetStocksBatchHandler.hpp"
#include "adapters/primary/UpdateThresholdsHandler.hpp"
#include "adapters/primary/GetLowStockHandler.hpp"
#include "adapters/primary/AdjustStockHandler.hpp"
#include "adapters/primary/CreateReservationHandler.hpp"
#include "adapters/primary/GetReservationsHandler.hpp"
#include "adapters/primary/ExtendReservationHandler.hpp"
#include "adapters/primary/ReleaseReservationHandler.hpp"
#include "adapters/primary/DeductHandler.hpp"
#include "adapters/primary/GetLedgerHandler.hpp"
#include "adapters/primary/ReconcileHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace inventory
{

    /**
     * @brief Inventory Service Application
     *
     * Резервы корзин и заказов, списание после оплаты, возврат просроченных
     * резервов фоновым ExpirationSweeper.
     *
     * Хранилище: PostgreSQL или память (INVENTORY_STORAGE=memory).
     * Публикует: inventory.*, reservation.expired, stock.low (в inventory.events)
     */
    class InventoryApp : public BoostBeastApplication
    {
    public:
        InventoryApp() { std::cout << "[InventoryApp] Initializing..." << std::endl; }

        ~InventoryApp() override
        {
            if (sweeper_)
            {
                sweeper_->stop();
            }
            std::cout << "[InventoryApp] Shutting down..." << std::endl;
        }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[InventoryApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[InventoryApp] Configuring DI..." << std::endl;

            auto storageSettings = std::make_shared<settings::StorageSettings>();
            std::cout << "[InventoryApp] Storage backend: " << storageSettings->getBackend() << std::endl;

            if (storageSettings->isInMemory())
            {
                configureWith<adapters::secondary::InMemoryInventoryStore,
                              adapters::secondary::InMemoryReservationRepository,
                              adapters::secondary::InMemoryTransactionLedger>(storageSettings);
            }
            else
            {
                configureWith<adapters::secondary::PostgresInventoryStore,
                              adapters::secondary::PostgresReservationRepository,
                              adapters::secondary::PostgresTransactionLedger>(storageSettings);
            }
        }

    private:
        std::shared_ptr<adapters::secondary::RabbitMQAdapter> rabbitMQAdapter_;
        std::shared_ptr<application::ExpirationSweeper> sweeper_;

        template <typename TStore, typename TReservations, typename TLedger>
        void configureWith(std::shared_ptr<settings::StorageSettings> storageSettings)
        {
            // Шаг 1: RabbitMQAdapter (подключается в фоне, события копятся до готовности)
            auto rabbitInjector = di::make_injector(
                di::bind<settings::RabbitMQSettings>().in(di::singleton));
            rabbitMQAdapter_ = rabbitInjector.create<std::shared_ptr<adapters::secondary::RabbitMQAdapter>>();

            // Шаг 2: Хранилища выбранного бэкенда
            auto storageInjector = di::make_injector(
                di::bind<settings::DbSettings>().in(di::singleton),
                di::bind<settings::StorageSettings>().to(storageSettings),
                di::bind<ports::output::ITransactionLedger>().to<TLedger>().in(di::singleton),
                di::bind<ports::output::IReservationRepository>().to<TReservations>().in(di::singleton),
                di::bind<ports::output::IInventoryStore>().to<TStore>().in(di::singleton));

            std::shared_ptr<ports::output::ITransactionLedger> ledger =
                storageInjector.template create<std::shared_ptr<ports::output::ITransactionLedger>>();
            std::shared_ptr<ports::output::IReservationRepository> reservations =
                storageInjector.template create<std::shared_ptr<ports::output::IReservationRepository>>();
            std::shared_ptr<ports::output::IInventoryStore> rawStore =
                storageInjector.template create<std::shared_ptr<ports::output::IInventoryStore>>();

            // Кэш поверх авторитетного хранилища
            auto cachedStore = std::make_shared<adapters::secondary::CachedInventoryStore>(
                rawStore, std::make_shared<settings::CacheSettings>());

            // Шаг 3: Основной injector с instance binding для хранилищ и RabbitMQ
            auto injector = di::make_injector(
                di::bind<settings::ReservationSettings>().in(di::singleton),
                di::bind<settings::SweeperSettings>().in(di::singleton),

                di::bind<ports::output::IEventPublisher>().to(rabbitMQAdapter_),
                di::bind<ports::output::IInventoryStore>().to(cachedStore),
                di::bind<ports::output::IReservationRepository>().to(reservations),
                di::bind<ports::output::ITransactionLedger>().to(ledger),

                di::bind<application::InventoryEventEmitter>().in(di::singleton),
                di::bind<ports::input::IReservationService>().to<application::ReservationManager>().in(di::singleton),
                di::bind<ports::input::IDeductionService>().to<application::DeductionService>().in(di::singleton),
                di::bind<ports::input::IInventoryService>().to<application::InventoryService>().in(di::singleton),
                di::bind<application::ExpirationSweeper>().in(di::singleton));

            // Шаг 4: HTTP Handlers
            handlers_[getHandlerKey("GET", "/health")] = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();

            handlers_[getHandlerKey("GET", "/api/v1/stocks/*")] =
                injector.create<std::shared_ptr<adapters::primary::GetStockHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/stocks/batch")] =
                injector.create<std::shared_ptr<adapters::primary::GetStocksBatchHandler>>();
            handlers_[getHandlerKey("PUT", "/api/v1/stocks/*")] =
                injector.create<std::shared_ptr<adapters::primary::UpdateThresholdsHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/low-stock")] =
                injector.create<std::shared_ptr<adapters::primary::GetLowStockHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/adjustments")] =
                injector.create<std::shared_ptr<adapters::primary::AdjustStockHandler>>();

            handlers_[getHandlerKey("POST", "/api/v1/reservations")] =
                injector.create<std::shared_ptr<adapters::primary::CreateReservationHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/reservations/*")] =
                injector.create<std::shared_ptr<adapters::primary::GetReservationsHandler>>();
            handlers_[getHandlerKey("PATCH", "/api/v1/reservations/*")] =
                injector.create<std::shared_ptr<adapters::primary::ExtendReservationHandler>>();
            handlers_[getHandlerKey("DELETE", "/api/v1/reservations/*")] =
                injector.create<std::shared_ptr<adapters::primary::ReleaseReservationHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/deductions")] =
                injector.create<std::shared_ptr<adapters::primary::DeductHandler>>();

            handlers_[getHandlerKey("GET", "/api/v1/ledger")] =
                injector.create<std::shared_ptr<adapters::primary::GetLedgerHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/reconciliation/*")] =
                injector.create<std::shared_ptr<adapters::primary::ReconcileHandler>>();

            // Шаг 5: Фоновый возврат просроченных резервов
            sweeper_ = injector.create<std::shared_ptr<application::ExpirationSweeper>>();
            auto sweeperSettings = injector.create<std::shared_ptr<settings::SweeperSettings>>();
            if (sweeperSettings->isEnabled())
            {
                sweeper_->start();
            }
            else
            {
                std::cout << "[InventoryApp] ExpirationSweeper disabled" << std::endl;
            }

            std::cout << "[InventoryApp] Ready" << std::endl;
        }
    };

} // namespace inventory
