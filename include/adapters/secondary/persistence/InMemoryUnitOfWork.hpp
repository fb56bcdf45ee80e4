#pragma once

#include "ports/output/IUnitOfWork.hpp"
#include "adapters/secondary/persistence/InMemoryOrderStore.hpp"
#include "adapters/secondary/persistence/InMemoryTransactionLedger.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace payment::adapters::secondary {

/**
 * @brief Единица работы над in-memory хранилищами
 *
 * begin() захватывает мьютекс и снимает снимок обоих хранилищ,
 * rollback() восстанавливает снимок. Мьютекс отпускается в commit()/rollback().
 */
class InMemoryUnitOfWork : public ports::output::IUnitOfWork {
public:
    InMemoryUnitOfWork(
        std::shared_ptr<InMemoryOrderStore> orderStore,
        std::shared_ptr<InMemoryTransactionLedger> ledger
    ) : orderStore_(std::move(orderStore))
      , ledger_(std::move(ledger))
    {}

    void begin() override {
        mutex_.lock();
        orderSnapshot_ = orderStore_->snapshot();
        ledgerSnapshot_ = ledger_->snapshot();
    }

    void commit() override {
        if (!orderSnapshot_) {
            throw std::logic_error("InMemoryUnitOfWork: commit() without begin()");
        }
        orderSnapshot_.reset();
        ledgerSnapshot_.reset();
        ++commits_;
        mutex_.unlock();
    }

    void rollback() override {
        if (!orderSnapshot_) {
            throw std::logic_error("InMemoryUnitOfWork: rollback() without begin()");
        }
        orderStore_->restore(std::move(*orderSnapshot_));
        ledger_->restore(std::move(*ledgerSnapshot_));
        orderSnapshot_.reset();
        ledgerSnapshot_.reset();
        ++rollbacks_;
        mutex_.unlock();
    }

    int commitCount() const { return commits_; }
    int rollbackCount() const { return rollbacks_; }

private:
    std::shared_ptr<InMemoryOrderStore> orderStore_;
    std::shared_ptr<InMemoryTransactionLedger> ledger_;
    std::mutex mutex_;
    std::optional<InMemoryOrderStore::State> orderSnapshot_;
    std::optional<InMemoryTransactionLedger::State> ledgerSnapshot_;
    int commits_ = 0;
    int rollbacks_ = 0;
};

} // namespace payment::adapters::secondary
