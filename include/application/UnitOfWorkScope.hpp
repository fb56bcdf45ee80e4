#pragma once

#include "ports/output/IUnitOfWork.hpp"
#include <iostream>
#include <exception>

namespace payment::application {

/**
 * @brief RAII-обёртка над IUnitOfWork: откат, если commit() не был вызван
 */
class UnitOfWorkScope {
public:
    explicit UnitOfWorkScope(ports::output::IUnitOfWork& unitOfWork)
        : unitOfWork_(unitOfWork)
    {
        unitOfWork_.begin();
    }

    ~UnitOfWorkScope() {
        if (!finished_) {
            try {
                unitOfWork_.rollback();
            } catch (const std::exception& e) {
                std::cerr << "[UnitOfWorkScope] Rollback failed: " << e.what() << std::endl;
            }
        }
    }

    UnitOfWorkScope(const UnitOfWorkScope&) = delete;
    UnitOfWorkScope& operator=(const UnitOfWorkScope&) = delete;

    void commit() {
        unitOfWork_.commit();
        finished_ = true;
    }

    void rollback() {
        finished_ = true;
        unitOfWork_.rollback();
    }

private:
    ports::output::IUnitOfWork& unitOfWork_;
    bool finished_ = false;
};

} // namespace payment::application
