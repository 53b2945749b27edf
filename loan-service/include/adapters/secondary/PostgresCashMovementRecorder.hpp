#pragma once

#include "ports/output/ICashMovementRecorder.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace loans::adapters::secondary {

/**
 * @brief Книга денежных проводок в PostgreSQL
 *
 * Баланс счёта поддерживает триггер на таблице transactions,
 * здесь только вставка и удаление строк.
 */
class PostgresCashMovementRecorder : public ports::output::ICashMovementRecorder {
public:
    explicit PostgresCashMovementRecorder(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresCashMovementRecorder] Connecting to " << settings_->describe() << "..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresCashMovementRecorder] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresCashMovementRecorder] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresCashMovementRecorder() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::optional<domain::CashAccount> getAccount(const std::string& accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                R"(SELECT id::text AS id, tenant_id, name, type,
                          ROUND(balance * 100)::BIGINT AS balance_cents,
                          ROUND(COALESCE(credit_limit, 0) * 100)::BIGINT AS credit_limit_cents
                   FROM accounts WHERE id::text = $1)",
                accountId
            );
            txn.commit();

            if (result.empty()) return std::nullopt;

            const auto& row = result[0];
            domain::CashAccount account;
            account.id = row["id"].as<std::string>();
            account.tenantId = row["tenant_id"].as<std::string>();
            account.name = row["name"].as<std::string>();
            account.type = domain::parseAccountType(row["type"].as<std::string>());
            account.balance = domain::Money::fromCents(row["balance_cents"].as<int64_t>());
            account.creditLimit = domain::Money::fromCents(row["credit_limit_cents"].as<int64_t>());
            return account;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresCashMovementRecorder] getAccount() failed: " << e.what() << std::endl;
            throw;
        }
    }

    domain::FundsCheck checkFunds(const domain::CashAccount& account, const domain::Money& amount) override {
        return account.checkFunds(amount);
    }

    std::string postTransaction(const domain::CashMovement& movement) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                R"(
                    INSERT INTO transactions (tenant_id, account_id, amount, transaction_date,
                                              description, loan_id, loan_payment_id, created_at)
                    VALUES ($1, $2::uuid, $3::numeric / 100, $4::date, $5, $6::uuid, $7::uuid, NOW())
                    RETURNING id::text
                )",
                movement.tenantId,
                movement.accountId,
                movement.amount.cents,
                domain::toIsoString(movement.date),
                movement.description,
                movement.loanId,
                movement.loanPaymentId
            );
            txn.commit();

            auto id = result[0][0].as<std::string>();
            std::cout << "[PostgresCashMovementRecorder] Posted " << movement.amount
                      << " to account " << movement.accountId << " (tx " << id << ")" << std::endl;
            return id;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresCashMovementRecorder] postTransaction() failed: " << e.what() << std::endl;
            throw;
        }
    }

    int removeTransactionsForPayment(const std::string& loanPaymentId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                "DELETE FROM transactions WHERE loan_payment_id::text = $1",
                loanPaymentId
            );
            txn.commit();
            return static_cast<int>(result.affected_rows());

        } catch (const std::exception& e) {
            std::cerr << "[PostgresCashMovementRecorder] removeTransactionsForPayment() failed: "
                      << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;
};

} // namespace loans::adapters::secondary
