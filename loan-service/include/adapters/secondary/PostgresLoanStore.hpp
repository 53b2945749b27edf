#pragma once

#include "ports/output/ILoanStore.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace loans::adapters::secondary {

/**
 * @brief Хранилище займов и платежей в PostgreSQL
 *
 * Суммы лежат в NUMERIC(14,2), наружу отдаются в центах.
 * Остаток долга в таблице loans не хранится.
 */
class PostgresLoanStore : public ports::output::ILoanStore {
public:
    explicit PostgresLoanStore(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresLoanStore] Connecting to " << settings_->describe() << "..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresLoanStore] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLoanStore] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresLoanStore() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    // ============================================
    // LOANS
    // ============================================

    std::optional<domain::Loan> getLoan(const std::string& loanId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                "SELECT " + loanColumns() + " FROM loans WHERE id::text = $1",
                loanId
            );
            txn.commit();

            if (result.empty()) return std::nullopt;
            return rowToLoan(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLoanStore] getLoan() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::Loan> listLoans(const std::string& tenantId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                "SELECT " + loanColumns() + " FROM loans WHERE tenant_id = $1 ORDER BY start_date, created_at",
                tenantId
            );
            txn.commit();

            std::vector<domain::Loan> loans;
            for (const auto& row : result) {
                loans.push_back(rowToLoan(row));
            }
            return loans;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLoanStore] listLoans() failed: " << e.what() << std::endl;
            throw;
        }
    }

    domain::Loan createLoan(const domain::Loan& loan) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                R"(
                    INSERT INTO loans (tenant_id, name, contact_id, kind, principal, annual_interest_rate,
                                       term_months, payment_frequency, start_date,
                                       suggested_payment_amount, notes, created_at)
                    VALUES ($1, $2, $3, $4, $5::numeric / 100, $6, $7, $8, $9::date,
                            $10::numeric / 100, $11, NOW())
                    RETURNING )" + loanColumns(),
                loan.tenantId,
                loan.name,
                loan.contactId,
                domain::toString(loan.kind),
                loan.principal.cents,
                loan.annualInterestRate,
                loan.termMonths,
                frequencyParam(loan),
                domain::toIsoString(loan.startDate),
                suggestedParam(loan),
                loan.notes
            );
            txn.commit();
            return rowToLoan(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLoanStore] createLoan() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Loan> updateLoan(const domain::Loan& loan) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                R"(
                    UPDATE loans SET
                        name = $2,
                        contact_id = $3,
                        kind = $4,
                        principal = $5::numeric / 100,
                        annual_interest_rate = $6,
                        term_months = $7,
                        payment_frequency = $8,
                        start_date = $9::date,
                        suggested_payment_amount = $10::numeric / 100,
                        notes = $11,
                        updated_at = NOW()
                    WHERE id::text = $1
                    RETURNING )" + loanColumns(),
                loan.id,
                loan.name,
                loan.contactId,
                domain::toString(loan.kind),
                loan.principal.cents,
                loan.annualInterestRate,
                loan.termMonths,
                frequencyParam(loan),
                domain::toIsoString(loan.startDate),
                suggestedParam(loan),
                loan.notes
            );
            txn.commit();

            if (result.empty()) return std::nullopt;
            return rowToLoan(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLoanStore] updateLoan() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool deleteLoan(const std::string& loanId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            // loan_payments удаляются каскадом, transactions.loan_id обнуляется
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                "DELETE FROM loans WHERE id::text = $1",
                loanId
            );
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLoanStore] deleteLoan() failed: " << e.what() << std::endl;
            throw;
        }
    }

    // ============================================
    // PAYMENTS
    // ============================================

    std::vector<domain::LoanPayment> listPayments(const std::string& loanId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                "SELECT " + paymentColumns() + " FROM loan_payments WHERE loan_id::text = $1 "
                "ORDER BY payment_date, id",
                loanId
            );
            txn.commit();

            std::vector<domain::LoanPayment> payments;
            for (const auto& row : result) {
                payments.push_back(rowToPayment(row));
            }
            return payments;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLoanStore] listPayments() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::LoanPayment> getPayment(const std::string& paymentId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                "SELECT " + paymentColumns() + " FROM loan_payments WHERE id::text = $1",
                paymentId
            );
            txn.commit();

            if (result.empty()) return std::nullopt;
            return rowToPayment(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLoanStore] getPayment() failed: " << e.what() << std::endl;
            throw;
        }
    }

    domain::LoanPayment createPayment(const domain::LoanPayment& record) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                R"(
                    INSERT INTO loan_payments (loan_id, tenant_id, account_id, payment_date,
                                               total_amount, principal_amount, interest_amount, notes, created_at)
                    VALUES ($1::uuid, $2, $3::uuid, $4::date,
                            $5::numeric / 100, $6::numeric / 100, $7::numeric / 100, $8, NOW())
                    RETURNING )" + paymentColumns(),
                record.loanId,
                record.tenantId,
                record.accountId,
                domain::toIsoString(record.paymentDate),
                record.totalAmount.cents,
                record.principalAmount.cents,
                record.interestAmount.cents,
                record.notes
            );
            txn.commit();
            return rowToPayment(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLoanStore] createPayment() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::LoanPayment> updatePayment(const std::string& paymentId,
                                                     const domain::LoanPaymentUpdate& fields) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                R"(
                    UPDATE loan_payments SET
                        account_id = $2::uuid,
                        payment_date = $3::date,
                        total_amount = $4::numeric / 100,
                        principal_amount = $5::numeric / 100,
                        interest_amount = $6::numeric / 100,
                        notes = $7,
                        updated_at = NOW()
                    WHERE id::text = $1
                    RETURNING )" + paymentColumns(),
                paymentId,
                fields.accountId,
                domain::toIsoString(fields.paymentDate),
                fields.totalAmount.cents,
                fields.principalAmount.cents,
                fields.interestAmount.cents,
                fields.notes
            );
            txn.commit();

            if (result.empty()) return std::nullopt;
            return rowToPayment(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLoanStore] updatePayment() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool deletePayment(const std::string& paymentId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                "DELETE FROM loan_payments WHERE id::text = $1",
                paymentId
            );
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLoanStore] deletePayment() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    static std::string loanColumns() {
        return "id::text AS id, tenant_id, name, contact_id, kind, "
               "ROUND(principal * 100)::BIGINT AS principal_cents, "
               "annual_interest_rate, term_months, payment_frequency, "
               "start_date::text AS start_date, "
               "ROUND(suggested_payment_amount * 100)::BIGINT AS suggested_cents, notes";
    }

    static std::string paymentColumns() {
        return "id::text AS id, loan_id::text AS loan_id, tenant_id, account_id::text AS account_id, "
               "payment_date::text AS payment_date, "
               "ROUND(total_amount * 100)::BIGINT AS total_cents, "
               "ROUND(principal_amount * 100)::BIGINT AS principal_cents, "
               "ROUND(interest_amount * 100)::BIGINT AS interest_cents, notes";
    }

    static std::optional<std::string> frequencyParam(const domain::Loan& loan) {
        if (!loan.paymentFrequency) return std::nullopt;
        return domain::toString(*loan.paymentFrequency);
    }

    static std::optional<int64_t> suggestedParam(const domain::Loan& loan) {
        if (!loan.suggestedPaymentAmount) return std::nullopt;
        return loan.suggestedPaymentAmount->cents;
    }

    static std::optional<std::string> optionalText(const pqxx::field& field) {
        if (field.is_null()) return std::nullopt;
        return field.as<std::string>();
    }

    domain::Loan rowToLoan(const pqxx::row& row) const {
        std::optional<domain::PaymentFrequency> frequency;
        if (!row["payment_frequency"].is_null()) {
            frequency = domain::parsePaymentFrequency(row["payment_frequency"].as<std::string>());
        }

        domain::Loan loan(
            row["id"].as<std::string>(),
            row["tenant_id"].as<std::string>(),
            row["name"].as<std::string>(),
            domain::parseLoanKind(row["kind"].as<std::string>()),
            domain::Money::fromCents(row["principal_cents"].as<int64_t>()),
            row["annual_interest_rate"].as<double>(),
            row["term_months"].as<int>(),
            frequency,
            domain::parseDate(row["start_date"].as<std::string>())
        );
        loan.contactId = optionalText(row["contact_id"]);
        loan.notes = optionalText(row["notes"]);
        if (!row["suggested_cents"].is_null()) {
            loan.suggestedPaymentAmount = domain::Money::fromCents(row["suggested_cents"].as<int64_t>());
        }
        return loan;
    }

    domain::LoanPayment rowToPayment(const pqxx::row& row) const {
        domain::LoanPayment payment;
        payment.id = row["id"].as<std::string>();
        payment.loanId = row["loan_id"].as<std::string>();
        payment.tenantId = row["tenant_id"].as<std::string>();
        payment.accountId = row["account_id"].as<std::string>();
        payment.paymentDate = domain::parseDate(row["payment_date"].as<std::string>());
        payment.totalAmount = domain::Money::fromCents(row["total_cents"].as<int64_t>());
        payment.principalAmount = domain::Money::fromCents(row["principal_cents"].as<int64_t>());
        payment.interestAmount = domain::Money::fromCents(row["interest_cents"].as<int64_t>());
        payment.notes = optionalText(row["notes"]);
        return payment;
    }
};

} // namespace loans::adapters::secondary
