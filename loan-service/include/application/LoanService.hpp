#pragma once

#include "ports/input/ILoanService.hpp"
#include "ports/output/ILoanStore.hpp"
#include "ports/output/ICashMovementRecorder.hpp"
#include "application/AmortizationScheduleGenerator.hpp"
#include "application/BalanceProjector.hpp"
#include "application/LoanValidation.hpp"
#include "application/NextPaymentAdvisor.hpp"
#include "application/PaymentAmountCalculator.hpp"
#include "settings/LoanSettings.hpp"
#include "domain/LoanError.hpp"
#include <algorithm>
#include <memory>
#include <iostream>

namespace loans::application {

/**
 * @brief Сервис займов
 *
 * Склеивает чистое расчётное ядро с хранилищем и книгой проводок:
 * - чтение → загрузка займа и всей истории платежей → пересчёт остатка
 * - запись платежа → валидация → проверка средств → сохранение → проводка
 *
 * Остаток долга нигде не хранится, каждое чтение пересчитывает его заново.
 * Атомарность "платёж + проводка" обеспечивается компенсацией: если проводка
 * не прошла, платёж удаляется; если и это не удалось, возвращается PARTIAL.
 */
class LoanService : public ports::input::ILoanService {
public:
    LoanService(
        std::shared_ptr<ports::output::ILoanStore> store,
        std::shared_ptr<ports::output::ICashMovementRecorder> cashRecorder,
        std::shared_ptr<settings::LoanSettings> settings
    ) : store_(std::move(store))
      , cashRecorder_(std::move(cashRecorder))
      , settings_(std::move(settings))
    {
        std::cout << "[LoanService] Created (interest periods/year="
                  << settings_->getInterestPeriodsPerYear() << ")" << std::endl;
    }

    // ============================================
    // ЗАЙМЫ
    // ============================================

    domain::LoanResult createLoan(const domain::LoanRequest& request) override {
        domain::Loan loan;
        try {
            loan = buildLoan(domain::Loan{}, request);
        } catch (const domain::LoanException& e) {
            std::cout << "[LoanService] REJECTED loan: " << e.what() << std::endl;
            return domain::LoanResult::rejected(e.code(), e.what());
        }
        loan.tenantId = request.tenantId;

        // Счёт выдачи проверяем до сохранения займа
        std::optional<domain::CashAccount> account;
        if (request.disbursementAccountId) {
            account = cashRecorder_->getAccount(*request.disbursementAccountId);
            if (!account) {
                return domain::LoanResult::rejected(domain::LoanErrorCode::INVALID_ACCOUNT,
                    "Account not found: " + *request.disbursementAccountId);
            }
            if (loan.kind == domain::LoanKind::RECEIVABLE && settings_->isFundsCheckEnforced()) {
                auto check = cashRecorder_->checkFunds(*account, loan.principal);
                if (!check.hasFunds) {
                    return domain::LoanResult::rejected(domain::LoanErrorCode::INSUFFICIENT_FUNDS,
                        insufficientFundsMessage(*account, check.available));
                }
            }
        }

        domain::Loan created;
        try {
            created = store_->createLoan(loan);
        } catch (const std::exception& e) {
            std::cerr << "[LoanService] Failed to save loan: " << e.what() << std::endl;
            return domain::LoanResult::rejected(domain::LoanErrorCode::PERSISTENCE_FAILURE,
                std::string("Failed to save loan: ") + e.what());
        }

        std::cout << "[LoanService] Created loan " << created.id << " (" << domain::toString(created.kind)
                  << ", principal=" << created.principal << ")" << std::endl;

        if (account) {
            domain::CashMovement movement;
            movement.accountId = account->id;
            movement.tenantId = created.tenantId;
            movement.amount = created.kind == domain::LoanKind::PAYABLE ? created.principal : -created.principal;
            movement.date = created.startDate;
            movement.description = "Loan disbursement: " + created.name;
            movement.loanId = created.id;

            try {
                cashRecorder_->postTransaction(movement);
            } catch (const std::exception& e) {
                std::cerr << "[LoanService] Disbursement not posted for " << created.id << ": " << e.what() << std::endl;
                domain::LoanResult result;
                result.status = domain::OperationStatus::PARTIAL;
                result.errorCode = domain::LoanErrorCode::PERSISTENCE_FAILURE;
                result.message = std::string("Loan saved but disbursement was not posted: ") + e.what();
                result.loan = created;
                return result;
            }
        }

        return domain::LoanResult::completed(created, "Loan added successfully");
    }

    /**
     * @brief Административная правка займа
     *
     * Тело займа не сверяется с уже внесёнными платежами: если новое тело
     * меньше погашенного, остаток просто обнуляется при пересчёте.
     */
    domain::LoanResult updateLoan(const std::string& loanId, const domain::LoanRequest& request) override {
        auto existing = store_->getLoan(loanId);
        if (!existing) {
            return domain::LoanResult::rejected(domain::LoanErrorCode::NOT_FOUND, "Loan not found: " + loanId);
        }

        domain::Loan loan;
        try {
            loan = buildLoan(*existing, request);
        } catch (const domain::LoanException& e) {
            std::cout << "[LoanService] REJECTED loan update " << loanId << ": " << e.what() << std::endl;
            return domain::LoanResult::rejected(e.code(), e.what());
        }

        auto projection = projector_.project(loan, store_->listPayments(loanId));
        if (loan.principal < projection.totalPrincipalPaid) {
            std::cout << "[LoanService] WARNING: loan " << loanId << " principal " << loan.principal
                      << " is below principal already paid " << projection.totalPrincipalPaid << std::endl;
        }

        std::optional<domain::Loan> updated;
        try {
            updated = store_->updateLoan(loan);
        } catch (const std::exception& e) {
            std::cerr << "[LoanService] Failed to update loan " << loanId << ": " << e.what() << std::endl;
            return domain::LoanResult::rejected(domain::LoanErrorCode::PERSISTENCE_FAILURE,
                std::string("Failed to update loan: ") + e.what());
        }
        if (!updated) {
            return domain::LoanResult::rejected(domain::LoanErrorCode::NOT_FOUND, "Loan not found: " + loanId);
        }

        std::cout << "[LoanService] Updated loan " << loanId << std::endl;
        return domain::LoanResult::completed(*updated, "Loan updated");
    }

    domain::LoanResult deleteLoan(const std::string& loanId) override {
        auto existing = store_->getLoan(loanId);
        if (!existing) {
            return domain::LoanResult::rejected(domain::LoanErrorCode::NOT_FOUND, "Loan not found: " + loanId);
        }
        const size_t paymentCount = store_->listPayments(loanId).size();

        bool deleted = false;
        try {
            deleted = store_->deleteLoan(loanId);
        } catch (const std::exception& e) {
            std::cerr << "[LoanService] Failed to delete loan " << loanId << ": " << e.what() << std::endl;
            return domain::LoanResult::rejected(domain::LoanErrorCode::PERSISTENCE_FAILURE,
                std::string("Failed to delete loan: ") + e.what());
        }
        if (!deleted) {
            return domain::LoanResult::rejected(domain::LoanErrorCode::NOT_FOUND, "Loan not found: " + loanId);
        }

        std::cout << "[LoanService] Deleted loan " << loanId << " with " << paymentCount
                  << " payment(s); cash movements kept" << std::endl;
        return domain::LoanResult::completed(*existing, "Loan deleted successfully");
    }

    std::optional<domain::LoanOverview> getLoan(const std::string& loanId) override {
        auto loan = store_->getLoan(loanId);
        if (!loan) {
            std::cout << "[LoanService] Loan not found: " << loanId << std::endl;
            return std::nullopt;
        }
        return overview(*loan);
    }

    std::vector<domain::LoanOverview> listLoans(const std::string& tenantId) override {
        std::vector<domain::LoanOverview> result;
        for (const auto& loan : store_->listLoans(tenantId)) {
            result.push_back(overview(loan));
        }
        return result;
    }

    std::optional<std::vector<domain::AmortizationScheduleEntry>> getSchedule(const std::string& loanId) override {
        auto loan = store_->getLoan(loanId);
        if (!loan) {
            return std::nullopt;
        }
        if (!loan->paymentFrequency) {
            return std::vector<domain::AmortizationScheduleEntry>{};
        }
        return scheduleGenerator_.generate(loan->principal, loan->annualInterestRate, loan->termMonths,
                                           loan->startDate, *loan->paymentFrequency);
    }

    // ============================================
    // ПОДСКАЗКИ ПО ПЛАТЕЖАМ
    // ============================================

    std::optional<domain::PaymentSplit> suggestNextPayment(const std::string& loanId) override {
        auto loan = store_->getLoan(loanId);
        if (!loan) {
            return std::nullopt;
        }
        return advisor_.suggestNextPayment(*loan, store_->listPayments(loanId));
    }

    std::optional<domain::PaymentSplit> previewAllocation(const std::string& loanId,
                                                          const domain::Money& total) override {
        auto loan = store_->getLoan(loanId);
        if (!loan) {
            return std::nullopt;
        }
        return advisor_.previewAllocation(*loan, store_->listPayments(loanId), total,
                                          settings_->getInterestPeriodsPerYear());
    }

    // ============================================
    // ПЛАТЕЖИ
    // ============================================

    domain::PaymentResult recordPayment(const domain::PaymentRequest& request) override {
        auto loan = store_->getLoan(request.loanId);
        if (!loan) {
            return domain::PaymentResult::rejected(domain::LoanErrorCode::NOT_FOUND,
                "Loan not found: " + request.loanId);
        }

        auto payments = store_->listPayments(loan->id);

        domain::PaymentSplit split;
        std::optional<domain::CashAccount> account;
        try {
            split = resolveSplit(*loan, payments, request);
            account = requireAccount(request.accountId);
        } catch (const domain::LoanException& e) {
            std::cout << "[LoanService] REJECTED payment for " << loan->id << ": " << e.what() << std::endl;
            return domain::PaymentResult::rejected(e.code(), e.what());
        }

        if (requiresFundsCheck(*loan)) {
            auto check = cashRecorder_->checkFunds(*account, request.totalAmount);
            if (!check.hasFunds) {
                std::cout << "[LoanService] REJECTED payment for " << loan->id << ": insufficient funds" << std::endl;
                auto result = domain::PaymentResult::rejected(domain::LoanErrorCode::INSUFFICIENT_FUNDS,
                    insufficientFundsMessage(*account, check.available));
                result.available = check.available;
                return result;
            }
        }

        domain::LoanPayment record;
        record.loanId = loan->id;
        record.tenantId = loan->tenantId;
        record.accountId = request.accountId;
        record.paymentDate = request.paymentDate;
        record.totalAmount = request.totalAmount;
        record.principalAmount = split.principal;
        record.interestAmount = split.interest;
        record.notes = request.notes;

        domain::LoanPayment saved;
        try {
            saved = store_->createPayment(record);
        } catch (const std::exception& e) {
            std::cerr << "[LoanService] Failed to save payment: " << e.what() << std::endl;
            return domain::PaymentResult::rejected(domain::LoanErrorCode::PERSISTENCE_FAILURE,
                std::string("Failed to record payment: ") + e.what());
        }

        try {
            cashRecorder_->postTransaction(paymentMovement(*loan, saved));
        } catch (const std::exception& e) {
            std::cerr << "[LoanService] Cash movement failed for payment " << saved.id << ": " << e.what() << std::endl;
            return rollbackRecordedPayment(saved, e.what());
        }

        std::cout << "[LoanService] Recorded payment " << saved.id << " for loan " << loan->id
                  << ": total=" << saved.totalAmount << " principal=" << saved.principalAmount
                  << " interest=" << saved.interestAmount << std::endl;

        return domain::PaymentResult::completed(saved, "Payment recorded");
    }

    domain::PaymentResult updatePayment(const std::string& paymentId,
                                        const domain::PaymentRequest& request) override {
        auto existing = store_->getPayment(paymentId);
        if (!existing) {
            return domain::PaymentResult::rejected(domain::LoanErrorCode::NOT_FOUND,
                "Payment not found: " + paymentId);
        }
        auto loan = store_->getLoan(existing->loanId);
        if (!loan) {
            return domain::PaymentResult::rejected(domain::LoanErrorCode::NOT_FOUND,
                "Loan not found: " + existing->loanId);
        }

        // Автоматическая разбивка считается против остатка без редактируемого платежа
        auto others = store_->listPayments(loan->id);
        others.erase(std::remove_if(others.begin(), others.end(),
            [&paymentId](const domain::LoanPayment& p) { return p.id == paymentId; }), others.end());

        domain::PaymentSplit split;
        std::optional<domain::CashAccount> account;
        try {
            split = resolveSplit(*loan, others, request);
            account = requireAccount(request.accountId);
        } catch (const domain::LoanException& e) {
            std::cout << "[LoanService] REJECTED payment update " << paymentId << ": " << e.what() << std::endl;
            return domain::PaymentResult::rejected(e.code(), e.what());
        }

        if (requiresFundsCheck(*loan)) {
            // Исходный платёж будет сторнирован, его сумма снова доступна на том же счёте
            domain::CashAccount effective = *account;
            if (existing->accountId == account->id) {
                effective.balance += existing->totalAmount;
            }
            auto check = cashRecorder_->checkFunds(effective, request.totalAmount);
            if (!check.hasFunds) {
                auto result = domain::PaymentResult::rejected(domain::LoanErrorCode::INSUFFICIENT_FUNDS,
                    insufficientFundsMessage(*account, check.available));
                result.available = check.available;
                return result;
            }
        }

        domain::LoanPaymentUpdate fields;
        fields.accountId = request.accountId;
        fields.paymentDate = request.paymentDate;
        fields.totalAmount = request.totalAmount;
        fields.principalAmount = split.principal;
        fields.interestAmount = split.interest;
        fields.notes = request.notes;

        std::optional<domain::LoanPayment> updated;
        try {
            updated = store_->updatePayment(paymentId, fields);
        } catch (const std::exception& e) {
            std::cerr << "[LoanService] Failed to update payment " << paymentId << ": " << e.what() << std::endl;
            return domain::PaymentResult::rejected(domain::LoanErrorCode::PERSISTENCE_FAILURE,
                std::string("Failed to update payment: ") + e.what());
        }
        if (!updated) {
            return domain::PaymentResult::rejected(domain::LoanErrorCode::NOT_FOUND,
                "Payment not found: " + paymentId);
        }

        try {
            cashRecorder_->removeTransactionsForPayment(paymentId);
            cashRecorder_->postTransaction(paymentMovement(*loan, *updated));
        } catch (const std::exception& e) {
            std::cerr << "[LoanService] Cash movement failed for payment " << paymentId << ": " << e.what() << std::endl;
            return rollbackUpdatedPayment(*loan, *existing, *updated, e.what());
        }

        std::cout << "[LoanService] Updated payment " << paymentId << " for loan " << loan->id << std::endl;
        return domain::PaymentResult::completed(*updated, "Payment updated");
    }

    domain::PaymentResult deletePayment(const std::string& paymentId) override {
        auto existing = store_->getPayment(paymentId);
        if (!existing) {
            return domain::PaymentResult::rejected(domain::LoanErrorCode::NOT_FOUND,
                "Payment not found: " + paymentId);
        }

        // Сначала проводки (они ссылаются на платёж), затем сам платёж
        try {
            int removed = cashRecorder_->removeTransactionsForPayment(paymentId);
            std::cout << "[LoanService] Removed " << removed << " transaction(s) of payment " << paymentId << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[LoanService] Failed to remove transactions of " << paymentId << ": " << e.what() << std::endl;
            return domain::PaymentResult::rejected(domain::LoanErrorCode::PERSISTENCE_FAILURE,
                std::string("Failed to delete payment: ") + e.what());
        }

        bool deleted = false;
        std::string error = "payment row was not deleted";
        try {
            deleted = store_->deletePayment(paymentId);
        } catch (const std::exception& e) {
            error = e.what();
        }

        if (!deleted) {
            std::cerr << "[LoanService] PARTIAL delete of payment " << paymentId << ": " << error << std::endl;
            domain::PaymentResult result;
            result.status = domain::OperationStatus::PARTIAL;
            result.errorCode = domain::LoanErrorCode::PERSISTENCE_FAILURE;
            result.message = "Transactions removed but payment was not deleted: " + error;
            result.payment = existing;
            return result;
        }

        std::cout << "[LoanService] Deleted payment " << paymentId << std::endl;
        return domain::PaymentResult::completed(*existing, "Payment deleted");
    }

private:
    std::shared_ptr<ports::output::ILoanStore> store_;
    std::shared_ptr<ports::output::ICashMovementRecorder> cashRecorder_;
    std::shared_ptr<settings::LoanSettings> settings_;

    PaymentAmountCalculator calculator_;
    AmortizationScheduleGenerator scheduleGenerator_;
    BalanceProjector projector_;
    NextPaymentAdvisor advisor_;

    domain::LoanOverview overview(const domain::Loan& loan) const {
        return domain::LoanOverview{loan, projector_.project(loan, store_->listPayments(loan.id))};
    }

    /**
     * @brief Применить запрос к займу, проверить условия, пересчитать плановый платёж
     */
    domain::Loan buildLoan(domain::Loan loan, const domain::LoanRequest& request) const {
        validation::validateLoanTerms(request.principal, request.annualInterestRate, request.termMonths);

        loan.name = request.name;
        loan.contactId = request.contactId;
        loan.kind = request.kind;
        loan.principal = request.principal;
        loan.annualInterestRate = request.annualInterestRate;
        loan.termMonths = request.termMonths;
        loan.paymentFrequency = request.paymentFrequency;
        loan.startDate = request.startDate;
        loan.notes = request.notes;

        if (loan.paymentFrequency) {
            loan.suggestedPaymentAmount = calculator_.compute(loan.principal, loan.annualInterestRate,
                                                              loan.termMonths, *loan.paymentFrequency);
        } else {
            loan.suggestedPaymentAmount.reset();
        }
        return loan;
    }

    /**
     * @brief Разбивка платежа: заданная пользователем или автоматическая
     * @throws domain::LoanException INVALID_PAYMENT
     */
    domain::PaymentSplit resolveSplit(const domain::Loan& loan,
                                      const std::vector<domain::LoanPayment>& payments,
                                      const domain::PaymentRequest& request) const {
        validation::validatePaymentAmount(request.totalAmount);

        if (request.customSplit) {
            const domain::Money sum = request.customSplit->total();
            const domain::Money diff = sum > request.totalAmount ? sum - request.totalAmount
                                                                 : request.totalAmount - sum;
            if (diff > domain::Money::fromCents(1)) {
                throw domain::LoanException(domain::LoanErrorCode::INVALID_PAYMENT,
                    "Principal " + request.customSplit->principal.toString() + " + interest "
                    + request.customSplit->interest.toString() + " does not match total "
                    + request.totalAmount.toString());
            }
            return *request.customSplit;
        }

        return advisor_.previewAllocation(loan, payments, request.totalAmount,
                                          settings_->getInterestPeriodsPerYear());
    }

    domain::CashAccount requireAccount(const std::string& accountId) const {
        if (accountId.empty()) {
            throw domain::LoanException(domain::LoanErrorCode::INVALID_ACCOUNT, "Please select an account");
        }
        auto account = cashRecorder_->getAccount(accountId);
        if (!account) {
            throw domain::LoanException(domain::LoanErrorCode::INVALID_ACCOUNT, "Account not found: " + accountId);
        }
        return *account;
    }

    /**
     * @brief Списание идёт только по займам, которые мы выплачиваем
     */
    bool requiresFundsCheck(const domain::Loan& loan) const {
        return loan.kind == domain::LoanKind::PAYABLE && settings_->isFundsCheckEnforced();
    }

    static std::string insufficientFundsMessage(const domain::CashAccount& account, const domain::Money& available) {
        std::string label = account.type == domain::AccountType::CREDIT ? "Available credit" : "Available";
        return "Insufficient funds in " + account.name + ". " + label + ": " + available.toString();
    }

    static domain::CashMovement paymentMovement(const domain::Loan& loan, const domain::LoanPayment& payment) {
        domain::CashMovement movement;
        movement.accountId = payment.accountId;
        movement.tenantId = loan.tenantId;
        movement.amount = loan.kind == domain::LoanKind::PAYABLE ? -payment.totalAmount : payment.totalAmount;
        movement.date = payment.paymentDate;
        movement.description = "Loan payment: " + loan.name;
        movement.loanId = loan.id;
        movement.loanPaymentId = payment.id;
        return movement;
    }

    domain::PaymentResult rollbackRecordedPayment(const domain::LoanPayment& saved, const std::string& cause) {
        bool rolledBack = false;
        try {
            rolledBack = store_->deletePayment(saved.id);
        } catch (const std::exception& e) {
            std::cerr << "[LoanService] Rollback of payment " << saved.id << " failed: " << e.what() << std::endl;
        }

        if (rolledBack) {
            std::cout << "[LoanService] Rolled back payment " << saved.id << std::endl;
            return domain::PaymentResult::rejected(domain::LoanErrorCode::PERSISTENCE_FAILURE,
                "Failed to post cash movement: " + cause);
        }

        domain::PaymentResult result;
        result.status = domain::OperationStatus::PARTIAL;
        result.errorCode = domain::LoanErrorCode::PERSISTENCE_FAILURE;
        result.message = "Payment saved but cash movement was not posted: " + cause;
        result.payment = saved;
        return result;
    }

    domain::PaymentResult rollbackUpdatedPayment(const domain::Loan& loan,
                                                 const domain::LoanPayment& original,
                                                 const domain::LoanPayment& updated,
                                                 const std::string& cause) {
        domain::LoanPaymentUpdate restore;
        restore.accountId = original.accountId;
        restore.paymentDate = original.paymentDate;
        restore.totalAmount = original.totalAmount;
        restore.principalAmount = original.principalAmount;
        restore.interestAmount = original.interestAmount;
        restore.notes = original.notes;

        bool restored = false;
        try {
            auto reverted = store_->updatePayment(original.id, restore);
            if (reverted) {
                cashRecorder_->removeTransactionsForPayment(original.id);
                cashRecorder_->postTransaction(paymentMovement(loan, *reverted));
                restored = true;
            }
        } catch (const std::exception& e) {
            std::cerr << "[LoanService] Rollback of payment " << original.id << " failed: " << e.what() << std::endl;
        }

        if (restored) {
            std::cout << "[LoanService] Restored payment " << original.id << std::endl;
            return domain::PaymentResult::rejected(domain::LoanErrorCode::PERSISTENCE_FAILURE,
                "Failed to post cash movement: " + cause);
        }

        domain::PaymentResult result;
        result.status = domain::OperationStatus::PARTIAL;
        result.errorCode = domain::LoanErrorCode::PERSISTENCE_FAILURE;
        result.message = "Payment updated but cash movement was not posted: " + cause;
        result.payment = updated;
        return result;
    }
};

} // namespace loans::application
