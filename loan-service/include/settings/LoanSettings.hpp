#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace loans::settings {

/**
 * @brief Настройки расчётов по займам
 *
 * LOANS_INTEREST_PERIODS_PER_YEAR — сколько периодов начисления в году
 * использовать при автоматической разбивке внепланового платежа
 * (по умолчанию 12: проценты за месяц при любой периодичности платежей).
 *
 * LOANS_ENFORCE_FUNDS_CHECK — проверять остаток счёта перед списанием.
 */
class LoanSettings {
public:
    LoanSettings() {
        if (const char* value = std::getenv("LOANS_INTEREST_PERIODS_PER_YEAR")) {
            interestPeriodsPerYear_ = parsePeriods(value);
        }
        if (const char* value = std::getenv("LOANS_ENFORCE_FUNDS_CHECK")) {
            std::string v(value);
            enforceFundsCheck_ = !(v == "false" || v == "0" || v == "no");
        }
    }

    /**
     * @brief Явные значения (для тестов), окружение не учитывается
     */
    static LoanSettings of(int interestPeriodsPerYear, bool enforceFundsCheck) {
        if (interestPeriodsPerYear < 1 || interestPeriodsPerYear > 365) {
            throw std::invalid_argument("interestPeriodsPerYear must be within [1, 365]");
        }
        return LoanSettings(interestPeriodsPerYear, enforceFundsCheck);
    }

    int getInterestPeriodsPerYear() const { return interestPeriodsPerYear_; }
    bool isFundsCheckEnforced() const { return enforceFundsCheck_; }

private:
    LoanSettings(int interestPeriodsPerYear, bool enforceFundsCheck)
        : interestPeriodsPerYear_(interestPeriodsPerYear)
        , enforceFundsCheck_(enforceFundsCheck)
    {}

    int interestPeriodsPerYear_ = 12;
    bool enforceFundsCheck_ = true;

    static int parsePeriods(const std::string& value) {
        int periods = 0;
        try {
            periods = std::stoi(value);
        } catch (const std::exception&) {
            throw std::invalid_argument("LOANS_INTEREST_PERIODS_PER_YEAR is not a number: " + value);
        }
        if (periods < 1 || periods > 365) {
            throw std::invalid_argument("LOANS_INTEREST_PERIODS_PER_YEAR must be within [1, 365]: " + value);
        }
        return periods;
    }
};

} // namespace loans::settings
