#pragma once

#include "Loan.hpp"
#include "BalanceProjection.hpp"

namespace loans::domain {

/**
 * @brief Заём вместе с актуальными (пересчитанными) цифрами
 */
struct LoanOverview {
    Loan loan;
    BalanceProjection projection;
};

} // namespace loans::domain
