#pragma once

#include <string>

namespace loans::domain {

/**
 * @brief Статус займа (вычисляется из остатка, в БД не хранится)
 */
enum class LoanStatus {
    ACTIVE,
    PAID_OFF
};

inline std::string toString(LoanStatus status) {
    switch (status) {
        case LoanStatus::ACTIVE:   return "active";
        case LoanStatus::PAID_OFF: return "paid_off";
    }
    return "unknown";
}

} // namespace loans::domain
