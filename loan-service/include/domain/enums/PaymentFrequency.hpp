#pragma once

#include <string>
#include <stdexcept>

namespace loans::domain {

/**
 * @brief Периодичность платежей по займу
 */
enum class PaymentFrequency {
    WEEKLY,
    BIWEEKLY,
    MONTHLY,
    QUARTERLY,
    ANNUALLY
};

/**
 * @brief Количество периодов в году: 52, 26, 12, 4, 1
 */
inline int periodsPerYear(PaymentFrequency frequency) {
    switch (frequency) {
        case PaymentFrequency::WEEKLY:    return 52;
        case PaymentFrequency::BIWEEKLY:  return 26;
        case PaymentFrequency::MONTHLY:   return 12;
        case PaymentFrequency::QUARTERLY: return 4;
        case PaymentFrequency::ANNUALLY:  return 1;
    }
    throw std::invalid_argument("Unknown payment frequency");
}

inline std::string toString(PaymentFrequency frequency) {
    switch (frequency) {
        case PaymentFrequency::WEEKLY:    return "weekly";
        case PaymentFrequency::BIWEEKLY:  return "biweekly";
        case PaymentFrequency::MONTHLY:   return "monthly";
        case PaymentFrequency::QUARTERLY: return "quarterly";
        case PaymentFrequency::ANNUALLY:  return "annually";
    }
    return "unknown";
}

/**
 * @brief Название для отображения ("Bi-weekly" и т.п.)
 */
inline std::string displayName(PaymentFrequency frequency) {
    switch (frequency) {
        case PaymentFrequency::WEEKLY:    return "Weekly";
        case PaymentFrequency::BIWEEKLY:  return "Bi-weekly";
        case PaymentFrequency::MONTHLY:   return "Monthly";
        case PaymentFrequency::QUARTERLY: return "Quarterly";
        case PaymentFrequency::ANNUALLY:  return "Annually";
    }
    return "Unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline PaymentFrequency parsePaymentFrequency(const std::string& str) {
    if (str == "weekly" || str == "WEEKLY")       return PaymentFrequency::WEEKLY;
    if (str == "biweekly" || str == "BIWEEKLY")   return PaymentFrequency::BIWEEKLY;
    if (str == "monthly" || str == "MONTHLY")     return PaymentFrequency::MONTHLY;
    if (str == "quarterly" || str == "QUARTERLY") return PaymentFrequency::QUARTERLY;
    if (str == "annually" || str == "ANNUALLY")   return PaymentFrequency::ANNUALLY;
    throw std::invalid_argument("Unknown payment frequency: " + str);
}

} // namespace loans::domain
