#pragma once

#include <string>

namespace loans::domain {

/**
 * @brief Итог изменяющей операции (платёж, создание займа)
 *
 * PARTIAL — запись в хранилище прошла, а проводка по счёту нет,
 * и откатить запись не удалось. Вызывающий должен сверить данные.
 */
enum class OperationStatus {
    COMPLETED,
    REJECTED,
    PARTIAL
};

inline std::string toString(OperationStatus status) {
    switch (status) {
        case OperationStatus::COMPLETED: return "completed";
        case OperationStatus::REJECTED:  return "rejected";
        case OperationStatus::PARTIAL:   return "partial";
    }
    return "unknown";
}

} // namespace loans::domain
