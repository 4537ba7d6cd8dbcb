#pragma once

#include <string>
#include <stdexcept>

namespace atm::domain {

/**
 * @brief Вид операции по счёту
 */
enum class TransactionKind {
    DEPOSIT,    ///< Внесение наличных, +amount
    WITHDRAWAL  ///< Снятие наличных, -amount
};

inline std::string toString(TransactionKind kind) {
    switch (kind) {
        case TransactionKind::DEPOSIT:    return "DEPOSIT";
        case TransactionKind::WITHDRAWAL: return "WITHDRAWAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Преобразовать строку в TransactionKind
 * @throws std::invalid_argument если строка не распознана
 */
inline TransactionKind parseTransactionKind(const std::string& str) {
    if (str == "DEPOSIT" || str == "deposit")       return TransactionKind::DEPOSIT;
    if (str == "WITHDRAWAL" || str == "withdrawal") return TransactionKind::WITHDRAWAL;
    throw std::invalid_argument("Unknown transaction kind: " + str);
}

} // namespace atm::domain
