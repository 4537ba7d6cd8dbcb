#pragma once

#include <stdexcept>
#include <string>

/**
 * @file StorageException.hpp
 * @brief Исключение слоя хранения
 */

/**
 * @brief Выбрасывается адаптерами хранилища при любой ошибке записи или чтения
 *
 * Недоступное соединение, нарушение ограничения, ошибка SQL.
 * Прикладной слой перехватывает его и откатывает незавершённую транзакцию.
 */
class StorageException : public std::runtime_error {
public:
    explicit StorageException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Связь потеряна во время COMMIT: транзакция могла и зафиксироваться
 *
 * Откат не гарантирован, состояние нужно перечитать из хранилища.
 */
class StorageOutcomeUnknownException : public StorageException {
public:
    explicit StorageOutcomeUnknownException(const std::string& message)
        : StorageException(message) {}
};
