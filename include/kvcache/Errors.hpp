#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Иерархия исключений библиотеки
 *
 * - InvalidKeyError: пустой ключ (проверяется до любого I/O)
 * - InvalidArgumentError: некорректные аргументы конструктора / конфигурации
 * - CorruptRecordError: сохранённые байты не декодируются в запись
 * - RemoteError: ошибка соединения или ответа удалённого сервера
 *
 * Ошибки файловой системы (std::filesystem::filesystem_error и т.п.)
 * пробрасываются как есть, без обёрток.
 */

class InvalidKeyError : public std::invalid_argument {
public:
    explicit InvalidKeyError(const std::string& message)
        : std::invalid_argument(message) {}
};

class InvalidArgumentError : public std::invalid_argument {
public:
    explicit InvalidArgumentError(const std::string& message)
        : std::invalid_argument(message) {}
};

class CorruptRecordError : public std::runtime_error {
public:
    explicit CorruptRecordError(const std::string& message)
        : std::runtime_error(message) {}
};

class RemoteError : public std::runtime_error {
public:
    explicit RemoteError(const std::string& message)
        : std::runtime_error(message) {}
};
