#pragma once

#include <kvcache/Errors.hpp>
#include <kvcache/storage/KeyDigest.hpp>
#include <cerrno>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/types.h>
#include <unistd.h>

/**
 * @brief Владелец файлового дескриптора (close в деструкторе)
 *
 * Блокировка flock снимается вместе с закрытием дескриптора,
 * поэтому эксклюзивная запись освобождается на любом пути выхода.
 */
class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}

    ~FileDescriptor() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    bool valid() const { return fd_ >= 0; }
    int get() const { return fd_; }

private:
    int fd_;
};

/**
 * @brief Ошибка удаления отдельного файла при очистке
 */
struct IoFailure {
    std::filesystem::path path;
    std::error_code error;
};

/**
 * @brief Каталог с файлами записей
 *
 * Отвечает за всё, что касается диска:
 * - путь к файлу ключа: root / md5(key) + extension
 * - чтение файла целиком
 * - запись файла целиком под эксклюзивной блокировкой
 * - удаление файла, рекурсивная очистка, очистка по расширению
 *
 * Корневой каталог создаётся (вместе с родителями) в конструкторе.
 * Ошибка создания пробрасывается как std::filesystem::filesystem_error.
 */
class RecordDirectory {
public:
    explicit RecordDirectory(std::filesystem::path root)
        : root_(std::move(root))
    {
        if (root_.empty()) {
            throw InvalidArgumentError("Storage root cannot be empty");
        }
        recreate();
    }

    const std::filesystem::path& root() const {
        return root_;
    }

    /**
     * @brief Путь к файлу записи для ключа
     */
    std::filesystem::path locate(const std::string& key,
                                 const std::string& extension) const {
        return root_ / (keyDigest(key) + extension);
    }

    bool exists(const std::filesystem::path& path) const {
        std::error_code ec;
        return std::filesystem::is_regular_file(path, ec);
    }

    /**
     * @brief Прочитать файл целиком
     * @throws std::runtime_error если файл не открылся или не дочитался
     */
    std::vector<uint8_t> read(const std::filesystem::path& path) const {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw std::runtime_error("Failed to open file for reading: " + path.string());
        }

        std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                                  std::istreambuf_iterator<char>());
        if (file.bad()) {
            throw std::runtime_error("Failed to read file: " + path.string());
        }
        return data;
    }

    /**
     * @brief Записать файл целиком под flock(LOCK_EX)
     * @return Пустой error_code, если записаны все байты
     *
     * Файл открывается без O_TRUNC и обрезается только после
     * получения блокировки: конкурирующий писатель не обрежет
     * файл посреди чужой записи.
     */
    std::error_code writeExclusive(const std::filesystem::path& path,
                                   const std::vector<uint8_t>& data) const {
        FileDescriptor fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644));
        if (!fd.valid()) {
            return lastError();
        }

        while (::flock(fd.get(), LOCK_EX) != 0) {
            if (errno != EINTR) {
                return lastError();
            }
        }

        if (::ftruncate(fd.get(), 0) != 0) {
            return lastError();
        }

        size_t written = 0;
        while (written < data.size()) {
            ssize_t n = ::write(fd.get(), data.data() + written, data.size() - written);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return lastError();
            }
            written += static_cast<size_t>(n);
        }
        return {};
    }

    /**
     * @brief Удалить один файл
     * @return Пустой error_code при успехе
     */
    std::error_code remove(const std::filesystem::path& path) const {
        std::error_code ec;
        if (!std::filesystem::remove(path, ec) && !ec) {
            ec = std::make_error_code(std::errc::no_such_file_or_directory);
        }
        return ec;
    }

    /**
     * @brief Удалить всё содержимое корня рекурсивно и сам корень
     * @return Список файлов, которые не удалось удалить
     *
     * Обход в прямом порядке, удаление в обратном: потомки удаляются
     * раньше родителей, и каталоги к моменту удаления уже пусты.
     */
    std::vector<IoFailure> removeTree() const {
        std::vector<IoFailure> failures;
        std::vector<std::filesystem::path> entries;

        std::error_code ec;
        for (std::filesystem::recursive_directory_iterator it(root_, ec), end;
             !ec && it != end; it.increment(ec)) {
            entries.push_back(it->path());
        }
        if (ec) {
            failures.push_back({root_, ec});
        }

        for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
            std::error_code removeEc;
            std::filesystem::remove(*it, removeEc);
            if (removeEc) {
                failures.push_back({*it, removeEc});
            }
        }

        std::error_code rootEc;
        std::filesystem::remove(root_, rootEc);
        if (rootEc) {
            failures.push_back({root_, rootEc});
        }
        return failures;
    }

    /**
     * @brief Удалить файлы с расширением extension непосредственно в корне
     * @return Список файлов, которые не удалось удалить
     */
    std::vector<IoFailure> removeFilesWithExtension(const std::string& extension) const {
        std::vector<IoFailure> failures;
        for (const auto& path : listFiles(extension, failures)) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec) {
                failures.push_back({path, ec});
            }
        }
        return failures;
    }

    /**
     * @brief Файлы записей в корне (имя из 32 hex-символов + extension)
     */
    std::vector<std::filesystem::path> listRecordFiles(const std::string& extension) const {
        std::vector<IoFailure> ignored;
        std::vector<std::filesystem::path> result;
        for (const auto& path : listFiles(extension, ignored)) {
            if (isDigestName(path.stem().string())) {
                result.push_back(path);
            }
        }
        return result;
    }

    /**
     * @brief Создать корень заново (после очистки)
     * @throws std::filesystem::filesystem_error
     */
    void recreate() const {
        std::filesystem::create_directories(root_);
    }

private:
    static std::error_code lastError() {
        return std::error_code(errno, std::generic_category());
    }

    static bool isDigestName(const std::string& name) {
        if (name.size() != 32) {
            return false;
        }
        for (char c : name) {
            bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
            if (!hex) {
                return false;
            }
        }
        return true;
    }

    std::vector<std::filesystem::path> listFiles(const std::string& extension,
                                                 std::vector<IoFailure>& failures) const {
        std::vector<std::filesystem::path> result;
        std::error_code ec;
        for (std::filesystem::directory_iterator it(root_, ec), end;
             !ec && it != end; it.increment(ec)) {
            std::error_code typeEc;
            if (it->is_regular_file(typeEc) &&
                it->path().extension().string() == extension) {
                result.push_back(it->path());
            }
        }
        if (ec) {
            failures.push_back({root_, ec});
        }
        return result;
    }

    std::filesystem::path root_;
};
