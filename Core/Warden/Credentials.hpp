#pragma once

// Credentials.hpp - файл учётных данных туннеля: две строки (логин, пароль), режим 0600.
// Логин и пароль не логируются и не хранятся в Settings вместе с прочим конфигом.

#include <optional>
#include <string>

struct Credentials
{
    std::string username;
    std::string password;

    Credentials() = default;
    Credentials(std::string user, std::string pass);
    ~Credentials();

    Credentials(const Credentials&)            = delete;
    Credentials& operator=(const Credentials&) = delete;
    Credentials(Credentials&&) noexcept;
    Credentials& operator=(Credentials&&) noexcept;

    // USER / PASS из окружения; nullopt, если не заданы обе.
    static std::optional<Credentials> FromEnvironment();
};

namespace CredentialsFile
{
    /**
     * @brief Перезаписать файл: сначала 0600, затем содержимое.
     * @throws std::runtime_error при ошибке записи.
     */
    void Write(const std::string &path, const Credentials &creds);

    // Write() из USER/PASS; без них оставить существующий файл.
    // @throws std::runtime_error если переменных нет и файла нет.
    void Materialize(const std::string &path);
}
