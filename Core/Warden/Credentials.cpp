#include "Credentials.hpp"
#include "Core/Config.hpp"
#include "Core/Logger.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace
{
    void Wipe(std::string &s)
    {
        volatile char *p = s.data();
        for (std::size_t i = 0; i < s.size(); ++i) p[i] = 0;
        s.clear();
    }

    void WriteAll(int fd, const std::string &data, const std::string &path)
    {
        std::size_t off = 0;
        while (off < data.size())
        {
            const ssize_t wr = ::write(fd, data.data() + off, data.size() - off);
            if (wr < 0)
            {
                if (errno == EINTR) continue;
                throw std::runtime_error("write " + path + ": " + std::strerror(errno));
            }
            off += static_cast<std::size_t>(wr);
        }
    }
}

Credentials::Credentials(std::string user, std::string pass)
    : username(std::move(user))
    , password(std::move(pass))
{
}

Credentials::~Credentials()
{
    Wipe(password);
}

Credentials::Credentials(Credentials &&o) noexcept
    : username(std::move(o.username))
    , password(std::move(o.password))
{
    o.password.clear();
}

Credentials& Credentials::operator=(Credentials &&o) noexcept
{
    if (this == &o) return *this;
    Wipe(password);
    username = std::move(o.username);
    password = std::move(o.password);
    o.password.clear();
    return *this;
}

std::optional<Credentials> Credentials::FromEnvironment()
{
    auto user = Config::Env("USER");
    auto pass = Config::Env("PASS");
    if (!user || !pass) return std::nullopt;
    return Credentials(std::move(*user), std::move(*pass));
}

namespace CredentialsFile
{
    void Write(const std::string &path, const Credentials &creds)
    {
        const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC | O_NOFOLLOW, 0600);
        if (fd < 0)
        {
            throw std::runtime_error("open " + path + ": " + std::strerror(errno));
        }

        // файл мог существовать с другими правами - сужаем до записи содержимого
        if (::fchmod(fd, 0600) != 0)
        {
            const int e = errno;
            ::close(fd);
            throw std::runtime_error("fchmod " + path + ": " + std::strerror(e));
        }

        try
        {
            WriteAll(fd, creds.username + "\n", path);
            WriteAll(fd, creds.password + "\n", path);
        }
        catch (...)
        {
            ::close(fd);
            throw;
        }

        if (::close(fd) != 0)
        {
            throw std::runtime_error("close " + path + ": " + std::strerror(errno));
        }

        LOGI("warden") << "Auth file written: " << path;
    }

    void Materialize(const std::string &path)
    {
        std::optional<Credentials> creds = Credentials::FromEnvironment();
        if (creds)
        {
            Write(path, *creds);
            return;
        }

        struct stat st{};
        if (::stat(path.c_str(), &st) == 0)
        {
            LOGW("warden") << "USER/PASS are not set, keeping existing " << path;
            return;
        }
        throw std::runtime_error("USER/PASS are not set and " + path + " does not exist");
    }
}
