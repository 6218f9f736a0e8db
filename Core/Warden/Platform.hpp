#pragma once

// Platform.hpp - таблица платформ: machine (uname -m) -> id платформы контейнера и arch s6-overlay.
// Разрешается один раз при старте.

#include <string>

struct PlatformProfile
{
    const char *machine;   ///< uname -m
    const char *platform;  ///< "linux/amd64"
    const char *s6_arch;   ///< архив s6-overlay
};

namespace Platform
{
    // Неизвестная машина -> { "", "unknown", "" }
    PlatformProfile Lookup(const std::string &machine);

    // Lookup(uname().machine), вычисляется один раз.
    const PlatformProfile &Current();
}
