#include "Platform.hpp"

#include <sys/utsname.h>

#include <array>
#include <cstring>

namespace
{
    constexpr std::array<PlatformProfile, 9> kPlatforms = {{
        { "x86_64",  "linux/amd64",   "amd64"   },
        { "aarch64", "linux/arm64",   "aarch64" },
        { "armv7l",  "linux/arm/v7",  "armhf"   },
        { "armv6l",  "linux/arm/v6",  "arm"     },
        { "i686",    "linux/386",     "x86"     },
        { "i386",    "linux/386",     "x86"     },
        { "ppc64le", "linux/ppc64le", "ppc64le" },
        { "s390x",   "linux/s390x",   "s390x"   },
        { "riscv64", "linux/riscv64", "riscv64" },
    }};

    std::string g_unknown_machine;
}

namespace Platform
{
    PlatformProfile Lookup(const std::string &machine)
    {
        for (const PlatformProfile &p : kPlatforms)
        {
            if (machine == p.machine) return p;
        }
        return { "", "unknown", "" };
    }

    const PlatformProfile &Current()
    {
        static const PlatformProfile current = []
        {
            utsname u{};
            if (::uname(&u) != 0) return PlatformProfile{ "", "unknown", "" };
            PlatformProfile p = Lookup(u.machine);
            if (std::strcmp(p.platform, "unknown") == 0)
            {
                g_unknown_machine = u.machine;
                p.machine = g_unknown_machine.c_str();
            }
            return p;
        }();
        return current;
    }
}
