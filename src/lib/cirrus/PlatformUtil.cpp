
#include <cstdlib>
#include <vector>

#if WIN32
#include <windows.h>
#else // !WIN32
#include <pwd.h>
#include <unistd.h>
#endif // WIN32

#include "PlatformUtil.hpp"

namespace Cirrus {

/*****************************************************/
std::string PlatformUtil::GetEnvironment(const std::string& name)
{
#if WIN32
    const DWORD size { GetEnvironmentVariableA(name.c_str(), nullptr, 0) };
    if (!size) return ""; // not set

    std::vector<char> value(size);
    const DWORD length { GetEnvironmentVariableA(name.c_str(), value.data(), size) };
    return std::string(value.data(), (length < size) ? length : 0);
#else // !WIN32
    const char* value { std::getenv(name.c_str()) }; // NOLINT(concurrency-mt-unsafe)
    return (value != nullptr) ? value : "";
#endif // WIN32
}

/*****************************************************/
std::string PlatformUtil::GetHomeDirectory()
{
#if WIN32
    return GetEnvironment("USERPROFILE");
#else // !WIN32
    std::string home { GetEnvironment("HOME") };
    if (!home.empty()) return home;

    // $HOME unset, fall back to the password database
    long bufSize { sysconf(_SC_GETPW_R_SIZE_MAX) };
    if (bufSize <= 0) bufSize = 16384;
    std::vector<char> buf(static_cast<size_t>(bufSize));

    struct passwd pwd { };
    struct passwd* result { nullptr };
    if (getpwuid_r(getuid(), &pwd, buf.data(), buf.size(), &result) == 0
        && result != nullptr && result->pw_dir != nullptr)
        home = result->pw_dir;
    return home;
#endif // WIN32
}

} // namespace Cirrus
