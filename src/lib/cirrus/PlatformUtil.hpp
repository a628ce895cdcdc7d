#ifndef LIBCIRRUS_PLATFORMUTIL_H_
#define LIBCIRRUS_PLATFORMUTIL_H_

#include <string>

namespace Cirrus {

/** Platform abstractions */
class PlatformUtil
{
public:

    PlatformUtil() = delete; // static only

    /** Returns the value of the environment variable, or empty if not set */
    [[nodiscard]] static std::string GetEnvironment(const std::string& name);

    /** Returns the user's home directory path, or empty if not found */
    [[nodiscard]] static std::string GetHomeDirectory();
};

} // namespace Cirrus

#endif // LIBCIRRUS_PLATFORMUTIL_H_
