#ifndef LIBCIRRUS_RUNNEROPTIONS_H_
#define LIBCIRRUS_RUNNEROPTIONS_H_

#include <chrono>
#include <string>

namespace Cirrus {
namespace Backend {

/** Runner config options */
struct RunnerOptions
{
    /** Retrieve the standard help text string */
    static std::string HelpText();

    /**
     * Adds the given option/value, returning true iff it was used
     * @throws BaseOptions::BadValueException if invalid arguments
     */
    bool AddOption(const std::string& option, const std::string& value);

    using seconds = std::chrono::seconds;

    /** The time allowed to establish a connection */
    seconds connectTimeout { 30 };
    /** The connection read/write timeout */
    seconds timeout { 60 };
};

} // namespace Backend
} // namespace Cirrus

#endif // LIBCIRRUS_RUNNEROPTIONS_H_
