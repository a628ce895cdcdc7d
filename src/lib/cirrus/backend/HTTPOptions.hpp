#ifndef LIBCIRRUS_HTTPOPTIONS_H_
#define LIBCIRRUS_HTTPOPTIONS_H_

#include <cstdint>
#include <string>

namespace Cirrus {
namespace Backend {

/** HTTP config options */
struct HTTPOptions
{
    /** Retrieve the standard help text string */
    static std::string HelpText();

    /** Adds the given argument, returning true iff it was used */
    bool AddFlag(const std::string& flag);

    /**
     * Adds the given option/value, returning true iff it was used
     * @throws BaseOptions::BadValueException if invalid arguments
     */
    bool AddOption(const std::string& option, const std::string& value);

    /** Whether or not TLS cert verification is required */
    bool tlsCertVerify { true };
    /** CA certificate bundle to verify against, empty for the system default */
    std::string caFile;
    /** HTTP proxy server hostname */
    std::string proxyHost;
    /** HTTP proxy server port */
    uint16_t proxyPort { 443 };
    /** HTTP proxy server basic-auth username */
    std::string proxyUsername;
    /** HTTP proxy server basic-auth password */
    std::string proxyPassword;
};

} // namespace Backend
} // namespace Cirrus

#endif // LIBCIRRUS_HTTPOPTIONS_H_
