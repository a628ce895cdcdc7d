
#include <sstream>
#include <stdexcept>

#include "HTTPOptions.hpp"
#include "cirrus/BaseOptions.hpp"
#include "cirrus/StringUtil.hpp"

namespace Cirrus {
namespace Backend {

/*****************************************************/
std::string HTTPOptions::HelpText()
{
    std::ostringstream output;

    output << "HTTP Options:    [--hproxy-host host [--hproxy-port 1-65535] [--hproxy-user str --hproxy-pass str]]" << std::endl
           << "TLS Options:     [--ca-file path] [--no-tls-verify]";
    return output.str();
}

/*****************************************************/
bool HTTPOptions::AddFlag(const std::string& flag)
{
    if (flag == "no-tls-verify")
        tlsCertVerify = false;
    else return false; // not used

    return true;
}

/*****************************************************/
bool HTTPOptions::AddOption(const std::string& option, const std::string& value)
{
    if (option == "hproxy-host")
        proxyHost = value;
    else if (option == "hproxy-port")
    {
        uint64_t port { 0 };
        try { port = StringUtil::stringToUnsigned(value, UINT16_MAX); }
        catch (const std::logic_error& e) {
            throw BaseOptions::BadValueException(option); }

        if (!port) throw BaseOptions::BadValueException(option);
        proxyPort = static_cast<decltype(proxyPort)>(port);
    }
    else if (option == "hproxy-user")
        proxyUsername = value;
    else if (option == "hproxy-pass")
        proxyPassword = value;
    else if (option == "ca-file")
    {
        if (value.empty()) throw BaseOptions::BadValueException(option);
        caFile = value;
    }
    else return false; // not used

    return true;
}

} // namespace Backend
} // namespace Cirrus
