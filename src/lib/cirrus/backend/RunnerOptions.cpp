
#include <sstream>
#include <stdexcept>

#include "RunnerOptions.hpp"
#include "cirrus/BaseOptions.hpp"
#include "cirrus/StringUtil.hpp"

namespace Cirrus {
namespace Backend {

namespace {

/** Parses a nonzero number of seconds for the given option */
std::chrono::seconds ParseSeconds(const std::string& option, const std::string& value)
{
    uint64_t secs { 0 };
    try { secs = StringUtil::stringToUnsigned(value, 86400); }
    catch (const std::logic_error& e) {
        throw BaseOptions::BadValueException(option); }

    if (!secs) throw BaseOptions::BadValueException(option);
    return std::chrono::seconds(secs);
}

} // namespace

/*****************************************************/
std::string RunnerOptions::HelpText()
{
    std::ostringstream output;
    const RunnerOptions optDefault;

    output << "Runner Advanced: [--connect-timeout secs(" << optDefault.connectTimeout.count() << ")]"
           << " [--req-timeout secs(" << optDefault.timeout.count() << ")]";

    return output.str();
}

/*****************************************************/
bool RunnerOptions::AddOption(const std::string& option, const std::string& value)
{
    if (option == "req-timeout")
        timeout = ParseSeconds(option, value);
    else if (option == "connect-timeout")
        connectTimeout = ParseSeconds(option, value);
    else return false; // not used

    return true;
}

} // namespace Backend
} // namespace Cirrus
