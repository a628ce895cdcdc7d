#ifndef LIBCIRRUS_RUNNERINPUT_H_
#define LIBCIRRUS_RUNNERINPUT_H_

#include <map>
#include <string>

#include "BodySource.hpp"

namespace Cirrus {
namespace Backend {

/** One streamed POST request to run */
struct RunnerInput
{
    /** A map of header name to header value */
    using Params = std::map<std::string, std::string>;

    /** endpoint path, relative to the runner's base URL */
    std::string endpoint;
    /** extra request headers (auth, API args) */
    Params headers;
    /** fills the request body as it is sent */
    BodySource& body;
};

/** The HTTP result of a request that got a response */
struct RunnerResponse
{
    /** HTTP status code */ int status { 0 };
    /** verbatim response body */ std::string body;

    /** Returns true if the status is 2xx */
    [[nodiscard]] bool isSuccess() const { return status >= 200 && status < 300; }
};

} // namespace Backend
} // namespace Cirrus

#endif // LIBCIRRUS_RUNNERINPUT_H_
