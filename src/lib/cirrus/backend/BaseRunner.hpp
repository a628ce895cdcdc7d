#ifndef LIBCIRRUS_BASERUNNER_H_
#define LIBCIRRUS_BASERUNNER_H_

#include <string>

#include "BackendException.hpp"

namespace Cirrus {
namespace Backend {

struct RunnerInput;
struct RunnerResponse;

/** Implements the actual external call to the API */
class BaseRunner
{
public:
    /** Indicates an inability to deliver a request or receive its response */
    class EndpointException : public BackendException { public:
        /** @param message formatted error message if known */
        explicit EndpointException(const std::string& message) :
            BackendException("Endpoint: "+message) {}; };

    virtual ~BaseRunner() = default;

    /** Returns the remote hostname of the runner */
    [[nodiscard]] virtual std::string GetHostname() const = 0;

    /**
     * Runs one request, streaming the body from input.body
     * Only one request may be in flight per runner
     * @return the status and body of any HTTP response, 2xx or not
     * @throws EndpointException if no response was received
     * @throws StreamFailException if the body source failed
     */
    virtual RunnerResponse RunAction(const RunnerInput& input) = 0;

    /** Aborts the in-flight request (if any) - THREAD SAFE */
    virtual void Cancel() = 0;
};

} // namespace Backend
} // namespace Cirrus

#endif // LIBCIRRUS_BASERUNNER_H_
