#ifndef LIBCIRRUS_BODYSOURCE_H_
#define LIBCIRRUS_BODYSOURCE_H_

#include <cstddef>

namespace Cirrus {
namespace Backend {

/** The destination of an outgoing request body (the in-flight request) */
class BodySink
{
public:
    virtual ~BodySink() = default;

    /**
     * Sends the given bytes as the next part of the body
     * @return false if the request can no longer accept data
     */
    virtual bool Write(const char* data, size_t length) = 0;
};

/** Supplies exactly one outgoing request body per call */
class BodySource
{
public:
    virtual ~BodySource() = default;

    /**
     * Writes one complete body into the sink
     * MUST NOT run another backend action from within!
     * @return false if the body is incomplete and the request must be aborted
     * @throws StreamFailException if the underlying data source fails
     */
    virtual bool WriteBody(BodySink& sink) = 0;
};

} // namespace Backend
} // namespace Cirrus

#endif // LIBCIRRUS_BODYSOURCE_H_
