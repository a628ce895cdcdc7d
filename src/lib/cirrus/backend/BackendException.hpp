#ifndef LIBCIRRUS_BACKENDEXCEPTION_H_
#define LIBCIRRUS_BACKENDEXCEPTION_H_

#include <string>

#include "cirrus/BaseException.hpp"

namespace Cirrus {
namespace Backend {

/** Base Exception for backend transport issues */
class BackendException : public BaseException { public:
    /** @param message error message */
    explicit BackendException(const std::string& message) :
        BaseException("Backend Error: "+message) {}; };

/** Indicates that a request body's source stream failed */
class StreamFailException : public BackendException { public:
    explicit StreamFailException() : BackendException("Stream Failure") {};
    explicit StreamFailException(const std::string& msg) : BackendException("Stream Failure: "+msg) {}; };

} // namespace Backend
} // namespace Cirrus

#endif // LIBCIRRUS_BACKENDEXCEPTION_H_
