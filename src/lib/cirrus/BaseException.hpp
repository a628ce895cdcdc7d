#ifndef LIBCIRRUS_BASEEXCEPTION_H_
#define LIBCIRRUS_BASEEXCEPTION_H_

#include <stdexcept>

namespace Cirrus {

/** Base Exception for all Cirrus errors */
class BaseException : public std::runtime_error 
{ 
    using std::runtime_error::runtime_error; 
};

} // namespace Cirrus

#endif // LIBCIRRUS_BASEEXCEPTION_H_
