#ifndef LIBCIRRUS_HTTPRUNNER_H_
#define LIBCIRRUS_HTTPRUNNER_H_

#include <exception>
#include <memory>
#include <string>
#include <utility>

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT 1
#endif
#include "httplib.h"

#include "BaseRunner.hpp"
#include "BodySource.hpp"
#include "HTTPOptions.hpp"
#include "RunnerInput.hpp"
#include "RunnerOptions.hpp"
#include "cirrus/Debug.hpp"

namespace Cirrus {
namespace Backend {

class HTTPRunnerTest;

/** Runs the API remotely over HTTP, one streamed POST at a time */
class HTTPRunner : public BaseRunner
{
public:

    /** Exception indicating the HTTP library had an error */
    class LibraryException : public EndpointException {
        /** @param error the library error code */
        public: explicit LibraryException(httplib::Error error) :
            EndpointException(httplib::to_string(error)) {} };

    /** Exception indicating that the connection to the server failed */
    class ConnectionException : public LibraryException {
        public: explicit ConnectionException() :
            LibraryException(httplib::Error::Connection) {} };

    /**
     * @param fullURL (protocol://)hostname/endpoint
     * @param userAgent name of the program running
     * @param runnerOptions base runner config options
     * @param httpOptions HTTP config options
     */
    HTTPRunner(const std::string& fullURL, const std::string& userAgent,
        const RunnerOptions& runnerOptions, const HTTPOptions& httpOptions);

    /** Returns the HTTP hostname (without proto://) */
    [[nodiscard]] std::string GetHostname() const override;

    /** Returns the proto://hostname string */
    [[nodiscard]] inline const std::string& GetProtoHost() const { return mProtoHost; }

    /** Returns the base URL being used (always ends with /) */
    [[nodiscard]] inline const std::string& GetBaseURL() const { return mBaseURL; }

    /** Returns the full URL as mProtoHost + mBaseURL */
    [[nodiscard]] inline std::string GetFullURL() const { return mProtoHost+mBaseURL; }

    /** Returns the User-Agent sent with every request */
    [[nodiscard]] inline const std::string& GetUserAgent() const { return mUserAgent; }

    RunnerResponse RunAction(const RunnerInput& input) override;

    void Cancel() override;

private:

    friend class HTTPRunnerTest;

    using HostUrlPair = std::pair<std::string, std::string>;
    /** Parse a full URL into a protoHost/baseURL pair */
    static HostUrlPair ParseURL(const std::string& fullURL);

    /** Initializes the HTTP client */
    void InitializeClient(const std::string& protoHost);

    /** Adapts an httplib DataSink to a BodySink */
    class HTTPSink : public BodySink
    {
    public:
        explicit HTTPSink(httplib::DataSink& sink) : mSink(sink) { }

        bool Write(const char* data, size_t length) override;

        /** Returns true if any write was refused */
        [[nodiscard]] bool Failed() const { return mFailed; }

    private:
        httplib::DataSink& mSink;
        bool mFailed { false };
    };

    /**
     * Handles an httplib non-response
     * @param result httplib result object
     * @param bodyError exception thrown by the body source, if any
     * @throws StreamFailException (or other) if the body source threw
     * @throws ConnectionException if the connection failed
     * @throws LibraryException for all other errors
     */
    [[noreturn]] void HandleNonResponse(const httplib::Result& result, const std::exception_ptr& bodyError);

    mutable Debug mDebug;

    std::string mProtoHost;
    std::string mBaseURL;
    std::string mUserAgent;

    const RunnerOptions mBaseOptions;
    const HTTPOptions mHttpOptions;

    std::unique_ptr<httplib::Client> mHttpClient;
};

} // namespace Backend
} // namespace Cirrus

#endif // LIBCIRRUS_HTTPRUNNER_H_
