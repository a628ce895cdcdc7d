
#include <string>
#include <utility>

#include "HTTPRunner.hpp"
#include "cirrus/StringUtil.hpp"

namespace Cirrus {
namespace Backend {

/*****************************************************/
HTTPRunner::HTTPRunner(const std::string& fullURL, const std::string& userAgent,
    const RunnerOptions& runnerOptions, const HTTPOptions& httpOptions) :
    mDebug(__func__,this), mUserAgent(userAgent),
    mBaseOptions(runnerOptions), mHttpOptions(httpOptions)
{
    const HostUrlPair urlPair { ParseURL(fullURL) };
    mProtoHost = urlPair.first;
    mBaseURL = urlPair.second;

    MDBG_INFO("(url:" << fullURL << ") protoHost:" << mProtoHost << " baseURL:" << mBaseURL);

    InitializeClient(mProtoHost);
}

/*****************************************************/
void HTTPRunner::InitializeClient(const std::string& protoHost)
{
    mHttpClient = std::make_unique<httplib::Client>(protoHost);

    // a redirect would replay a body we have already consumed
    mHttpClient->set_follow_location(false);

    mHttpClient->set_keep_alive(true);
    mHttpClient->set_connection_timeout(mBaseOptions.connectTimeout);
    mHttpClient->set_read_timeout(mBaseOptions.timeout);
    mHttpClient->set_write_timeout(mBaseOptions.timeout);

    mHttpClient->enable_server_certificate_verification(mHttpOptions.tlsCertVerify);
    if (!mHttpOptions.caFile.empty())
        mHttpClient->set_ca_cert_path(mHttpOptions.caFile);

    if (!mHttpOptions.proxyHost.empty())
    {
        mHttpClient->set_proxy(
            mHttpOptions.proxyHost, mHttpOptions.proxyPort);
    }

    if (!mHttpOptions.proxyUsername.empty())
    {
        mHttpClient->set_proxy_basic_auth(
            mHttpOptions.proxyUsername, mHttpOptions.proxyPassword);
    }
}

/*****************************************************/
HTTPRunner::HostUrlPair HTTPRunner::ParseURL(const std::string& fullURL)
{
    const std::string fullerURL {
        (fullURL.find("://") != std::string::npos)
            ? fullURL : ("http://"+fullURL) };

    // the path starts at the first / after proto://host
    const size_t hostStart { fullerURL.find("://") + 3 };
    const size_t pathStart { fullerURL.find('/', hostStart) };

    HostUrlPair pair { fullerURL.substr(0, pathStart), "/" };
    if (pathStart != std::string::npos)
        pair.second = fullerURL.substr(pathStart);

    if (!StringUtil::endsWith(pair.second,"/"))
        pair.second += "/"; // endpoints are appended
    return pair;
}

/*****************************************************/
std::string HTTPRunner::GetHostname() const
{
    return StringUtil::split(mProtoHost, "://").second;
}

/*****************************************************/
bool HTTPRunner::HTTPSink::Write(const char* data, size_t length)
{
    if (mFailed) return false;
    if (!mSink.write(data, length)) mFailed = true;
    return !mFailed;
}

/*****************************************************/
RunnerResponse HTTPRunner::RunAction(const RunnerInput& input)
{
    MDBG_INFO("(endpoint:" << input.endpoint << ")");

    httplib::Headers headers;
    headers.emplace("User-Agent", mUserAgent);

    std::string contentType { "application/octet-stream" };
    for (const decltype(input.headers)::value_type& it : input.headers)
    {
        // httplib sets Content-Type itself from the Post() argument
        if (it.first == "Content-Type") contentType = it.second;
        else headers.emplace(it.first, it.second);
    }

    const std::string url { mBaseURL + input.endpoint };

    // exceptions must not unwind through httplib, keep them for after
    std::exception_ptr bodyError;

    // no content length given, so httplib sends with chunked transfer encoding
    const httplib::ContentProviderWithoutLength provider { [&](size_t, httplib::DataSink& sink)->bool
    {
        try
        {
            HTTPSink bodySink(sink);
            if (!input.body.WriteBody(bodySink) || bodySink.Failed())
                return false; // abort the request

            sink.done(); return true;
        }
        catch (const std::exception&)
        {
            // BaseException or a device error rethrown by the source
            bodyError = std::current_exception();
            return false; // abort the request
        }
    }};

    httplib::Result result { mHttpClient->Post(url, headers, provider, contentType) };
    if (!result || bodyError) HandleNonResponse(result, bodyError);

    MDBG_INFO("... HTTP:" << result->status);

    return RunnerResponse { result->status, std::move(result->body) };
}

/*****************************************************/
void HTTPRunner::HandleNonResponse(const httplib::Result& result, const std::exception_ptr& bodyError)
{
    if (bodyError)
    {
        MDBG_ERROR("... body source failed");
        std::rethrow_exception(bodyError);
    }

    MDBG_ERROR("... " << httplib::to_string(result.error()));

    if (result.error() == httplib::Error::Connection)
        throw ConnectionException();
    else throw LibraryException(result.error());
}

/*****************************************************/
void HTTPRunner::Cancel()
{
    MDBG_INFO("()");

    mHttpClient->stop();
}

} // namespace Backend
} // namespace Cirrus
