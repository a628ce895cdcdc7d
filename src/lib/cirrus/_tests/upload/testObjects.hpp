#ifndef LIBCIRRUS_TESTOBJECTS_H_
#define LIBCIRRUS_TESTOBJECTS_H_

#include <functional>
#include <limits>
#include <map>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <utility>
#include <vector>

#include "catch2/catch_test_macros.hpp"
#include "catch2/trompeloeil.hpp"

#include "cirrus/backend/BaseRunner.hpp"
#include "cirrus/backend/BodySource.hpp"
#include "cirrus/backend/RunnerInput.hpp"

namespace Cirrus {
namespace Upload {

/** Collects a request body into a string, optionally refusing after a limit */
class StringSink : public Backend::BodySink
{
public:
    explicit StringSink(std::string& output, size_t limit = std::numeric_limits<size_t>::max()) :
        mOutput(output), mLimit(limit) { }

    bool Write(const char* data, size_t length) override
    {
        if (mOutput.size() + length > mLimit) return false;
        mOutput.append(data, length); ++writes; return true;
    }

    size_t writes { 0 };

private:
    std::string& mOutput;
    const size_t mLimit;
};

/** A stream buffer that fails with an I/O error once its data runs out */
class FailingBuf : public std::streambuf
{
public:
    explicit FailingBuf(std::string data) : mData(std::move(data))
    {
        setg(mData.data(), mData.data(), mData.data()+mData.size());
    }

protected:
    int_type underflow() override { throw std::runtime_error("device error"); }

private:
    std::string mData;
};

class MockRunner : public Backend::BaseRunner { public:
    MAKE_CONST_MOCK0(GetHostname, std::string(), override);
    MAKE_MOCK1(RunAction, Backend::RunnerResponse(const Backend::RunnerInput&), override);
    MAKE_MOCK0(Cancel, void(), override);
};

/**
 * Records every request (with its streamed body) and answers like the service
 * Responses can be scripted per request index
 */
class FakeRunner : public Backend::BaseRunner
{
public:
    struct Request
    {
        std::string endpoint;
        Backend::RunnerInput::Params headers;
        std::string body;
        bool complete { false };
    };

    std::string GetHostname() const override { return "fake"; }

    Backend::RunnerResponse RunAction(const Backend::RunnerInput& input) override
    {
        const size_t index { requests.size() };
        if (beforeBody) beforeBody(index);

        requests.push_back(Request{input.endpoint, input.headers, "", false});
        Request& request { requests.back() };

        StringSink sink(request.body);
        request.complete = input.body.WriteBody(sink);

        if (!request.complete)
            throw EndpointException("request aborted");
        if (index == throwAt)
            throw EndpointException("connection reset");

        const decltype(scripted)::const_iterator it { scripted.find(index) };
        if (it != scripted.cend()) return it->second;

        if (input.endpoint == "files/upload_session/start")
            return Backend::RunnerResponse{200, R"({"session_id":"sid:1"})"};
        else if (input.endpoint == "files/upload_session/finish")
            return Backend::RunnerResponse{200, finishBody};
        else return Backend::RunnerResponse{200, ""};
    }

    void Cancel() override { ++cancels; }

    /** Returns the number of requests sent to the given endpoint */
    size_t CountOf(const std::string& endpoint) const
    {
        size_t retval { 0 };
        for (const Request& request : requests)
            if (request.endpoint == endpoint) ++retval;
        return retval;
    }

    std::vector<Request> requests;
    std::map<size_t, Backend::RunnerResponse> scripted;
    size_t throwAt { std::numeric_limits<size_t>::max() };
    std::function<void(size_t)> beforeBody;
    std::string finishBody { R"({"name":"a.txt","id":"id:abc","size":0})" };
    size_t cancels { 0 };
};

} // namespace Upload
} // namespace Cirrus

#endif // LIBCIRRUS_TESTOBJECTS_H_
