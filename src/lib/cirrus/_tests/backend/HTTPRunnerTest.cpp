
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "catch2/catch_test_macros.hpp"

#include "cirrus/backend/BackendException.hpp"
#include "cirrus/backend/HTTPRunner.hpp"
#include "cirrus/backend/HTTPOptions.hpp"
#include "cirrus/backend/RunnerOptions.hpp"
#include "cirrus/upload/UploadSession.hpp"

namespace Cirrus {
namespace Backend {

class HTTPRunnerTest : public HTTPRunner
{
public:
    using HTTPRunner::HostUrlPair;
    using HTTPRunner::HTTPRunner;
    using HTTPRunner::ParseURL;
};

namespace {

/** Writes a fixed string as the body, optionally failing afterwards */
class StringSource : public BodySource
{
public:
    explicit StringSource(std::string data, bool fail = false) :
        mData(std::move(data)), mFail(fail) { }

    bool WriteBody(BodySink& sink) override
    {
        // send in small pieces like a producer would
        for (size_t offset = 0; offset < mData.size(); offset += 3)
        {
            const size_t len { std::min<size_t>(3, mData.size()-offset) };
            if (!sink.Write(mData.data()+offset, len)) return false;
        }
        if (mFail) throw StreamFailException("test");
        return true;
    }

private:
    std::string mData;
    bool mFail;
};

/** A local HTTP server recording the requests it gets */
class TestServer
{
public:
    struct Request
    {
        std::string path;
        std::string body;
        httplib::Headers headers;
    };

    /** @param holdAppend if true, append requests get no response until Release() */
    explicit TestServer(bool holdAppend = false) : mHoldAppend(holdAppend)
    {
        mServer.Post(R"(/2/files/upload_session/(\w+))", [&](const httplib::Request& req, httplib::Response& res)
        {
            const std::string action { req.matches[1].str() };

            {
                std::unique_lock<std::mutex> lock(mMutex);
                mRequests.push_back(Request{req.path, req.body, req.headers});

                if (mHoldAppend && action == "append")
                {
                    mHeld = true; mCond.notify_all();
                    mCond.wait_for(lock, std::chrono::seconds(10), [&]{ return mReleased; });
                }
            }

            if (action == "start")
                res.set_content(R"({"session_id":"srv:1"})", "application/json");
            else if (action == "finish" && req.get_header_value("Dropbox-API-Arg").find("/conflict") != std::string::npos)
            {
                res.status = 409;
                res.set_content(R"({"error_summary": "path/conflict/file/..", "error": {".tag": "path"}})", "application/json");
            }
            else if (action == "finish")
                res.set_content(R"({"name":"a.txt","id":"id:1","size":25})", "application/json");
            else res.status = 200; // append
        });

        mPort = mServer.bind_to_any_port("127.0.0.1");
        mThread = std::thread([&](){ mServer.listen_after_bind(); });
    }

    ~TestServer()
    {
        Release();
        mServer.stop();
        mThread.join();
    }

    /** Waits until an append request is being held, returns false on timeout */
    bool WaitHeld()
    {
        std::unique_lock<std::mutex> lock(mMutex);
        return mCond.wait_for(lock, std::chrono::seconds(10), [&]{ return mHeld; });
    }

    /** Lets held requests respond */
    void Release()
    {
        const std::lock_guard<std::mutex> lock(mMutex);
        mReleased = true; mCond.notify_all();
    }

    /** Returns the URL of the upload API */
    std::string GetURL() const { return "http://127.0.0.1:"+std::to_string(mPort)+"/2"; }

    std::vector<Request> GetRequests()
    {
        const std::lock_guard<std::mutex> lock(mMutex);
        return mRequests;
    }

private:
    httplib::Server mServer;
    int mPort { 0 };
    std::thread mThread;

    std::mutex mMutex;
    std::condition_variable mCond;
    std::vector<Request> mRequests;

    const bool mHoldAppend;
    bool mHeld { false };
    bool mReleased { false };
};

} // namespace

/*****************************************************/
TEST_CASE("ParseURL", "[HTTPRunner]")
{
    HTTPRunnerTest::HostUrlPair result {};

    result = HTTPRunnerTest::ParseURL("myhost");
    REQUIRE(result.first == "http://myhost");
    REQUIRE(result.second == "/");

    result = HTTPRunnerTest::ParseURL("myhost/2");
    REQUIRE(result.first == "http://myhost");
    REQUIRE(result.second == "/2/");

    result = HTTPRunnerTest::ParseURL("https://content.dropboxapi.com/2/");
    REQUIRE(result.first == "https://content.dropboxapi.com");
    REQUIRE(result.second == "/2/");

    result = HTTPRunnerTest::ParseURL("https://myhost:8443/api/v2");
    REQUIRE(result.first == "https://myhost:8443");
    REQUIRE(result.second == "/api/v2/");

    result = HTTPRunnerTest::ParseURL("http://myhost/");
    REQUIRE(result.first == "http://myhost");
    REQUIRE(result.second == "/");
}

/*****************************************************/
TEST_CASE("GetHostname", "[HTTPRunner]")
{
    const HTTPOptions hopts {};
    const RunnerOptions ropts {};

    {
        const HTTPRunner runner("myhost/2","test/1.0",ropts,hopts);
        REQUIRE(runner.GetHostname() == "myhost");
        REQUIRE(runner.GetProtoHost() == "http://myhost");
        REQUIRE(runner.GetBaseURL() == "/2/");
        REQUIRE(runner.GetFullURL() == "http://myhost/2/");
        REQUIRE(runner.GetUserAgent() == "test/1.0");
    }

    {
        const HTTPRunner runner("https://content.dropboxapi.com/2/","",ropts,hopts);
        REQUIRE(runner.GetHostname() == "content.dropboxapi.com");
        REQUIRE(runner.GetFullURL() == "https://content.dropboxapi.com/2/");
    }
}

/*****************************************************/
TEST_CASE("RunAction", "[HTTPRunner]")
{
    TestServer server;
    HTTPRunner runner(server.GetURL(), "cirrus-test/1.0", RunnerOptions{}, HTTPOptions{});

    StringSource source("hello streaming world");
    const RunnerInput input { "files/upload_session/append",
        {{"Authorization","Bearer tok"},{"Dropbox-API-Arg","{}"},{"Content-Type","application/x-test"}}, source };

    const RunnerResponse response { runner.RunAction(input) };
    REQUIRE(response.status == 200);
    REQUIRE(response.isSuccess());

    const std::vector<TestServer::Request> requests { server.GetRequests() };
    REQUIRE(requests.size() == 1);

    const TestServer::Request& req { requests[0] };
    const auto header = [&](const std::string& key)->std::string {
        const auto it { req.headers.find(key) };
        return (it == req.headers.end()) ? "" : it->second; };

    REQUIRE(req.path == "/2/files/upload_session/append");
    REQUIRE(req.body == "hello streaming world");
    REQUIRE(header("Transfer-Encoding") == "chunked");
    REQUIRE(header("Content-Length").empty());
    REQUIRE(header("Authorization") == "Bearer tok");
    REQUIRE(header("Dropbox-API-Arg") == "{}");
    REQUIRE(header("Content-Type") == "application/x-test");
    REQUIRE(header("User-Agent") == "cirrus-test/1.0");
}

/*****************************************************/
TEST_CASE("HTTPRunner SourceFailure", "[HTTPRunner]")
{
    TestServer server;
    HTTPRunner runner(server.GetURL(), "cirrus-test/1.0", RunnerOptions{}, HTTPOptions{});

    StringSource source("partial", true);
    const RunnerInput input { "files/upload_session/append", {}, source };

    REQUIRE_THROWS_AS(runner.RunAction(input), StreamFailException);
    REQUIRE(server.GetRequests().empty()); // never completed
}

/*****************************************************/
TEST_CASE("ConnectionFailure", "[HTTPRunner]")
{
    HTTPRunner runner("http://127.0.0.1:1/2/", "cirrus-test/1.0", RunnerOptions{}, HTTPOptions{});

    StringSource source("data");
    const RunnerInput input { "files/upload_session/start", {}, source };

    REQUIRE_THROWS_AS(runner.RunAction(input), HTTPRunner::ConnectionException);
    REQUIRE_THROWS_AS(runner.RunAction(input), BaseRunner::EndpointException);
}

/*****************************************************/
TEST_CASE("HTTPRunner UploadSession", "[HTTPRunner]")
{
    TestServer server;
    HTTPRunner runner(server.GetURL(), "cirrus-test/1.0", RunnerOptions{}, HTTPOptions{});

    Upload::UploadOptions options;
    options.chunkCeiling = 10;
    options.streamBufferSize = 4;

    const std::string data { "0123456789abcdefghijklmno" };

    {
        Upload::UploadSession session(runner, Upload::Credential{"Bearer","tok"}, options);
        std::istringstream source(data);

        const std::string resp { session.Upload(Upload::CommitInfo{"/a.txt"}, source) };
        REQUIRE(resp == R"({"name":"a.txt","id":"id:1","size":25})");

        const std::vector<TestServer::Request> requests { server.GetRequests() };
        REQUIRE(requests.size() == 4);
        REQUIRE(requests[0].path == "/2/files/upload_session/start");
        REQUIRE(requests[3].path == "/2/files/upload_session/finish");

        std::string received;
        for (const TestServer::Request& req : requests) received += req.body;
        REQUIRE(received == data);

        const auto argOf = [](const TestServer::Request& req)->std::string {
            const auto it { req.headers.find("Dropbox-API-Arg") };
            return (it == req.headers.end()) ? "" : it->second; };

        REQUIRE(argOf(requests[0]).empty());
        REQUIRE(argOf(requests[1]) == R"({"offset":10,"session_id":"srv:1"})");
        REQUIRE(argOf(requests[2]) == R"({"offset":20,"session_id":"srv:1"})");
        REQUIRE(argOf(requests[3]) == R"({"commit":{"autorename":false,"mode":"add","mute":false,"path":"/a.txt"},"cursor":{"offset":25,"session_id":"srv:1"}})");
    }

    {
        Upload::UploadSession session(runner, Upload::Credential{"Bearer","tok"}, options);
        std::istringstream source("abc");

        try { static_cast<void>(session.Upload(Upload::CommitInfo{"/conflict"}, source)); FAIL("no exception"); }
        catch (const Upload::UploadSession::RemoteRejectionException& ex)
        {
            REQUIRE(ex.GetPhase() == Upload::UploadSession::Phase::FINISH);
            REQUIRE(ex.GetStatus() == 409);
            REQUIRE(ex.GetBody() == R"({"error_summary": "path/conflict/file/..", "error": {".tag": "path"}})");
        }
    }
}

/*****************************************************/
TEST_CASE("HTTPRunner CancelWhileWaiting", "[HTTPRunner]")
{
    TestServer server(true);
    HTTPRunner runner(server.GetURL(), "cirrus-test/1.0", RunnerOptions{}, HTTPOptions{});

    Upload::UploadOptions options;
    options.chunkCeiling = 10;
    options.streamBufferSize = 4;

    Upload::UploadSession session(runner, Upload::Credential{"Bearer","tok"}, options);
    std::istringstream source("0123456789abcdefghijklmno");

    // the append body is fully sent, the session waits for its response
    bool wasHeld { false };
    std::thread canceler([&]()
    {
        wasHeld = server.WaitHeld();
        session.Cancel();
    });

    // the canceler must be joined before any REQUIRE can end the test
    std::string error { "no exception" };
    Upload::UploadSession::Phase phase { Upload::UploadSession::Phase::START };
    try { static_cast<void>(session.Upload(Upload::CommitInfo{"/a.txt"}, source)); }
    catch (const Upload::UploadSession::CanceledException& ex)
    {
        error.clear(); phase = ex.GetPhase();
    }
    catch (const Upload::UploadSession::Exception& ex)
    {
        error = ex.what();
    }

    canceler.join();
    server.Release();

    REQUIRE(wasHeld);
    REQUIRE(error.empty());
    REQUIRE(phase == Upload::UploadSession::Phase::APPEND);
    REQUIRE(session.GetState() == Upload::UploadSession::State::FAILED);
    REQUIRE(session.GetCursor().offset == 10);

    const std::vector<TestServer::Request> requests { server.GetRequests() };
    REQUIRE(requests.size() == 2);
    REQUIRE(requests[0].path == "/2/files/upload_session/start");
    REQUIRE(requests[1].path == "/2/files/upload_session/append");
    REQUIRE(requests[1].body == "abcdefghij");
}

} // namespace Backend
} // namespace Cirrus
