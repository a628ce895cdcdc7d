#include <sstream>

#include "catch2/catch_test_macros.hpp"

#include "cirrus/Debug.hpp"

namespace Cirrus {

namespace {

void LogError(Debug& debug) { DDBG_ERROR("() code:" << 5); }
void LogBackend(Debug& debug) { DBG_BACKEND(debug, "() POST"); }
void LogInfo(Debug& debug) { DDBG_INFO("() offset:" << 10); }

/** Registers a string stream for the scope of a test */
class StreamScope
{
public:
    StreamScope() { Debug::AddStream(mStream); }
    ~StreamScope() { Debug::RemoveStream(mStream); }

    std::ostringstream& Get() { return mStream; }

private:
    std::ostringstream mStream;
};

} // namespace

/*****************************************************/
TEST_CASE("Levels", "[Debug]")
{
    StreamScope scope;
    Debug debug("UploadSession", nullptr);

    LogError(debug); LogInfo(debug);
    REQUIRE(scope.Get().str() == "UploadSession: LogError() code:5\n");
    scope.Get().str("");

    Debug::SetLevel(Debug::Level::BACKEND, scope.Get());
    REQUIRE(Debug::GetLevel() >= Debug::Level::BACKEND);
    LogBackend(debug); LogInfo(debug);
    REQUIRE(scope.Get().str() == "UploadSession: LogBackend() POST\n");
    scope.Get().str("");

    Debug::SetLevel(Debug::Level::INFO, scope.Get());
    LogInfo(debug);
    REQUIRE(scope.Get().str() == "UploadSession: LogInfo() offset:10\n");
    scope.Get().str("");

    Debug::SetLevel(Debug::Level::ERRORS, scope.Get());
}

/*****************************************************/
TEST_CASE("Filters", "[Debug]")
{
    StreamScope scope;
    Debug::SetLevel(Debug::Level::INFO, scope.Get());
    Debug::SetFilters("HTTPRunner, ChunkProducer");

    Debug runner("HTTPRunner", nullptr);
    Debug session("UploadSession", nullptr);

    LogInfo(runner); LogInfo(session);
    REQUIRE(scope.Get().str() == "HTTPRunner: LogInfo() offset:10\n");
    scope.Get().str("");

    LogError(session); // errors are never filtered
    REQUIRE(scope.Get().str() == "UploadSession: LogError() code:5\n");
    scope.Get().str("");

    Debug::SetFilters("");
    LogInfo(session);
    REQUIRE(scope.Get().str() == "UploadSession: LogInfo() offset:10\n");

    Debug::SetLevel(Debug::Level::ERRORS, scope.Get());
}

/*****************************************************/
TEST_CASE("RemoveStream", "[Debug]")
{
    std::ostringstream removed;
    {
        StreamScope scope;
        Debug::AddStream(removed);
        Debug::RemoveStream(removed);

        Debug debug("Test", nullptr);
        LogError(debug);
        REQUIRE(scope.Get().str() == "Test: LogError() code:5\n");
    }
    REQUIRE(removed.str().empty());
}

} // namespace Cirrus
