
#include <utility>
#include <vector>

#include "ChunkProducer.hpp"
#include "UploadSession.hpp"
#include "cirrus/StringUtil.hpp"
#include "cirrus/backend/BaseRunner.hpp"

namespace Cirrus {
namespace Upload {

/*****************************************************/
const char* UploadSession::PhaseName(Phase phase)
{
    switch (phase)
    {
        case Phase::START: return "start";
        case Phase::APPEND: return "append";
        case Phase::FINISH: return "finish";
        default: return "unknown";
    }
}

/*****************************************************/
const char* UploadSession::StateName(State state)
{
    switch (state)
    {
        case State::INIT: return "init";
        case State::STARTED: return "started";
        case State::APPENDING: return "appending";
        case State::FINISHING: return "finishing";
        case State::DONE: return "done";
        case State::FAILED: return "failed";
        default: return "unknown";
    }
}

/*****************************************************/
UploadSession::UploadSession(Backend::BaseRunner& runner, const Credential& credential, const UploadOptions& options) :
    mDebug(__func__,this), mRunner(runner), mCredential(credential), mOptions(options)
{
    MDBG_INFO("(host:" << mRunner.GetHostname() << ")");

    if (StringUtil::trim(mCredential.accessToken).empty())
        throw InvalidArgumentException("missing access token");
    if (StringUtil::trim(mCredential.tokenType).empty())
        throw InvalidArgumentException("missing token type");

    if (!mOptions.streamBufferSize || mOptions.streamBufferSize > UploadOptions::MAX_CHUNK_CEILING)
        throw InvalidArgumentException("stream buffer size must be 1 to "+std::to_string(UploadOptions::MAX_CHUNK_CEILING));
    if (!mOptions.chunkCeiling || mOptions.chunkCeiling > UploadOptions::MAX_CHUNK_CEILING)
        throw InvalidArgumentException("chunk size must be 1 to "+std::to_string(UploadOptions::MAX_CHUNK_CEILING));
}

/*****************************************************/
SessionCursor UploadSession::GetCursor() const
{
    const std::lock_guard<decltype(mCursorMutex)> lock(mCursorMutex);
    return mCursor;
}

/*****************************************************/
void UploadSession::AdvanceCursor(uint64_t bytes)
{
    const std::lock_guard<decltype(mCursorMutex)> lock(mCursorMutex);
    mCursor.offset += bytes;
}

/*****************************************************/
void UploadSession::Cancel()
{
    MDBG_INFO("() state:" << StateName(mState.load()));

    mCanceled.store(true);
    mRunner.Cancel();
}

/*****************************************************/
std::string UploadSession::Upload(const CommitInfo& commit, std::istream& source)
{
    MDBG_INFO("(path:" << commit.path << ")");

    State expected { State::INIT };
    if (!mState.compare_exchange_strong(expected, State::STARTED))
        throw InvalidArgumentException(std::string("session is ")+StateName(expected));

    try
    {
        if (StringUtil::trim(commit.path).empty())
            throw InvalidArgumentException("empty destination path");
        if (!source)
            throw InvalidArgumentException("source stream is not readable");

        // the path must be representable in the argument header
        try { static_cast<void>(ToArgHeader(UploadSessionFinish { SessionCursor{}, commit })); }
        catch (const WireFormatException& ex) {
            throw InvalidArgumentException(ex.what()); }

        std::vector<char> buffer(mOptions.streamBufferSize);
        ChunkProducer producer(source, buffer, mOptions.chunkCeiling, &mCanceled);

        return RunUpload(commit, producer);
    }
    catch (const Exception& ex)
    {
        MDBG_ERROR("... " << ex.what());
        mState.store(State::FAILED);
        throw;
    }
    catch (...)
    {
        // e.g. std::bad_alloc, the session is still unusable
        MDBG_ERROR("... unexpected error");
        mState.store(State::FAILED);
        throw;
    }
}

/*****************************************************/
std::string UploadSession::RunUpload(const CommitInfo& commit, ChunkProducer& producer)
{
    const Backend::RunnerResponse startResp { RunPhase(Phase::START, START_ENDPOINT, "", producer) };

    std::string sessionID;
    try { sessionID = ParseSessionID(startResp.body); }
    catch (const WireFormatException& ex) {
        throw ProtocolException(Phase::START, ex.what()); }

    {
        const std::lock_guard<decltype(mCursorMutex)> lock(mCursorMutex);
        mCursor.sessionID = sessionID;
        mCursor.offset = producer.GetLastWritten();
    }

    MDBG_INFO("... session:" << sessionID << " offset:" << producer.GetLastWritten());

    while (producer.HasMoreContent())
    {
        mState.store(State::APPENDING);

        RunPhase(Phase::APPEND, APPEND_ENDPOINT, ToArgHeader(GetCursor()), producer);
        AdvanceCursor(producer.GetLastWritten());

        MDBG_INFO("... appended:" << producer.GetLastWritten() << " offset:" << GetCursor().offset);
    }

    mState.store(State::FINISHING);

    const UploadSessionFinish finish { GetCursor(), commit };
    Backend::RunnerResponse finishResp { RunPhase(Phase::FINISH, FINISH_ENDPOINT, ToArgHeader(finish), producer) };
    AdvanceCursor(producer.GetLastWritten());

    MDBG_INFO("... committed path:" << commit.path << " size:" << GetCursor().offset);

    mState.store(State::DONE);
    return std::move(finishResp.body);
}

/*****************************************************/
Backend::RunnerResponse UploadSession::RunPhase(Phase phase, const std::string& endpoint,
    const std::string& apiArg, ChunkProducer& producer)
{
    if (mCanceled.load()) throw CanceledException(phase);

    Backend::RunnerInput::Params headers {
        {"Authorization", mCredential.GetHeader()},
        {"Content-Type", "application/octet-stream"}
    };
    if (!apiArg.empty()) headers.emplace(API_ARG_HEADER, apiArg);

    const Backend::RunnerInput input { endpoint, headers, producer };

    MDBG_BACKEND("... POST " << endpoint << " " << apiArg);

    Backend::RunnerResponse response;
    try { response = mRunner.RunAction(input); }
    catch (const Backend::StreamFailException& ex)
    {
        throw SourceException(phase, ex.what());
    }
    catch (const Backend::BaseRunner::EndpointException& ex)
    {
        if (mCanceled.load() || producer.WasCanceled())
            throw CanceledException(phase);
        throw TransportException(phase, ex.what());
    }

    // a partial body must never count as accepted
    if (producer.WasCanceled()) throw CanceledException(phase);
    if (producer.SinkFailed()) throw TransportException(phase, "request body not delivered");

    MDBG_BACKEND("... HTTP:" << response.status << " written:" << producer.GetLastWritten());

    if (!response.isSuccess())
        throw RemoteRejectionException(phase, response.status, response.body);

    return response;
}

} // namespace Upload
} // namespace Cirrus
