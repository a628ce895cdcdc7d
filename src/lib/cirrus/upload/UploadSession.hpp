#ifndef LIBCIRRUS_UPLOADSESSION_H_
#define LIBCIRRUS_UPLOADSESSION_H_

#include <atomic>
#include <istream>
#include <mutex>
#include <string>

#include "UploadArgs.hpp"
#include "UploadOptions.hpp"
#include "cirrus/BaseException.hpp"
#include "cirrus/Debug.hpp"
#include "cirrus/common.hpp"
#include "cirrus/backend/RunnerInput.hpp"

namespace Cirrus {
namespace Backend { class BaseRunner; }

namespace Upload {

class ChunkProducer;

/**
 * Uploads one source stream as a chunked upload session (start, append..., finish)
 * Requests run strictly one after another on the given runner
 */
class UploadSession
{
public:

    /** The request phases of an upload session */
    enum class Phase { START, APPEND, FINISH };

    /** Returns the display name of the given phase */
    static const char* PhaseName(Phase phase);

    /** Progress of the upload */
    enum class State
    {
        /** Nothing sent yet */           INIT,
        /** Sending the first chunk */    STARTED,
        /** Sending further chunks */     APPENDING,
        /** Committing the upload */      FINISHING,
        /** Committed successfully */     DONE,
        /** Aborted by an error */        FAILED
    };

    /** Returns the display name of the given state */
    static const char* StateName(State state);

    /** Base Exception for all upload issues */
    class Exception : public BaseException { public:
        explicit Exception(const std::string& message) :
            BaseException("Upload Error: "+message) {}; };

    /** Exception indicating bad input, thrown before any request */
    class InvalidArgumentException : public Exception { public:
        explicit InvalidArgumentException(const std::string& message) :
            Exception("Invalid Argument: "+message) {}; };

    /** Base Exception for failures during a specific phase */
    class PhaseException : public Exception
    {
    public:
        PhaseException(Phase phase, const std::string& message) :
            Exception(std::string(PhaseName(phase))+": "+message), mPhase(phase) {};

        /** Returns the phase that failed */
        [[nodiscard]] Phase GetPhase() const { return mPhase; }

    private:
        Phase mPhase;
    };

    /** Exception indicating a request could not be delivered or got no response */
    class TransportException : public PhaseException { public:
        TransportException(Phase phase, const std::string& message) :
            PhaseException(phase, "Transport Failure: "+message) {}; };

    /** Exception indicating the service answered with a non-2xx status */
    class RemoteRejectionException : public PhaseException
    {
    public:
        RemoteRejectionException(Phase phase, int status, const std::string& body) :
            PhaseException(phase, "Remote Rejection: HTTP "+std::to_string(status)),
            mStatus(status), mBody(body) {};

        /** Returns the HTTP status code */
        [[nodiscard]] int GetStatus() const { return mStatus; }

        /** Returns the verbatim response body */
        [[nodiscard]] const std::string& GetBody() const { return mBody; }

    private:
        int mStatus;
        std::string mBody;
    };

    /** Exception indicating a successful response was missing expected content */
    class ProtocolException : public PhaseException { public:
        ProtocolException(Phase phase, const std::string& message) :
            PhaseException(phase, "Protocol Violation: "+message) {}; };

    /** Exception indicating the upload was canceled */
    class CanceledException : public PhaseException { public:
        explicit CanceledException(Phase phase) :
            PhaseException(phase, "Canceled") {}; };

    /** Exception indicating the source stream failed while being read */
    class SourceException : public PhaseException { public:
        SourceException(Phase phase, const std::string& message) :
            PhaseException(phase, "Source Failure: "+message) {}; };

    static constexpr const char* START_ENDPOINT { "files/upload_session/start" };
    static constexpr const char* APPEND_ENDPOINT { "files/upload_session/append" };
    static constexpr const char* FINISH_ENDPOINT { "files/upload_session/finish" };

    /**
     * @param runner the runner to send requests with (one in flight at a time)
     * @param credential the credential to authorize requests with
     * @param options buffer and chunk sizes
     * @throws InvalidArgumentException if the credential or sizes are invalid
     */
    UploadSession(Backend::BaseRunner& runner, const Credential& credential, const UploadOptions& options);

    DELETE_COPY(UploadSession)
    DELETE_MOVE(UploadSession)

    /**
     * Uploads the entire source stream and commits it to the target
     * May only be called once per UploadSession
     * @param commit the destination path and commit flags
     * @param source the stream to read, consumed sequentially until exhausted
     * @return the verbatim body of the finish response
     * @throws InvalidArgumentException if the target or source is invalid
     * @throws TransportException if a request could not be delivered
     * @throws RemoteRejectionException if a request got a non-2xx response
     * @throws ProtocolException if a response is missing expected content
     * @throws CanceledException if Cancel() was called
     * @throws SourceException if the source stream failed
     */
    std::string Upload(const CommitInfo& commit, std::istream& source);

    /** Stops the upload, aborting any in-flight request - THREAD SAFE */
    void Cancel();

    /** Returns the current state - THREAD SAFE */
    [[nodiscard]] State GetState() const { return mState.load(); }

    /** Returns a copy of the current session cursor - THREAD SAFE */
    [[nodiscard]] SessionCursor GetCursor() const;

    /** Returns true if Cancel() was called - THREAD SAFE */
    [[nodiscard]] bool isCanceled() const { return mCanceled.load(); }

private:

    /**
     * Sends one request with its body filled by the producer
     * @return the 2xx response
     * @throws PhaseException subclasses for any failure
     */
    Backend::RunnerResponse RunPhase(Phase phase, const std::string& endpoint,
        const std::string& apiArg, ChunkProducer& producer);

    /** Runs the protocol from start to finish */
    std::string RunUpload(const CommitInfo& commit, ChunkProducer& producer);

    /** Adds the given bytes to the cursor offset */
    void AdvanceCursor(uint64_t bytes);

    mutable Debug mDebug;

    Backend::BaseRunner& mRunner;
    const Credential mCredential;
    const UploadOptions mOptions;

    std::atomic<State> mState { State::INIT };
    std::atomic<bool> mCanceled { false };

    mutable std::mutex mCursorMutex;
    SessionCursor mCursor;
};

} // namespace Upload
} // namespace Cirrus

#endif // LIBCIRRUS_UPLOADSESSION_H_
