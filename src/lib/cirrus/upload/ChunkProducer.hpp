#ifndef LIBCIRRUS_CHUNKPRODUCER_H_
#define LIBCIRRUS_CHUNKPRODUCER_H_

#include <atomic>
#include <cstdint>
#include <istream>
#include <vector>

#include "cirrus/backend/BodySource.hpp"
#include "cirrus/Debug.hpp"
#include "cirrus/common.hpp"

namespace Cirrus {
namespace Upload {

/**
 * Fills each request body of an upload from one source stream
 * Relays through a fixed buffer so at most one buffer of source data is held
 * Each WriteBody() call writes at most the chunk ceiling, continuing where the last left off
 */
class ChunkProducer : public Backend::BodySource
{
public:

    /**
     * @param source the stream to consume, read sequentially and never seeked
     * @param buffer relay buffer (must be non-empty), reused by every pass
     * @param ceiling maximum bytes written per WriteBody() (must be > 0)
     * @param canceled optional flag that stops the producer when set
     */
    ChunkProducer(std::istream& source, std::vector<char>& buffer,
        uint64_t ceiling, const std::atomic<bool>* canceled = nullptr);

    DELETE_COPY(ChunkProducer)
    DELETE_MOVE(ChunkProducer)

    /**
     * Writes the next chunk of the source into the sink
     * @return false if the sink failed or the producer was canceled
     * @throws Backend::StreamFailException if the source stream fails
     */
    bool WriteBody(Backend::BodySink& sink) override;

    /** Returns the number of bytes written by the last WriteBody() */
    [[nodiscard]] uint64_t GetLastWritten() const { return mLastWritten; }

    /** Returns the number of bytes written by all WriteBody() calls */
    [[nodiscard]] uint64_t GetTotalWritten() const { return mTotalWritten; }

    /** Returns true iff the last pass stopped at the ceiling with data remaining */
    [[nodiscard]] bool HasMoreContent() const { return mHasMore; }

    /** Returns true if the sink refused a write during the last pass */
    [[nodiscard]] bool SinkFailed() const { return mSinkFailed; }

    /** Returns true if the last pass stopped because of cancellation */
    [[nodiscard]] bool WasCanceled() const { return mCanceled; }

private:

    /** Returns true if the cancel flag is set */
    bool IsCanceled() const;

    mutable Debug mDebug;

    std::istream& mSource;
    std::vector<char>& mBuffer;
    const uint64_t mCeiling;
    const std::atomic<bool>* mCancelFlag;

    uint64_t mLastWritten { 0 };
    uint64_t mTotalWritten { 0 };
    bool mHasMore { false };
    bool mSinkFailed { false };
    bool mCanceled { false };
};

} // namespace Upload
} // namespace Cirrus

#endif // LIBCIRRUS_CHUNKPRODUCER_H_
