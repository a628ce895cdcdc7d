
#include <algorithm>
#include <exception>
#include <string>

#include "ChunkProducer.hpp"
#include "cirrus/StringUtil.hpp"
#include "cirrus/backend/BackendException.hpp"

namespace Cirrus {
namespace Upload {

/*****************************************************/
ChunkProducer::ChunkProducer(std::istream& source, std::vector<char>& buffer,
    uint64_t ceiling, const std::atomic<bool>* canceled) :
    mDebug(__func__,this), mSource(source), mBuffer(buffer),
    mCeiling(ceiling), mCancelFlag(canceled) { }

/*****************************************************/
bool ChunkProducer::IsCanceled() const
{
    return mCancelFlag != nullptr && mCancelFlag->load();
}

/*****************************************************/
bool ChunkProducer::WriteBody(Backend::BodySink& sink)
{
    mLastWritten = 0;
    mHasMore = false;
    mSinkFailed = false;
    mCanceled = false;

    while (mLastWritten < mCeiling)
    {
        if (IsCanceled()) { mCanceled = true; break; }

        const size_t toRead { static_cast<size_t>(std::min(
            static_cast<uint64_t>(mBuffer.size()), mCeiling-mLastWritten)) };

        // a stream with exceptions() set rethrows its device error
        try { mSource.read(mBuffer.data(), static_cast<std::streamsize>(toRead)); }
        catch (const std::exception& ex) {
            throw Backend::StreamFailException(ex.what()); }

        const size_t sread { static_cast<size_t>(mSource.gcount()) };

        if (mSource.bad() || (mSource.fail() && !mSource.eof()))
            throw Backend::StreamFailException(
                "after "+std::to_string(mTotalWritten+mLastWritten)+" bytes");

        if (sread > 0 && !sink.Write(mBuffer.data(), sread))
        {
            MDBG_ERROR("... sink refused write");
            mSinkFailed = true; break;
        }

        mLastWritten += sread;
        if (sread < toRead) break; // end of stream
    }

    mTotalWritten += mLastWritten;

    if (!mSinkFailed && !mCanceled && mLastWritten == mCeiling)
    {
        // a source that ends exactly at the ceiling has nothing more
        try { mHasMore = (mSource.peek() != std::istream::traits_type::eof()); }
        catch (const std::exception& ex) {
            throw Backend::StreamFailException(ex.what()); }

        if (mSource.bad()) throw Backend::StreamFailException(
            "after "+std::to_string(mTotalWritten)+" bytes");
    }

    MDBG_INFO("... written:" << mLastWritten << " total:" << mTotalWritten
        << " hasMore:" << BOOLSTR(mHasMore));

    return !mSinkFailed && !mCanceled;
}

} // namespace Upload
} // namespace Cirrus
