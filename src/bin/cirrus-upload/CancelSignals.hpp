#ifndef CIRRUSCLI_CANCELSIGNALS_H_
#define CIRRUSCLI_CANCELSIGNALS_H_

#include <atomic>
#include <csignal>
#include <functional>
#include <string>
#include <thread>

#include "cirrus/BaseException.hpp"
#include "cirrus/Debug.hpp"
#include "cirrus/common.hpp"

namespace CirrusCli {

/**
 * Scope-managed handling of SIGINT/SIGTERM
 * The signals are blocked and waited on by a helper thread that runs
 * the cancel function on the first one, so it may do more than a handler could
 * Must be constructed before any other thread is started
 */
class CancelSignals
{
public:

    /** Exception indicating the signal mask could not be changed */
    class Exception : public Cirrus::BaseException { public:
        explicit Exception(const std::string& func, int error) :
            Cirrus::BaseException(func+" failed: "+std::to_string(error)) {}; };

    using CancelFunc = std::function<void()>;

    /** @param func function to run on the first signal (from the helper thread) */
    explicit CancelSignals(CancelFunc func);

    virtual ~CancelSignals();
    DELETE_COPY(CancelSignals)
    DELETE_MOVE(CancelSignals)

private:

    /** Waits for signals until stopped, running mFunc on the first */
    void WaitThread();

    Cirrus::Debug mDebug;
    CancelFunc mFunc;

    sigset_t mSignals { };
    sigset_t mOldMask { };

    std::atomic<bool> mRunning { true };
    /** True once mFunc has run, only used by the helper thread */
    bool mCanceled { false };
    std::thread mThread;
};

} // namespace CirrusCli

#endif // CIRRUSCLI_CANCELSIGNALS_H_
