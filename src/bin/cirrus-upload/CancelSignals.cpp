
#include <ctime>
#include <utility>
#include <pthread.h>

#include "CancelSignals.hpp"

namespace CirrusCli {

/*****************************************************/
CancelSignals::CancelSignals(CancelFunc func) :
    mDebug(__func__,this), mFunc(std::move(func))
{
    MDBG_INFO("()");

    sigemptyset(&mSignals);
    sigaddset(&mSignals, SIGINT);
    sigaddset(&mSignals, SIGTERM);

    const int retval { pthread_sigmask(SIG_BLOCK, &mSignals, &mOldMask) };
    if (retval != 0) throw Exception("pthread_sigmask()", retval);

    mThread = std::thread(&CancelSignals::WaitThread, this);
}

/*****************************************************/
CancelSignals::~CancelSignals()
{
    MDBG_INFO("()");

    mRunning.store(false);
    mThread.join();

    // a signal still pending would be delivered (and kill us) on unblocking
    const timespec noWait { 0, 0 };
    while (sigtimedwait(&mSignals, nullptr, &noWait) > 0)
        MDBG_INFO("... dropped pending signal");

    const int retval { pthread_sigmask(SIG_SETMASK, &mOldMask, nullptr) };
    if (retval != 0) { MDBG_ERROR("... pthread_sigmask() failed: " << retval); }
}

/*****************************************************/
void CancelSignals::WaitThread()
{
    const timespec timeout { 0, 100*1000*1000 }; // 100ms

    while (mRunning.load())
    {
        const int sig { sigtimedwait(&mSignals, nullptr, &timeout) };
        if (sig < 0) continue; // EAGAIN or EINTR

        // keep consuming signals until destroyed, a repeat only cancels once
        if (mCanceled) { MDBG_INFO("... got signal " << sig << ", already canceling"); continue; }

        MDBG_ERROR("... got signal " << sig << ", canceling");
        mCanceled = true; mFunc();
    }
}

} // namespace CirrusCli
