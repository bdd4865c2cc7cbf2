#include "spwm/lifecycle.h"

#include "spwm/log.h"

namespace spwm {

EngineLifecycleController::EngineLifecycleController(StateCallback onStateChanged)
    : mState(RunState::Created)
    , mThreadState(std::make_shared<ThreadState>())
    , mOnStateChanged(onStateChanged)
    , mDisposePending(false) {}

EngineLifecycleController::~EngineLifecycleController() {
    if (!mThread) {
        return;
    }
    mThreadState->cancelRequested.store(true, std::memory_order_release);
    if (isLoopThread()) {
        // The loop sees the flag once the current handler returns, then exits
        // holding only its own reference to the thread state.
        SPWM_WARN("lifecycle controller destroyed from its own loop thread, detaching");
        mThread->detach();
        return;
    }
    if (mThread->joinable()) {
        mThread->join();
    }
}

bool EngineLifecycleController::isLoopThread() const {
    return mThreadState->loopThreadId.load(std::memory_order_acquire) ==
           std::this_thread::get_id();
}

void EngineLifecycleController::setState(RunState state) {
    mState.store(state, std::memory_order_release);
    if (mOnStateChanged) {
        mOnStateChanged(state);
    }
}

void EngineLifecycleController::threadMain(std::shared_ptr<ThreadState> state, LoopBody body) {
    state->loopThreadId.store(std::this_thread::get_id(), std::memory_order_release);
    body(state->cancelRequested);
    state->loopThreadId.store(std::thread::id(), std::memory_order_release);
}

PwmError EngineLifecycleController::start(LoopBody body, Action prepare) {
    if (isLoopThread()) {
        SPWM_WARN("start() called from the loop thread");
        return PwmError::LoopContext;
    }
    std::lock_guard<std::recursive_mutex> lock(mMutex);
    const RunState current = state();
    if (current == RunState::Disposed) {
        SPWM_WARN("start() on a disposed channel");
        return PwmError::Disposed;
    }
    if (current == RunState::Running || current == RunState::StopRequested) {
        SPWM_WARN("start() on a running channel");
        return PwmError::AlreadyRunning;
    }

    mThreadState->cancelRequested.store(false, std::memory_order_release);
    if (prepare) {
        prepare();
    }
    mThread.reset(new std::thread(&EngineLifecycleController::threadMain, mThreadState, body));
    setState(RunState::Running);
    return PwmError::Ok;
}

PwmError EngineLifecycleController::stop() {
    if (isLoopThread()) {
        SPWM_WARN("stop() called from the loop thread");
        return PwmError::LoopContext;
    }
    std::lock_guard<std::recursive_mutex> lock(mMutex);
    const RunState current = state();
    if (current == RunState::Disposed) {
        SPWM_WARN("stop() on a disposed channel");
        return PwmError::Disposed;
    }
    if (current != RunState::Running) {
        // Created, Stopped, or a nested call from a StopRequested listener:
        // the outer stop() owns the join.
        return PwmError::Ok;
    }

    mThreadState->cancelRequested.store(true, std::memory_order_release);
    setState(RunState::StopRequested);

    if (mThread && mThread->joinable()) {
        mThread->join();
    }
    mThread.reset();
    setState(RunState::Stopped);

    if (mDisposePending) {
        mDisposePending = false;
        Action release;
        release.swap(mPendingRelease);
        finishDispose(release);
    }
    return PwmError::Ok;
}

void EngineLifecycleController::finishDispose(Action release) {
    if (release) {
        release();
    }
    setState(RunState::Disposed);
}

PwmError EngineLifecycleController::dispose(Action release) {
    if (isLoopThread()) {
        SPWM_WARN("dispose() called from the loop thread");
        return PwmError::LoopContext;
    }
    std::lock_guard<std::recursive_mutex> lock(mMutex);
    if (state() == RunState::Disposed) {
        return PwmError::Ok;
    }
    if (state() == RunState::StopRequested) {
        // Nested in a stop() on this thread; that call releases after its join.
        mDisposePending = true;
        mPendingRelease = release;
        return PwmError::Ok;
    }
    if (state() == RunState::Running) {
        PwmError err = stop();
        if (err != PwmError::Ok) {
            return err;
        }
        if (state() == RunState::Disposed) {
            return PwmError::Ok;
        }
    }
    finishDispose(release);
    return PwmError::Ok;
}

} // namespace spwm
