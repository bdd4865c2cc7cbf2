#pragma once

/// @file spwm/lifecycle.h
/// @brief Start/stop/dispose state machine around one loop thread
///
///   Created -> Running -> StopRequested -> Stopped -> Running ...
///   Created | Running | Stopped -> Disposed
///
/// Guarantees:
/// - at most one loop thread exists per controller;
/// - stop() returns only after the loop body has returned and its thread was joined;
/// - dispose() stops first, then runs the release function exactly once;
///   later dispose() calls are no-ops;
/// - start/stop/dispose called from the loop thread itself are refused with
///   PwmError::LoopContext instead of joining their own thread;
/// - destroying the controller from the loop thread detaches that thread; the
///   cancel flag it polls is shared with it and outlives the controller;
/// - dispose() from a StopRequested listener is deferred until the join
///   that listener is nested in has completed.
///
/// Lifecycle calls are serialized by a recursive mutex, so a state listener
/// may call back into the controller from the thread that made the change.

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "spwm/channel_events.h"
#include "spwm/error.h"

namespace spwm {

class EngineLifecycleController {
  public:
    /// Loop body; must return soon after the flag becomes true.
    using LoopBody = std::function<void(const std::atomic<bool>& cancelRequested)>;
    using StateCallback = std::function<void(RunState)>;
    using Action = std::function<void()>;

    explicit EngineLifecycleController(StateCallback onStateChanged = StateCallback());
    ~EngineLifecycleController();

    EngineLifecycleController(const EngineLifecycleController&) = delete;
    EngineLifecycleController& operator=(const EngineLifecycleController&) = delete;

    /// Runs `prepare` (if any) and launches `body` on a new thread.
    /// @return AlreadyRunning, Disposed, LoopContext or Ok
    PwmError start(LoopBody body, Action prepare = Action());

    /// Requests cancellation and blocks until the loop thread has exited.
    /// Ok immediately when nothing is running; Disposed after dispose().
    PwmError stop();

    /// stop() if running, then `release` (if any). Ok when already disposed.
    PwmError dispose(Action release = Action());

    RunState state() const { return mState.load(std::memory_order_acquire); }
    bool isRunning() const { return state() == RunState::Running; }
    bool isDisposed() const { return state() == RunState::Disposed; }

    /// True when called from the loop thread this controller launched.
    bool isLoopThread() const;

  private:
    // Owned jointly by the controller and the running loop thread.
    struct ThreadState {
        std::atomic<bool> cancelRequested;
        std::atomic<std::thread::id> loopThreadId;
        ThreadState() : cancelRequested(false), loopThreadId(std::thread::id()) {}
    };

    static void threadMain(std::shared_ptr<ThreadState> state, LoopBody body);
    void setState(RunState state);
    void finishDispose(Action release);

    std::recursive_mutex mMutex;
    std::atomic<RunState> mState;
    const std::shared_ptr<ThreadState> mThreadState;
    std::unique_ptr<std::thread> mThread;
    StateCallback mOnStateChanged;
    bool mDisposePending;
    Action mPendingRelease;
};

} // namespace spwm
