#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace spwm {

class PulseEngine;

/// Lifecycle state of a channel.
enum class RunState {
    Created = 0,
    Running,
    StopRequested,
    Stopped,
    Disposed
};

const char* runStateName(RunState state);

/// Attributes a channel publishes change notifications for.
enum class ChannelProperty {
    Frequency = 0,
    Period,
    HighWidth,
    LowWidth,
    Value
};

/// Attribute name carried by a notification: "frequency", "period",
/// "highWidth", "lowWidth" or "value".
const char* propertyName(ChannelProperty property);

/// Observer of one or more channels. Override the hooks of interest.
///
/// onPulsed() runs on the channel's loop thread; the other hooks run on the
/// thread that made the change. Lifecycle calls (start/stop/dispose) made from
/// inside onPulsed() are refused with PwmError::LoopContext.
class ChannelListener {
  public:
    virtual ~ChannelListener() {}
    virtual void onPropertyChanged(PulseEngine *channel, ChannelProperty property) {
        (void)channel;
        (void)property;
    }
    virtual void onPulsed(PulseEngine *channel) { (void)channel; }
    virtual void onStateChanged(PulseEngine *channel, RunState state) {
        (void)channel;
        (void)state;
    }
};

/// Per-channel listener registry and dispatcher.
///
/// Listeners are kept sorted by priority, highest first; equal priorities keep
/// registration order. Adding or removing listeners (including yourself) is
/// safe during a callback because dispatch iterates over a copy. The caller
/// owns the listener and must remove it before destroying it.
class ChannelEvents {
  public:
    using PulseCallback = std::function<void()>;

    ChannelEvents() = default;
    ChannelEvents(const ChannelEvents&) = delete;
    ChannelEvents& operator=(const ChannelEvents&) = delete;

    // Registering the same listener twice is ignored.
    void addListener(ChannelListener *listener, int priority = 0);
    void removeListener(ChannelListener *listener);
    bool hasListener(ChannelListener *listener) const;

    // Ids are never reused; removing an unknown id does nothing.
    int addPulseCallback(PulseCallback callback);
    void removePulseCallback(int id);

    void firePropertyChanged(PulseEngine *channel, ChannelProperty property);

    /// Stops delivering as soon as `abandoned` is set, which happens when a
    /// handler destroys the channel from the loop thread.
    void firePulsed(PulseEngine *channel, const std::atomic<bool> &abandoned);
    void fireStateChanged(PulseEngine *channel, RunState state);

  private:
    struct Pair {
        Pair() = default;
        ChannelListener *listener = nullptr;
        int priority = 0;
        Pair(ChannelListener *listener, int priority)
            : listener(listener), priority(priority) {}
    };

    typedef std::vector<Pair> ListenerList;
    typedef std::vector<std::pair<int, PulseCallback>> CallbackList;

    ListenerList snapshot() const;
    bool hasListenerLocked(ChannelListener *listener) const;

    mutable std::mutex mMutex;
    ListenerList mListeners;
    CallbackList mPulseCallbacks;
    int mNextCallbackId = 0;
};

} // namespace spwm
