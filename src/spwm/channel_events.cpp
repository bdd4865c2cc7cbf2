#include "spwm/channel_events.h"

#include <algorithm>

namespace spwm {

const char* runStateName(RunState state) {
    switch (state) {
        case RunState::Created: return "Created";
        case RunState::Running: return "Running";
        case RunState::StopRequested: return "StopRequested";
        case RunState::Stopped: return "Stopped";
        case RunState::Disposed: return "Disposed";
    }
    return "Unknown";
}

const char* propertyName(ChannelProperty property) {
    switch (property) {
        case ChannelProperty::Frequency: return "frequency";
        case ChannelProperty::Period: return "period";
        case ChannelProperty::HighWidth: return "highWidth";
        case ChannelProperty::LowWidth: return "lowWidth";
        case ChannelProperty::Value: return "value";
    }
    return "unknown";
}

bool ChannelEvents::hasListenerLocked(ChannelListener *listener) const {
    auto predicate = [listener](const Pair &pair) {
        return pair.listener == listener;
    };
    return std::find_if(mListeners.begin(), mListeners.end(), predicate) != mListeners.end();
}

bool ChannelEvents::hasListener(ChannelListener *listener) const {
    std::lock_guard<std::mutex> lock(mMutex);
    return hasListenerLocked(listener);
}

void ChannelEvents::addListener(ChannelListener *listener, int priority) {
    if (!listener) {
        return;
    }
    std::lock_guard<std::mutex> lock(mMutex);
    if (hasListenerLocked(listener)) {
        return;
    }
    for (auto it = mListeners.begin(); it != mListeners.end(); ++it) {
        if (it->priority < priority) {
            // this is now the highest priority in this spot.
            mListeners.insert(it, Pair(listener, priority));
            return;
        }
    }
    mListeners.push_back(Pair(listener, priority));
}

void ChannelEvents::removeListener(ChannelListener *listener) {
    std::lock_guard<std::mutex> lock(mMutex);
    auto predicate = [listener](const Pair &pair) {
        return pair.listener == listener;
    };
    auto it = std::find_if(mListeners.begin(), mListeners.end(), predicate);
    if (it != mListeners.end()) {
        mListeners.erase(it);
    }
}

int ChannelEvents::addPulseCallback(PulseCallback callback) {
    std::lock_guard<std::mutex> lock(mMutex);
    int id = mNextCallbackId++;
    mPulseCallbacks.push_back(std::make_pair(id, callback));
    return id;
}

void ChannelEvents::removePulseCallback(int id) {
    std::lock_guard<std::mutex> lock(mMutex);
    auto predicate = [id](const std::pair<int, PulseCallback> &entry) {
        return entry.first == id;
    };
    mPulseCallbacks.erase(
        std::remove_if(mPulseCallbacks.begin(), mPulseCallbacks.end(), predicate),
        mPulseCallbacks.end());
}

ChannelEvents::ListenerList ChannelEvents::snapshot() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mListeners;
}

void ChannelEvents::firePropertyChanged(PulseEngine *channel, ChannelProperty property) {
    // Iterate a copy so listeners may add or remove listeners from the callback.
    ListenerList copy = snapshot();
    for (auto &item : copy) {
        item.listener->onPropertyChanged(channel, property);
    }
}

void ChannelEvents::firePulsed(PulseEngine *channel, const std::atomic<bool> &abandoned) {
    CallbackList callbacks;
    ListenerList copy;
    {
        std::lock_guard<std::mutex> lock(mMutex);
        if (mListeners.empty() && mPulseCallbacks.empty()) {
            return;
        }
        callbacks = mPulseCallbacks;
        copy = mListeners;
    }
    for (auto &item : copy) {
        if (abandoned.load(std::memory_order_acquire)) {
            return;
        }
        item.listener->onPulsed(channel);
    }
    for (auto &entry : callbacks) {
        if (abandoned.load(std::memory_order_acquire)) {
            return;
        }
        entry.second();
    }
}

void ChannelEvents::fireStateChanged(PulseEngine *channel, RunState state) {
    ListenerList copy = snapshot();
    for (auto &item : copy) {
        item.listener->onStateChanged(channel, state);
    }
}

} // namespace spwm
