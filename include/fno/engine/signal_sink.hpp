#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - Signal Sink
// ============================================================================
// Delivery collaborator: takes ownership of emitted signals
// (console, notifier, journal). Rendering text is its job, not the engine's.
// ============================================================================

#include "fno/engine/signal.hpp"

namespace fno::engine {

class SignalSink {
public:
    virtual ~SignalSink() = default;

    virtual void deliver(const Signal& signal) = 0;
};

}  // namespace fno::engine
