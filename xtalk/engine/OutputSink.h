#pragma once

#include "xtalk/engine/Event.h"

namespace xtalk::engine {

enum class OutputPort {
    Main,      // filtered performer stream
    Reference, // reference click + timing error notes
};

// Receives everything the pipeline produces. Implemented by the MIDI host (RtMidi ports)
// and by tests (recording sink).
class OutputSink {
public:
    virtual ~OutputSink() = default;
    virtual void send(OutputPort port, const Event& e) = 0;
};

} // namespace xtalk::engine
