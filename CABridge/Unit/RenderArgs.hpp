#pragma once

#include <cstdint>

#include "../Buffers/BufferList.hpp"
#include "../Format/SampleFormat.hpp"
#include "../Host/HostTypes.hpp"
#include "ActionFlags.hpp"

namespace CAB::Unit {

// Arguments of one render callback invocation. Everything here is only valid
// for the duration of the call; `data` borrows host memory.
template <Format::Sample S>
struct RenderArgs {
    ActionFlags& flags;
    const Host::AudioTimeStamp& timeStamp;
    uint32_t busNumber;
    uint32_t numberFrames;
    Buffers::BufferList<S>& data;
};

} // namespace CAB::Unit
