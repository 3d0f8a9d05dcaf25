#include "ActionFlags.hpp"

namespace CAB::Unit {

std::string_view ToString(ActionFlags flags) noexcept {
    switch (flags) {
        case ActionFlags::kPreRender:            return "PRE_RENDER";
        case ActionFlags::kPostRender:           return "POST_RENDER";
        case ActionFlags::kOutputIsSilence:      return "OUTPUT_IS_SILENCE";
        case ActionFlags::kOfflinePreflight:     return "OFFLINE_PREFLIGHT";
        case ActionFlags::kOfflineRender:        return "OFFLINE_RENDER";
        case ActionFlags::kOfflineComplete:      return "OFFLINE_COMPLETE";
        case ActionFlags::kPostRenderError:      return "POST_RENDER_ERROR";
        case ActionFlags::kDoNotCheckRenderArgs: return "DO_NOT_CHECK_RENDER_ARGS";
        case ActionFlags::kNone:                 break;
    }
    return "<Unknown ActionFlags>";
}

} // namespace CAB::Unit
