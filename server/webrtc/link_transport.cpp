/*
 * Link Transport state names
 */

#include "link_transport.h"

namespace webrtc {

const char* link_state_name(LinkState state) {
    switch (state) {
        case LinkState::New: return "new";
        case LinkState::Connecting: return "connecting";
        case LinkState::Connected: return "connected";
        case LinkState::Disconnected: return "disconnected";
        case LinkState::Failed: return "failed";
        case LinkState::Closed: return "closed";
    }
    return "unknown";
}

const char* signaling_state_name(SignalingState state) {
    switch (state) {
        case SignalingState::Stable: return "stable";
        case SignalingState::HaveLocalOffer: return "have-local-offer";
        case SignalingState::HaveRemoteOffer: return "have-remote-offer";
    }
    return "unknown";
}

} // namespace webrtc
