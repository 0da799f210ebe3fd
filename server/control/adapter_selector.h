/*
 * Control Adapter Selection
 *
 * Try the native agent first; fall back to the emulated adapter when it
 * is not reachable within the connect timeout.
 */

#ifndef ADAPTER_SELECTOR_H
#define ADAPTER_SELECTOR_H

#include "control_adapter.h"
#include "../utils/notice.h"
#include <memory>
#include <string>

namespace control {

struct AdapterOptions {
    std::string agent_socket = "/tmp/desklink-agent.sock";
    int connect_timeout_ms = 1500;
    int screen_width = 1280;
    int screen_height = 720;
    bool debug = false;
};

// Never returns null; the emulated adapter is always available
std::unique_ptr<ControlAdapter> select_control_adapter(const AdapterOptions& options,
                                                       const notice::NoticeCallback& notify);

} // namespace control

#endif // ADAPTER_SELECTOR_H
