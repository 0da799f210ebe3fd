/*
 * Control Adapter Selection Implementation
 */

#include "adapter_selector.h"
#include "emulated_adapter.h"
#include "native_agent_adapter.h"
#include <cstdio>
#include <memory>

namespace control {

std::unique_ptr<ControlAdapter> select_control_adapter(const AdapterOptions& options,
                                                       const notice::NoticeCallback& notify) {
    std::unique_ptr<ControlAdapter> native =
        std::make_unique<NativeAgentAdapter>(options.agent_socket, options.connect_timeout_ms, options.debug);
    if (native->init()) {
        fprintf(stderr, "[Control] Using %s adapter\n", native->name());
        return native;
    }

    fprintf(stderr, "[Control] Native agent not available at %s, using emulated input\n",
            options.agent_socket.c_str());

    std::unique_ptr<ControlAdapter> emulated =
        std::make_unique<EmulatedAdapter>(options.screen_width, options.screen_height, options.debug);
    emulated->init();

    if (notify) {
        notify(notice::Level::Warning, "Limited remote control",
               "Native agent not running; remote input is emulated and will not reach the OS.");
    }
    return emulated;
}

} // namespace control
