/*
 * Native Agent Adapter Implementation
 */

#include "native_agent_adapter.h"
#include "../utils/json_utils.h"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace control {

NativeAgentAdapter::NativeAgentAdapter(const std::string& socket_path, int connect_timeout_ms, bool debug)
    : socket_path_(socket_path)
    , connect_timeout_ms_(connect_timeout_ms)
    , debug_(debug)
{
}

NativeAgentAdapter::~NativeAgentAdapter() {
    destroy();
}

bool NativeAgentAdapter::connect_socket() {
    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (socket_path_.empty() || socket_path_.size() >= sizeof(addr.sun_path)) {
        fprintf(stderr, "[Agent] Invalid socket path '%s'\n", socket_path_.c_str());
        return false;
    }
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        fprintf(stderr, "[Agent] Failed to create socket: %s\n", strerror(errno));
        return false;
    }

    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        fprintf(stderr, "[Agent] Failed to set non-blocking mode: %s\n", strerror(errno));
        close(fd);
        return false;
    }

    if (connect(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        if (errno != EINPROGRESS && errno != EAGAIN) {
            if (debug_) {
                fprintf(stderr, "[Agent] connect(%s): %s\n", socket_path_.c_str(), strerror(errno));
            }
            close(fd);
            return false;
        }

        // Listener backlog full or connect pending; wait up to the connect timeout
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        int ret = poll(&pfd, 1, connect_timeout_ms_);
        if (ret <= 0) {
            fprintf(stderr, "[Agent] Connection to %s timed out after %d ms\n",
                    socket_path_.c_str(), connect_timeout_ms_);
            close(fd);
            return false;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
            if (debug_) {
                fprintf(stderr, "[Agent] connect(%s): %s\n", socket_path_.c_str(),
                        strerror(so_error ? so_error : errno));
            }
            close(fd);
            return false;
        }
    }

    socket_ = fd;
    return true;
}

bool NativeAgentAdapter::init() {
    if (socket_ >= 0) {
        return true;
    }
    if (!connect_socket()) {
        return false;
    }

    json_utils::json hello = {{"type", "hello"}, {"client", "desklink-host"}};
    if (!send_line(json_utils::to_string(hello))) {
        destroy();
        return false;
    }

    fprintf(stderr, "[Agent] Connected to native agent at %s\n", socket_path_.c_str());
    return true;
}

void NativeAgentAdapter::destroy() {
    if (socket_ >= 0) {
        close(socket_);
        socket_ = -1;
    }
}

bool NativeAgentAdapter::send_line(const std::string& text) {
    if (socket_ < 0) {
        return false;
    }

    std::string line = text;
    line += '\n';

    ssize_t sent = send(socket_, line.data(), line.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
    if (sent == static_cast<ssize_t>(line.size())) {
        return true;
    }

    if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        // Agent is not keeping up; drop this event, keep the connection
        dropped_++;
        if (debug_) {
            fprintf(stderr, "[Agent] Send buffer full, dropped event (%llu total)\n",
                    (unsigned long long)dropped_);
        }
        return false;
    }

    // Partial write or hard error: the line stream is no longer in sync
    fprintf(stderr, "[Agent] Lost connection to native agent: %s\n",
            sent < 0 ? strerror(errno) : "short write");
    destroy();
    return false;
}

void NativeAgentAdapter::send_event(const protocol::ControlMessage& message) {
    if (socket_ < 0) {
        dropped_++;
        return;
    }
    try {
        send_line(protocol::encode_control_message(message));
    } catch (const std::exception& e) {
        fprintf(stderr, "[Agent] Failed to encode event: %s\n", e.what());
    }
}

void NativeAgentAdapter::on_pointer_move(double x, double y) {
    send_event(protocol::PointerMove{x, y});
}

void NativeAgentAdapter::on_pointer_down(double x, double y, int button) {
    send_event(protocol::PointerButton{x, y, button, protocol::Phase::Down});
}

void NativeAgentAdapter::on_pointer_up(double x, double y, int button) {
    send_event(protocol::PointerButton{x, y, button, protocol::Phase::Up});
}

void NativeAgentAdapter::on_scroll(double dx, double dy) {
    send_event(protocol::Scroll{dx, dy});
}

void NativeAgentAdapter::on_key_down(const std::string& key, const std::string& code,
                                     const std::optional<protocol::KeyModifiers>& modifiers) {
    send_event(protocol::Key{key, code, protocol::Phase::Down, modifiers});
}

void NativeAgentAdapter::on_key_up(const std::string& key, const std::string& code,
                                   const std::optional<protocol::KeyModifiers>& modifiers) {
    send_event(protocol::Key{key, code, protocol::Phase::Up, modifiers});
}

void NativeAgentAdapter::on_clipboard(const std::string& content, ClipboardDone done) {
    bool ok = false;
    if (socket_ >= 0) {
        try {
            ok = send_line(protocol::encode_control_message(protocol::Clipboard{content}));
        } catch (const std::exception& e) {
            fprintf(stderr, "[Agent] Failed to encode clipboard: %s\n", e.what());
        }
    }
    if (done) {
        done(ok);
    }
}

} // namespace control
