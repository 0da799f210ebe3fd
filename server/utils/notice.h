/*
 * User-facing notices
 *
 * Recoverable conditions the embedding application should show to the
 * user (capture not started, clipboard disabled, agent fallback, ...).
 */

#ifndef NOTICE_H
#define NOTICE_H

#include <functional>
#include <string>

namespace notice {

enum class Level {
    Info,
    Warning,
    Error
};

using NoticeCallback = std::function<void(Level level, const std::string& title, const std::string& text)>;

inline const char* level_name(Level level) {
    switch (level) {
        case Level::Info:    return "info";
        case Level::Warning: return "warning";
        case Level::Error:   return "error";
    }
    return "info";
}

} // namespace notice

#endif // NOTICE_H
