/*
 * Participant Directory
 *
 * Role and join/leave status of everyone in the session, as reported by
 * "participant" signaling records. Used to decide offer direction
 * (controllers offer to hosts) and to tear links down when a peer leaves.
 */

#ifndef PARTICIPANT_DIRECTORY_H
#define PARTICIPANT_DIRECTORY_H

#include "signal_record.h"
#include "../protocol/control_dispatcher.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace signaling {

enum class ParticipantStatus {
    Joined,
    Left
};

struct Participant {
    std::string id;
    protocol::Role role = protocol::Role::Controller;
    ParticipantStatus status = ParticipantStatus::Joined;
};

// Parse a "participant" record: payload {userId?, role, status}. userId defaults to the sender.
std::optional<Participant> parse_participant(const SignalRecord& record);

class ParticipantDirectory {
public:
    enum class Change {
        None,
        Joined,
        Left,
        RoleChanged
    };

    Change update(const Participant& participant);

    std::optional<Participant> find(const std::string& id) const;
    bool is_joined(const std::string& id) const;
    std::optional<protocol::Role> role_of(const std::string& id) const;

    // Joined participants with the given role
    std::vector<std::string> joined_with_role(protocol::Role role) const;

    size_t size() const { return participants_.size(); }
    void clear() { participants_.clear(); }

private:
    std::map<std::string, Participant> participants_;
};

} // namespace signaling

#endif // PARTICIPANT_DIRECTORY_H
