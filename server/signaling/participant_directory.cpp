/*
 * Participant Directory Implementation
 */

#include "participant_directory.h"
#include "../utils/json_utils.h"

namespace signaling {

std::optional<Participant> parse_participant(const SignalRecord& record) {
    Participant participant;
    participant.id = json_utils::get_string(record.payload, "userId", record.sender_id);
    if (participant.id.empty()) {
        return std::nullopt;
    }

    auto role = protocol::parse_role(json_utils::get_string(record.payload, "role"));
    if (!role) {
        return std::nullopt;
    }
    participant.role = *role;

    std::string status = json_utils::get_string(record.payload, "status", "joined");
    if (status == "joined") {
        participant.status = ParticipantStatus::Joined;
    } else if (status == "left") {
        participant.status = ParticipantStatus::Left;
    } else {
        return std::nullopt;
    }
    return participant;
}

ParticipantDirectory::Change ParticipantDirectory::update(const Participant& participant) {
    auto it = participants_.find(participant.id);
    if (it == participants_.end()) {
        participants_[participant.id] = participant;
        return participant.status == ParticipantStatus::Joined ? Change::Joined : Change::Left;
    }

    Participant previous = it->second;
    it->second = participant;

    if (previous.status != participant.status) {
        return participant.status == ParticipantStatus::Joined ? Change::Joined : Change::Left;
    }
    if (previous.role != participant.role) {
        return Change::RoleChanged;
    }
    return Change::None;
}

std::optional<Participant> ParticipantDirectory::find(const std::string& id) const {
    auto it = participants_.find(id);
    if (it == participants_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ParticipantDirectory::is_joined(const std::string& id) const {
    auto it = participants_.find(id);
    return it != participants_.end() && it->second.status == ParticipantStatus::Joined;
}

std::optional<protocol::Role> ParticipantDirectory::role_of(const std::string& id) const {
    auto it = participants_.find(id);
    if (it == participants_.end()) {
        return std::nullopt;
    }
    return it->second.role;
}

std::vector<std::string> ParticipantDirectory::joined_with_role(protocol::Role role) const {
    std::vector<std::string> ids;
    for (const auto& [id, participant] : participants_) {
        if (participant.status == ParticipantStatus::Joined && participant.role == role) {
            ids.push_back(id);
        }
    }
    return ids;
}

} // namespace signaling
