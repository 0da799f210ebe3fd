/*
 * Signaling Channel Interface
 *
 * Out-of-band delivery of SignalRecords between session participants.
 * Only the record shape matters to the orchestrator; the transport behind
 * it (WebSocket relay, test double) is interchangeable.
 */

#ifndef SIGNALING_CHANNEL_H
#define SIGNALING_CHANNEL_H

#include "signal_record.h"
#include <functional>

namespace signaling {

class SignalingChannel {
public:
    using RecordCallback = std::function<void(const SignalRecord&)>;

    virtual ~SignalingChannel() = default;

    // False when the record could not be handed to the transport. Not retried.
    virtual bool publish(const SignalRecord& record) = 0;

    virtual bool is_connected() const = 0;

    // Inbound records; may be raised on any thread
    virtual void on_record(RecordCallback callback) = 0;
};

} // namespace signaling

#endif // SIGNALING_CHANNEL_H
