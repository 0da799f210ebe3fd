/*
 * File Transfer over the Control Channel
 *
 * Sender side splits a file into 64 KiB chunks and emits
 * file-meta, file-chunk x N, file-complete through a caller-supplied send
 * function (one call per recipient per frame).
 *
 * Receiver side keeps one pending transfer per id between its file-meta
 * and file-complete. Chunks are placed by index, so a reordered delivery
 * still reassembles correctly. Transfers that go quiet are reclaimed by
 * expire_stale().
 */

#ifndef FILE_TRANSFER_H
#define FILE_TRANSFER_H

#include "control_message.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace protocol {

constexpr size_t FILE_CHUNK_SIZE = 64 * 1024;

// Build a transfer id of the form <self_id>-<millis>-<random6>
std::string make_file_id(const std::string& self_id);

uint32_t chunk_count(uint64_t size);

struct OutgoingFile {
    std::string name;
    std::string mime;
    std::vector<uint8_t> data;
};

struct SendReport {
    std::string id;
    uint32_t total_chunks = 0;
    size_t meta_sent = 0;          // recipients that took the file-meta
    uint32_t chunks_sent = 0;      // chunks that reached at least one recipient
    size_t complete_sent = 0;      // recipients that took the file-complete
};

/**
 * Incremental sender for one file
 *
 * begin() announces the file; pump() sends chunks for as long as every
 * remaining recipient is ready, then the file-complete. A recipient whose
 * send fails stops receiving the rest of the file.
 */
class FileSender {
public:
    // Delivers one message to one recipient; false when it was not accepted
    using SendFn = std::function<bool(const std::string& recipient, const ControlMessage& message)>;
    // False while a recipient cannot take more data
    using ReadyFn = std::function<bool(const std::string& recipient)>;

    FileSender(OutgoingFile file, const std::string& self_id,
               std::vector<std::string> recipients, bool debug = false);

    // Send the file-meta; false when no recipient took it
    bool begin(const SendFn& send);

    // Returns true once the file is finished (sent, or every recipient lost)
    bool pump(const SendFn& send, const ReadyFn& ready);

    bool finished() const { return finished_; }
    const SendReport& report() const { return report_; }
    const std::string& id() const { return report_.id; }
    const std::string& name() const { return file_.name; }
    uint64_t size() const { return file_.data.size(); }
    const std::vector<std::string>& recipients() const { return active_; }

private:
    void deliver_to_all(const SendFn& send, const ControlMessage& message, size_t& delivered);

    OutgoingFile file_;
    std::string self_id_;
    std::vector<std::string> active_;
    bool debug_;

    SendReport report_;
    size_t offset_ = 0;
    uint32_t next_index_ = 0;
    uint64_t next_progress_;
    bool finished_ = false;
};

/**
 * Send a whole file at once to every recipient
 * @return Counts of what went out. No chunks are sent when no recipient took the meta.
 */
SendReport send_file(const OutgoingFile& file,
                     const std::string& self_id,
                     const std::vector<std::string>& recipients,
                     const FileSender::SendFn& send,
                     bool debug = false);

// A fully reassembled file
struct ReceivedFile {
    std::string id;
    std::string name;
    std::string mime;
    std::string from_id;
    uint64_t size = 0;
    std::vector<uint8_t> data;
};

class FileTransferReceiver {
public:
    using Clock = std::chrono::steady_clock;

    enum class Result {
        Started,        // file-meta opened a transfer
        Accepted,       // chunk stored
        Completed,      // file-complete produced a ReceivedFile
        Unknown,        // no transfer with that id
        Foreign,        // the transfer belongs to another link; frame ignored
        Rejected        // bad chunk, size or count; the transfer is discarded
    };

    // max_pending_bytes caps the announced size of all open transfers together
    explicit FileTransferReceiver(uint64_t max_file_size = 100ull * 1024 * 1024,
                                  uint64_t max_pending_bytes = 256ull * 1024 * 1024);

    // source: the link a frame arrived on. Chunks and the complete are only
    // taken from the link that sent the meta.
    Result on_meta(const FileMeta& meta, const std::string& source, Clock::time_point now);
    Result on_chunk(const FileChunk& chunk, const std::string& source, Clock::time_point now);

    // On Completed, out receives the file and the transfer is released
    Result on_complete(const FileComplete& complete, const std::string& source, ReceivedFile& out);

    // Drop transfers with no activity for longer than max_idle. Returns ids removed.
    std::vector<std::string> expire_stale(Clock::time_point now, std::chrono::milliseconds max_idle);

    // Drop every transfer that arrived on one link (link teardown)
    size_t drop_from(const std::string& source);

    size_t pending_count() const { return transfers_.size(); }
    uint64_t pending_bytes() const;
    bool has_transfer(const std::string& id) const { return transfers_.count(id) != 0; }
    std::optional<uint64_t> received_bytes(const std::string& id) const;

private:
    struct PendingTransfer {
        FileMeta meta;
        std::string source;
        std::map<uint32_t, std::vector<uint8_t>> chunks;
        uint64_t received_bytes = 0;
        Clock::time_point last_activity;
    };

    uint64_t max_file_size_;
    uint64_t max_pending_bytes_;
    std::map<std::string, PendingTransfer> transfers_;
};

const char* receive_result_name(FileTransferReceiver::Result result);

} // namespace protocol

#endif // FILE_TRANSFER_H
