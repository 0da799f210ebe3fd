/*
 * File Transfer Implementation
 */

#include "file_transfer.h"
#include "../utils/base64.h"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <random>
#include <utility>

namespace protocol {

static const uint64_t PROGRESS_STEP = 1024 * 1024;

std::string make_file_id(const std::string& self_id) {
    static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<int> pick(0, 35);

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::string suffix;
    for (int i = 0; i < 6; i++) {
        suffix += alphabet[pick(rng)];
    }
    return self_id + "-" + std::to_string(millis) + "-" + suffix;
}

uint32_t chunk_count(uint64_t size) {
    return static_cast<uint32_t>((size + FILE_CHUNK_SIZE - 1) / FILE_CHUNK_SIZE);
}

FileSender::FileSender(OutgoingFile file, const std::string& self_id,
                       std::vector<std::string> recipients, bool debug)
    : file_(std::move(file))
    , self_id_(self_id)
    , active_(std::move(recipients))
    , debug_(debug)
    , next_progress_(PROGRESS_STEP)
{
    report_.id = make_file_id(self_id_);
    report_.total_chunks = chunk_count(file_.data.size());
}

void FileSender::deliver_to_all(const SendFn& send, const ControlMessage& message, size_t& delivered) {
    delivered = 0;
    for (auto it = active_.begin(); it != active_.end();) {
        if (send(*it, message)) {
            delivered++;
            ++it;
        } else {
            fprintf(stderr, "[FileTransfer] %s: %s stopped receiving after %u chunk(s)\n",
                    file_.name.c_str(), it->c_str(), next_index_);
            it = active_.erase(it);
        }
    }
}

bool FileSender::begin(const SendFn& send) {
    FileMeta meta;
    meta.id = report_.id;
    meta.name = file_.name;
    meta.size = file_.data.size();
    meta.mime = file_.mime.empty() ? "application/octet-stream" : file_.mime;
    meta.from_id = self_id_;

    size_t total = active_.size();
    deliver_to_all(send, meta, report_.meta_sent);
    if (report_.meta_sent == 0) {
        fprintf(stderr, "[FileTransfer] %s: no recipient accepted the transfer\n", file_.name.c_str());
        finished_ = true;
        return false;
    }

    fprintf(stderr, "[FileTransfer] Sending %s (%zu bytes, %u chunks) to %zu/%zu recipients\n",
            file_.name.c_str(), file_.data.size(), report_.total_chunks, report_.meta_sent, total);
    return true;
}

bool FileSender::pump(const SendFn& send, const ReadyFn& ready) {
    if (finished_) {
        return true;
    }

    while (offset_ < file_.data.size()) {
        if (active_.empty()) {
            finished_ = true;
            return true;
        }
        for (const auto& recipient : active_) {
            if (!ready(recipient)) {
                return false;
            }
        }

        size_t len = std::min(FILE_CHUNK_SIZE, file_.data.size() - offset_);
        FileChunk chunk;
        chunk.id = report_.id;
        chunk.index = next_index_;
        chunk.data_b64 = base64::encode(file_.data.data() + offset_, len);

        size_t delivered = 0;
        deliver_to_all(send, chunk, delivered);
        if (delivered > 0) {
            report_.chunks_sent++;
        }
        offset_ += len;
        next_index_++;

        if (file_.data.size() > PROGRESS_STEP && offset_ >= next_progress_) {
            next_progress_ += PROGRESS_STEP;
            fprintf(stderr, "[FileTransfer] Progress: %d%% (%u/%u chunks)\n",
                    static_cast<int>((offset_ * 100) / file_.data.size()), next_index_, report_.total_chunks);
        } else if (debug_) {
            fprintf(stderr, "[FileTransfer] Chunk %u/%u to %zu recipients\n",
                    next_index_, report_.total_chunks, delivered);
        }
    }

    FileComplete complete;
    complete.id = report_.id;
    complete.total_chunks = report_.total_chunks;
    deliver_to_all(send, complete, report_.complete_sent);
    finished_ = true;

    fprintf(stderr, "[FileTransfer] Sent %u/%u chunks of %s, complete to %zu recipient(s)\n",
            report_.chunks_sent, report_.total_chunks, file_.name.c_str(), report_.complete_sent);
    return true;
}

SendReport send_file(const OutgoingFile& file,
                     const std::string& self_id,
                     const std::vector<std::string>& recipients,
                     const FileSender::SendFn& send,
                     bool debug) {
    FileSender sender(file, self_id, recipients, debug);
    if (sender.begin(send)) {
        sender.pump(send, [](const std::string&) { return true; });
    }
    return sender.report();
}

// ============================================================================
// Receiver
// ============================================================================

FileTransferReceiver::FileTransferReceiver(uint64_t max_file_size, uint64_t max_pending_bytes)
    : max_file_size_(max_file_size)
    , max_pending_bytes_(max_pending_bytes)
{
}

uint64_t FileTransferReceiver::pending_bytes() const {
    uint64_t total = 0;
    for (const auto& entry : transfers_) {
        total += entry.second.meta.size;
    }
    return total;
}

FileTransferReceiver::Result FileTransferReceiver::on_meta(const FileMeta& meta, const std::string& source,
                                                          Clock::time_point now) {
    if (meta.id.empty()) {
        return Result::Rejected;
    }
    if (meta.size > max_file_size_) {
        fprintf(stderr, "[FileTransfer] Refusing %s from %s: %llu bytes exceeds limit\n",
                meta.name.c_str(), meta.from_id.c_str(), (unsigned long long)meta.size);
        return Result::Rejected;
    }

    uint64_t reserved = pending_bytes();
    auto existing = transfers_.find(meta.id);
    if (existing != transfers_.end()) {
        if (existing->second.source != source) {
            fprintf(stderr, "[FileTransfer] Ignoring meta for %s from %s: transfer belongs to %s\n",
                    meta.id.c_str(), source.c_str(), existing->second.source.c_str());
            return Result::Foreign;
        }
        reserved -= existing->second.meta.size;
    }
    if (reserved + meta.size > max_pending_bytes_) {
        fprintf(stderr, "[FileTransfer] Refusing %s from %s: %llu bytes already pending\n",
                meta.name.c_str(), meta.from_id.c_str(), (unsigned long long)reserved);
        return Result::Rejected;
    }

    // A repeated meta restarts the transfer
    PendingTransfer& transfer = transfers_[meta.id];
    transfer = PendingTransfer();
    transfer.meta = meta;
    transfer.source = source;
    transfer.last_activity = now;

    fprintf(stderr, "[FileTransfer] Incoming %s (%llu KB) from %s\n",
            meta.name.c_str(), (unsigned long long)(meta.size / 1024), meta.from_id.c_str());
    return Result::Started;
}

FileTransferReceiver::Result FileTransferReceiver::on_chunk(const FileChunk& chunk, const std::string& source,
                                                           Clock::time_point now) {
    auto it = transfers_.find(chunk.id);
    if (it == transfers_.end()) {
        return Result::Unknown;
    }
    PendingTransfer& transfer = it->second;
    if (transfer.source != source) {
        fprintf(stderr, "[FileTransfer] Ignoring chunk %u of %s from %s\n",
                chunk.index, transfer.meta.name.c_str(), source.c_str());
        return Result::Foreign;
    }

    std::vector<uint8_t> bytes;
    if (!base64::decode(chunk.data_b64, bytes) || bytes.size() > FILE_CHUNK_SIZE) {
        fprintf(stderr, "[FileTransfer] Bad chunk %u of %s, discarding transfer\n",
                chunk.index, transfer.meta.name.c_str());
        transfers_.erase(it);
        return Result::Rejected;
    }

    auto existing = transfer.chunks.find(chunk.index);
    if (existing != transfer.chunks.end()) {
        transfer.received_bytes -= existing->second.size();
    }
    transfer.received_bytes += bytes.size();

    if (transfer.received_bytes > transfer.meta.size) {
        fprintf(stderr, "[FileTransfer] %s: received more than the announced %llu bytes\n",
                transfer.meta.name.c_str(), (unsigned long long)transfer.meta.size);
        transfers_.erase(it);
        return Result::Rejected;
    }

    transfer.chunks[chunk.index] = std::move(bytes);
    transfer.last_activity = now;
    return Result::Accepted;
}

FileTransferReceiver::Result FileTransferReceiver::on_complete(const FileComplete& complete,
                                                              const std::string& source, ReceivedFile& out) {
    auto it = transfers_.find(complete.id);
    if (it == transfers_.end()) {
        return Result::Unknown;
    }
    if (it->second.source != source) {
        fprintf(stderr, "[FileTransfer] Ignoring complete for %s from %s\n",
                it->second.meta.name.c_str(), source.c_str());
        return Result::Foreign;
    }
    PendingTransfer transfer = std::move(it->second);
    transfers_.erase(it);

    // Every index 0..total-1 present, sizes adding up to the meta
    bool complete_set = transfer.chunks.size() == complete.total_chunks &&
                        (complete.total_chunks == 0 ||
                         transfer.chunks.rbegin()->first == complete.total_chunks - 1);
    if (!complete_set || transfer.received_bytes != transfer.meta.size) {
        fprintf(stderr, "[FileTransfer] %s incomplete: %zu/%u chunks, %llu/%llu bytes\n",
                transfer.meta.name.c_str(), transfer.chunks.size(), complete.total_chunks,
                (unsigned long long)transfer.received_bytes,
                (unsigned long long)transfer.meta.size);
        return Result::Rejected;
    }

    out.id = transfer.meta.id;
    out.name = transfer.meta.name;
    out.mime = transfer.meta.mime.empty() ? "application/octet-stream" : transfer.meta.mime;
    out.from_id = transfer.meta.from_id;
    out.size = transfer.meta.size;
    out.data.clear();
    out.data.reserve(transfer.received_bytes);
    for (auto& entry : transfer.chunks) {
        out.data.insert(out.data.end(), entry.second.begin(), entry.second.end());
    }

    fprintf(stderr, "[FileTransfer] Received %s (%llu bytes) from %s\n",
            out.name.c_str(), (unsigned long long)out.size, out.from_id.c_str());
    return Result::Completed;
}

std::vector<std::string> FileTransferReceiver::expire_stale(Clock::time_point now,
                                                            std::chrono::milliseconds max_idle) {
    std::vector<std::string> removed;
    for (auto it = transfers_.begin(); it != transfers_.end();) {
        if (now - it->second.last_activity > max_idle) {
            fprintf(stderr, "[FileTransfer] Expiring stalled transfer %s (%llu/%llu bytes)\n",
                    it->second.meta.name.c_str(),
                    (unsigned long long)it->second.received_bytes,
                    (unsigned long long)it->second.meta.size);
            removed.push_back(it->first);
            it = transfers_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

size_t FileTransferReceiver::drop_from(const std::string& source) {
    size_t dropped = 0;
    for (auto it = transfers_.begin(); it != transfers_.end();) {
        if (it->second.source == source) {
            it = transfers_.erase(it);
            dropped++;
        } else {
            ++it;
        }
    }
    return dropped;
}

std::optional<uint64_t> FileTransferReceiver::received_bytes(const std::string& id) const {
    auto it = transfers_.find(id);
    if (it == transfers_.end()) {
        return std::nullopt;
    }
    return it->second.received_bytes;
}

const char* receive_result_name(FileTransferReceiver::Result result) {
    switch (result) {
        case FileTransferReceiver::Result::Started:   return "started";
        case FileTransferReceiver::Result::Accepted:  return "accepted";
        case FileTransferReceiver::Result::Completed: return "completed";
        case FileTransferReceiver::Result::Unknown:   return "unknown";
        case FileTransferReceiver::Result::Foreign:   return "foreign";
        case FileTransferReceiver::Result::Rejected:  return "rejected";
    }
    return "unknown";
}

} // namespace protocol
