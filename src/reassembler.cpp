/*
* @license
* (C) zachbabanov
*
*/

#include <reassembler.hpp>
#include <chunker.hpp>
#include <protocol.hpp>
#include <logger.hpp>

#include <cstring>

using namespace framecast::assembly;
using namespace framecast::common;
using namespace framecast::protocol;

FrameReassembler::FrameReassembler(const ReassemblerConfig &cfg) : cfg_(cfg) {
    cfg_.payload_size = framecast::chunk::effective_payload_size(cfg_.payload_size);
    if (cfg_.max_pending_frames == 0) cfg_.max_pending_frames = 1;
}

const PendingFrame *FrameReassembler::find(uint32_t frame_id) const {
    auto it = pending_.find(frame_id);
    return it == pending_.end() ? nullptr : &it->second;
}

void FrameReassembler::evict_oldest() {
    auto oldest = pending_.end();
    for (auto it = pending_.begin(); it != pending_.end(); ++it) {
        if (oldest == pending_.end() || it->second.created_at < oldest->second.created_at) oldest = it;
    }
    if (oldest == pending_.end()) return;
    LOG_ASM_DEBUG("Pending table full ({}), abandoning frame {} ({}/{} chunks missing)",
                  pending_.size(), oldest->first, oldest->second.remaining_count,
                  oldest->second.expected_chunk_count);
    pending_.erase(oldest);
    stats_.frames_evicted++;
}

StartResult FrameReassembler::on_frame_start(uint32_t frame_id, uint32_t total_size, uint32_t chunk_count,
                                             Clock::time_point now) {
    // Basic sanity checks
    if (total_size == 0 || total_size > cfg_.max_frame_bytes) {
        LOG_ASM_WARN("Dropping FRAME_START {}: total_size {} invalid (max {})", frame_id, total_size, cfg_.max_frame_bytes);
        stats_.starts_rejected++;
        return StartResult::Rejected;
    }
    auto plan = framecast::chunk::make_plan(total_size, cfg_.payload_size);
    if (chunk_count != plan.chunk_count) {
        LOG_ASM_WARN("Dropping FRAME_START {}: chunk_count {} does not match {} bytes at payload size {}",
                     frame_id, chunk_count, total_size, cfg_.payload_size);
        stats_.starts_rejected++;
        return StartResult::Rejected;
    }

    StartResult result = StartResult::Started;
    auto it = pending_.find(frame_id);
    if (it != pending_.end()) {
        LOG_ASM_DEBUG("FRAME_START {} while assembling ({}/{} chunks missing): restarting",
                      frame_id, it->second.remaining_count, it->second.expected_chunk_count);
        pending_.erase(it);
        stats_.frames_replaced++;
        result = StartResult::Replaced;
    } else if (pending_.size() >= cfg_.max_pending_frames) {
        evict_oldest();
    }

    PendingFrame pf;
    pf.frame_id = frame_id;
    pf.total_size = total_size;
    pf.expected_chunk_count = chunk_count;
    pf.remaining_count = chunk_count;
    pf.buffer.assign(total_size, 0);
    pf.chunk_received.assign(chunk_count, 0);
    pf.created_at = now;
    pending_.emplace(frame_id, std::move(pf));
    stats_.frames_started++;

    LOG_ASM_TRACE("FRAME_START id={} size={} chunks={} pending={}", frame_id, total_size, chunk_count, pending_.size());
    return result;
}

ChunkResult FrameReassembler::on_chunk(uint32_t frame_id, uint32_t chunk_index, const char *payload, size_t len,
                                       Clock::time_point now, CompletedFrame &out) {
    auto it = pending_.find(frame_id);
    if (it == pending_.end()) {
        // never started, already completed or expired
        LOG_ASM_TRACE("CHUNK for unknown frame {} idx {} dropped", frame_id, chunk_index);
        stats_.chunks_unknown++;
        return ChunkResult::UnknownFrame;
    }

    PendingFrame &pf = it->second;

    // bounds check: index and write window must stay inside this frame's buffer
    size_t offset = (size_t)chunk_index * cfg_.payload_size;
    if (chunk_index >= pf.expected_chunk_count || offset + len > pf.total_size) {
        LOG_ASM_WARN("Dropping chunk: out-of-bounds (frame {} idx {} off {} len {} total {} chunks {})",
                     frame_id, chunk_index, offset, len, pf.total_size, pf.expected_chunk_count);
        stats_.chunks_rejected++;
        return ChunkResult::OutOfRange;
    }

    if (pf.chunk_received[chunk_index]) {
        stats_.chunks_duplicate++;
        return ChunkResult::Duplicate;
    }

    if (len > 0) memcpy(pf.buffer.data() + offset, payload, len);
    pf.chunk_received[chunk_index] = 1;
    pf.remaining_count--;
    stats_.chunks_accepted++;

    LOG_ASM_TRACE("CHUNK frame={} idx={}/{} off={} len={} remaining={}",
                  frame_id, chunk_index, pf.expected_chunk_count, offset, len, pf.remaining_count);

    if (pf.remaining_count > 0) return ChunkResult::Accepted;

    out.frame_id = frame_id;
    out.data = std::move(pf.buffer);
    out.started_at = pf.created_at;
    out.completed_at = now;
    pending_.erase(it);
    stats_.frames_completed++;
    LOG_ASM_DEBUG("Frame {} complete: {} bytes in {} ms", frame_id, out.data.size(), elapsed_ms(out.started_at, now));
    return ChunkResult::Completed;
}

std::optional<CompletedFrame> FrameReassembler::handle_datagram(const char *data, size_t len, Clock::time_point now) {
    ParsedPacket pkt = parse_packet(data, len);
    switch (pkt.type) {
        case PacketType::FRAME_START:
            on_frame_start(pkt.frame_id, pkt.frame_size, pkt.chunk_count, now);
            break;
        case PacketType::CHUNK: {
            CompletedFrame done;
            if (on_chunk(pkt.frame_id, pkt.chunk_index, pkt.payload, pkt.payload_len, now, done) == ChunkResult::Completed) {
                return done;
            }
            break;
        }
        case PacketType::MALFORMED:
            stats_.malformed++;
            LOG_ASM_DEBUG("Malformed datagram ({} bytes) dropped", len);
            break;
        default:
            break;
    }
    return std::nullopt;
}

size_t FrameReassembler::expire_stale(Clock::time_point now) {
    size_t removed = 0;
    for (auto it = pending_.begin(); it != pending_.end();) {
        const PendingFrame &pf = it->second;
        if (now > pf.created_at && now - pf.created_at > cfg_.stale_after) {
            LOG_ASM_DEBUG("Dropping incomplete frame {} age_ms={} missing {}/{} chunks",
                          pf.frame_id, elapsed_ms(pf.created_at, now), pf.remaining_count, pf.expected_chunk_count);
            it = pending_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    stats_.frames_expired += removed;
    return removed;
}

void FrameReassembler::reset() {
    if (!pending_.empty()) {
        LOG_ASM_INFO("Discarding {} pending frame(s)", pending_.size());
    }
    pending_.clear();
}
