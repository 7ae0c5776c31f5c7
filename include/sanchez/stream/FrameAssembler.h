// Repository: Sanchez
// Component: Frame Assembler
// Purpose: Reassembles chunked frames in any arrival order with single-parity recovery.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_STREAM_FRAME_ASSEMBLER_H_
#define SANCHEZ_STREAM_FRAME_ASSEMBLER_H_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <vector>

#include "sanchez/stream/Packet.h"
#include "sanchez/stream/StreamConfig.h"

namespace sanchez::stream {

// A frame whose stored bytes are complete.
struct AssembledFrame {
  uint32_t frame_serial = 0;
  uint32_t frame_index = 0;
  uint32_t raw_length = 0;
  uint32_t checksum = 0;
  std::vector<uint8_t> stored;
};

// FrameAssembler rebuilds frames keyed by frame_serial.
//
// Chunks are placed by chunk_index, so duplicates and any arrival order are
// tolerated. When a group lacks exactly one chunk and its PARITY is present
// the chunk is rebuilt immediately. Frames are released in serial order:
// when a frame completes, every older serial is finalized, and the ones that
// are still incomplete (or were never seen) count as dropped. Packets for
// serials that are already finalized are ignored.
//
// Not thread-safe; owned by one receive loop.
class FrameAssembler {
 public:
  explicit FrameAssembler(size_t max_pending = kMaxPendingFrames);

  // FEC group size announced in CONFIG (0 = no parity expected).
  void SetFecGroupSize(uint16_t fec_group_size) { fec_group_size_ = fec_group_size; }

  // Frame geometry from CONFIG. Once set, packets whose raw_length differs or
  // whose stored_length exceeds max_stored_length are ignored.
  void SetFrameLimits(size_t raw_length, size_t max_stored_length);

  // First serial this receiver is responsible for. Only the first call (or
  // the first packet) anchors the sequence.
  void SetExpectedSerial(uint32_t frame_serial);

  // Each Add* returns false when the packet was ignored (late or inconsistent).
  bool AddFrame(const FramePayload& frame);
  bool AddChunk(const ChunkPayload& chunk);
  bool AddParity(const ChunkPayload& parity);

  // Finalizes every serial before frame_serial_end (END packet).
  void Finish(uint32_t frame_serial_end);

  // Drops everything still pending (session teardown).
  void Abandon();

  // Next completed frame in serial order.
  bool PopCompleted(AssembledFrame& frame);

  uint64_t frames_completed() const { return frames_completed_; }
  uint64_t frames_dropped() const { return frames_dropped_; }
  uint64_t parity_recoveries() const { return parity_recoveries_; }
  uint64_t ignored_packets() const { return ignored_packets_; }
  size_t pending_frames() const { return pending_.size(); }

 private:
  struct PendingFrame {
    uint32_t frame_serial = 0;
    uint32_t frame_index = 0;
    uint32_t raw_length = 0;
    uint32_t checksum = 0;
    uint32_t stored_length = 0;
    uint16_t chunk_count = 0;
    uint16_t chunk_size = 0;
    std::vector<uint8_t> stored;
    std::vector<bool> have_chunk;
    size_t chunks_present = 0;
    std::vector<std::vector<uint8_t>> parity;
    std::vector<bool> have_parity;

    bool complete() const { return chunks_present == chunk_count; }
    size_t ChunkLength(size_t chunk_index) const;
  };

  // Maps a wire serial onto the unbounded local sequence; < next_ means late.
  int64_t Unwrap(uint32_t frame_serial) const;
  void Anchor(uint32_t frame_serial);

  // Looks up or creates the entry; nullptr when the packet must be ignored.
  PendingFrame* Slot(const ChunkPayload& header);
  bool Consistent(const PendingFrame& frame, const ChunkPayload& header) const;
  bool WithinLimits(uint32_t raw_length, size_t stored_length) const;
  void TryRecover(PendingFrame& frame, size_t group);
  void OnComplete(int64_t key);

  // Finalizes all serials < end. Pending entries are dropped unless complete.
  void FinalizeBefore(int64_t end);
  void Release(PendingFrame& frame);

  size_t max_pending_;
  uint16_t fec_group_size_;
  bool limits_set_;
  size_t raw_length_;
  size_t max_stored_length_;
  bool anchored_;
  int64_t next_;  // Smallest unfinalized serial.
  std::map<int64_t, PendingFrame> pending_;
  std::deque<AssembledFrame> completed_;

  uint64_t frames_completed_;
  uint64_t frames_dropped_;
  uint64_t parity_recoveries_;
  uint64_t ignored_packets_;
};

}  // namespace sanchez::stream

#endif  // SANCHEZ_STREAM_FRAME_ASSEMBLER_H_
