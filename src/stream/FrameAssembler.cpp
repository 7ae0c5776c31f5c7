// Repository: Sanchez
// Component: Frame Assembler
// Purpose: Reassembles chunked frames in any arrival order with single-parity recovery.
// Copyright (c) 2025 Sanchez

#include "sanchez/stream/FrameAssembler.h"

#include <algorithm>
#include <cstring>
#include <utility>

#include "sanchez/stream/FramePacketizer.h"

namespace sanchez::stream {

size_t FrameAssembler::PendingFrame::ChunkLength(size_t chunk_index) const {
  const size_t begin = chunk_index * chunk_size;
  return std::min<size_t>(chunk_size, stored_length - begin);
}

FrameAssembler::FrameAssembler(size_t max_pending)
    : max_pending_(max_pending > 0 ? max_pending : 1),
      fec_group_size_(0),
      limits_set_(false),
      raw_length_(0),
      max_stored_length_(0),
      anchored_(false),
      next_(0),
      frames_completed_(0),
      frames_dropped_(0),
      parity_recoveries_(0),
      ignored_packets_(0) {}

int64_t FrameAssembler::Unwrap(uint32_t frame_serial) const {
  const int32_t delta = static_cast<int32_t>(frame_serial - static_cast<uint32_t>(next_));
  return next_ + delta;
}

void FrameAssembler::Anchor(uint32_t frame_serial) {
  if (!anchored_) {
    next_ = frame_serial;
    anchored_ = true;
  }
}

void FrameAssembler::SetFrameLimits(size_t raw_length, size_t max_stored_length) {
  limits_set_ = true;
  raw_length_ = raw_length;
  max_stored_length_ = max_stored_length;
}

bool FrameAssembler::WithinLimits(uint32_t raw_length, size_t stored_length) const {
  return !limits_set_ || (raw_length == raw_length_ && stored_length <= max_stored_length_);
}

void FrameAssembler::SetExpectedSerial(uint32_t frame_serial) {
  Anchor(frame_serial);
}

bool FrameAssembler::AddFrame(const FramePayload& frame) {
  Anchor(frame.frame_serial);
  const int64_t key = Unwrap(frame.frame_serial);
  if (key < next_ || frame.data.empty() ||
      !WithinLimits(frame.raw_length, frame.data.size())) {
    ++ignored_packets_;
    return false;
  }

  PendingFrame& entry = pending_[key];
  entry.frame_serial = frame.frame_serial;
  entry.frame_index = frame.frame_index;
  entry.raw_length = frame.raw_length;
  entry.checksum = frame.checksum;
  entry.stored_length = static_cast<uint32_t>(frame.data.size());
  entry.chunk_count = 1;
  entry.chunk_size = 0;
  entry.stored = frame.data;
  entry.have_chunk.assign(1, true);
  entry.chunks_present = 1;
  entry.parity.clear();
  entry.have_parity.clear();
  OnComplete(key);
  return true;
}

bool FrameAssembler::Consistent(const PendingFrame& frame, const ChunkPayload& header) const {
  return frame.chunk_count == header.chunk_count && frame.chunk_size == header.chunk_size &&
         frame.stored_length == header.stored_length &&
         frame.frame_index == header.frame_index && frame.raw_length == header.raw_length &&
         frame.checksum == header.checksum;
}

FrameAssembler::PendingFrame* FrameAssembler::Slot(const ChunkPayload& header) {
  Anchor(header.frame_serial);
  int64_t key = Unwrap(header.frame_serial);
  if (key < next_) {
    return nullptr;
  }

  auto it = pending_.find(key);
  if (it != pending_.end()) {
    return Consistent(it->second, header) ? &it->second : nullptr;
  }

  if (!WithinLimits(header.raw_length, header.stored_length)) {
    return nullptr;
  }

  // chunk_count must be exactly what stored_length needs.
  const uint64_t capacity = static_cast<uint64_t>(header.chunk_size) * header.chunk_count;
  const uint64_t without_last =
      static_cast<uint64_t>(header.chunk_size) * (header.chunk_count - 1u);
  if (capacity < header.stored_length || without_last >= header.stored_length) {
    return nullptr;
  }

  while (pending_.size() >= max_pending_) {
    FinalizeBefore(pending_.begin()->first + 1);
  }
  if (key < next_) {
    return nullptr;
  }

  PendingFrame& entry = pending_[key];
  entry.frame_serial = header.frame_serial;
  entry.frame_index = header.frame_index;
  entry.raw_length = header.raw_length;
  entry.checksum = header.checksum;
  entry.stored_length = header.stored_length;
  entry.chunk_count = header.chunk_count;
  entry.chunk_size = header.chunk_size;
  entry.stored.assign(header.stored_length, 0);
  entry.have_chunk.assign(header.chunk_count, false);
  entry.chunks_present = 0;
  const size_t groups =
      fec_group_size_ > 0 ? (header.chunk_count + fec_group_size_ - 1u) / fec_group_size_ : 0;
  entry.parity.assign(groups, std::vector<uint8_t>());
  entry.have_parity.assign(groups, false);
  return &entry;
}

bool FrameAssembler::AddChunk(const ChunkPayload& chunk) {
  PendingFrame* frame = Slot(chunk);
  if (!frame || chunk.chunk_index >= frame->chunk_count ||
      chunk.data.size() != frame->ChunkLength(chunk.chunk_index)) {
    ++ignored_packets_;
    return false;
  }
  if (frame->have_chunk[chunk.chunk_index]) {
    return true;
  }

  std::memcpy(frame->stored.data() + static_cast<size_t>(chunk.chunk_index) * frame->chunk_size,
              chunk.data.data(), chunk.data.size());
  frame->have_chunk[chunk.chunk_index] = true;
  ++frame->chunks_present;

  if (!frame->complete() && fec_group_size_ > 0) {
    TryRecover(*frame, chunk.chunk_index / fec_group_size_);
  }
  if (frame->complete()) {
    OnComplete(Unwrap(chunk.frame_serial));
  }
  return true;
}

bool FrameAssembler::AddParity(const ChunkPayload& parity) {
  if (fec_group_size_ == 0) {
    ++ignored_packets_;
    return false;
  }
  PendingFrame* frame = Slot(parity);
  if (!frame || parity.chunk_index >= frame->parity.size() ||
      parity.data.size() != frame->chunk_size) {
    ++ignored_packets_;
    return false;
  }
  if (frame->have_parity[parity.chunk_index]) {
    return true;
  }

  frame->parity[parity.chunk_index] = parity.data;
  frame->have_parity[parity.chunk_index] = true;
  TryRecover(*frame, parity.chunk_index);
  if (frame->complete()) {
    OnComplete(Unwrap(parity.frame_serial));
  }
  return true;
}

void FrameAssembler::TryRecover(PendingFrame& frame, size_t group) {
  if (group >= frame.have_parity.size() || !frame.have_parity[group]) {
    return;
  }
  const size_t first = group * fec_group_size_;
  const size_t last = std::min<size_t>(first + fec_group_size_, frame.chunk_count);

  size_t missing = last;
  size_t missing_count = 0;
  for (size_t i = first; i < last; ++i) {
    if (!frame.have_chunk[i]) {
      missing = i;
      ++missing_count;
    }
  }
  if (missing_count != 1) {
    return;
  }

  std::vector<uint8_t> rebuilt = frame.parity[group];
  for (size_t i = first; i < last; ++i) {
    if (i != missing) {
      FramePacketizer::XorInto(rebuilt, frame.stored.data() + i * frame.chunk_size,
                               frame.ChunkLength(i));
    }
  }
  std::memcpy(frame.stored.data() + missing * frame.chunk_size, rebuilt.data(),
              frame.ChunkLength(missing));
  frame.have_chunk[missing] = true;
  ++frame.chunks_present;
  ++parity_recoveries_;
}

void FrameAssembler::OnComplete(int64_t key) {
  FinalizeBefore(key);
  auto it = pending_.find(key);
  if (it == pending_.end()) {
    return;
  }
  Release(it->second);
  pending_.erase(it);
  next_ = key + 1;
}

void FrameAssembler::Release(PendingFrame& frame) {
  AssembledFrame out;
  out.frame_serial = frame.frame_serial;
  out.frame_index = frame.frame_index;
  out.raw_length = frame.raw_length;
  out.checksum = frame.checksum;
  out.stored = std::move(frame.stored);
  completed_.push_back(std::move(out));
  ++frames_completed_;
}

void FrameAssembler::FinalizeBefore(int64_t end) {
  if (end <= next_) {
    return;
  }
  while (!pending_.empty() && pending_.begin()->first < end) {
    auto it = pending_.begin();
    frames_dropped_ += static_cast<uint64_t>(it->first - next_);
    if (it->second.complete()) {
      Release(it->second);
    } else {
      ++frames_dropped_;
    }
    next_ = it->first + 1;
    pending_.erase(it);
  }
  if (end > next_) {
    frames_dropped_ += static_cast<uint64_t>(end - next_);
    next_ = end;
  }
}

void FrameAssembler::Finish(uint32_t frame_serial_end) {
  if (!anchored_) {
    return;
  }
  FinalizeBefore(Unwrap(frame_serial_end));
  Abandon();
}

void FrameAssembler::Abandon() {
  frames_dropped_ += pending_.size();
  pending_.clear();
}

bool FrameAssembler::PopCompleted(AssembledFrame& frame) {
  if (completed_.empty()) {
    return false;
  }
  frame = std::move(completed_.front());
  completed_.pop_front();
  return true;
}

}  // namespace sanchez::stream
