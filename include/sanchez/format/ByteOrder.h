// Repository: Sanchez
// Component: Byte Order
// Purpose: Big-endian field writer/reader shared by the container and wire formats.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_FORMAT_BYTE_ORDER_H_
#define SANCHEZ_FORMAT_BYTE_ORDER_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sanchez::format {

// ByteWriter appends big-endian fields to a growing buffer.
class ByteWriter {
 public:
  explicit ByteWriter(std::vector<uint8_t>& out) : out_(out) {}

  void PutU8(uint8_t value) { out_.push_back(value); }

  void PutU16(uint16_t value) {
    out_.push_back(static_cast<uint8_t>(value >> 8));
    out_.push_back(static_cast<uint8_t>(value));
  }

  void PutU32(uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
      out_.push_back(static_cast<uint8_t>(value >> shift));
    }
  }

  void PutU64(uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
      out_.push_back(static_cast<uint8_t>(value >> shift));
    }
  }

  void PutI64(int64_t value) { PutU64(static_cast<uint64_t>(value)); }

  void PutBytes(const uint8_t* data, size_t size) {
    out_.insert(out_.end(), data, data + size);
  }

  // u16 length prefix followed by the bytes; longer strings are truncated.
  void PutString16(const std::string& value) {
    const size_t size = value.size() > 0xFFFF ? 0xFFFF : value.size();
    PutU16(static_cast<uint16_t>(size));
    PutBytes(reinterpret_cast<const uint8_t*>(value.data()), size);
  }

  size_t size() const { return out_.size(); }

 private:
  std::vector<uint8_t>& out_;
};

// ByteReader consumes big-endian fields from a fixed span.
// Every getter returns false once the span is exhausted and leaves the cursor unchanged.
class ByteReader {
 public:
  ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size), pos_(0) {}

  bool GetU8(uint8_t& value) {
    if (remaining() < 1) return false;
    value = data_[pos_++];
    return true;
  }

  bool GetU16(uint16_t& value) {
    if (remaining() < 2) return false;
    value = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
    pos_ += 2;
    return true;
  }

  bool GetU32(uint32_t& value) {
    if (remaining() < 4) return false;
    value = 0;
    for (int i = 0; i < 4; ++i) {
      value = (value << 8) | data_[pos_ + i];
    }
    pos_ += 4;
    return true;
  }

  bool GetU64(uint64_t& value) {
    if (remaining() < 8) return false;
    value = 0;
    for (int i = 0; i < 8; ++i) {
      value = (value << 8) | data_[pos_ + i];
    }
    pos_ += 8;
    return true;
  }

  bool GetI64(int64_t& value) {
    uint64_t raw = 0;
    if (!GetU64(raw)) return false;
    value = static_cast<int64_t>(raw);
    return true;
  }

  bool GetString16(std::string& value) {
    uint16_t size = 0;
    const size_t start = pos_;
    if (!GetU16(size)) return false;
    if (remaining() < size) {
      pos_ = start;
      return false;
    }
    value.assign(reinterpret_cast<const char*>(data_ + pos_), size);
    pos_ += size;
    return true;
  }

  // Copies the rest of the span.
  void GetRemaining(std::vector<uint8_t>& out) {
    out.assign(data_ + pos_, data_ + size_);
    pos_ = size_;
  }

  size_t remaining() const { return size_ - pos_; }
  size_t position() const { return pos_; }
  const uint8_t* cursor() const { return data_ + pos_; }

 private:
  const uint8_t* data_;
  size_t size_;
  size_t pos_;
};

}  // namespace sanchez::format

#endif  // SANCHEZ_FORMAT_BYTE_ORDER_H_
