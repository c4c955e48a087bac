#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/util/errors.hpp"

namespace vigil::codec {

/*
  Little-endian field writer for frame payloads.
  Strings and byte blobs carry a length prefix of the stated width.
*/
class WireWriter {
 public:
  void U8(std::uint8_t v) {
    buf_.push_back(v);
  }

  void U16(std::uint16_t v) {
    Put(v, 2);
  }

  void U32(std::uint32_t v) {
    Put(v, 4);
  }

  void U64(std::uint64_t v) {
    Put(v, 8);
  }

  void I64(std::int64_t v) {
    Put(static_cast<std::uint64_t>(v), 8);
  }

  void Raw(const std::uint8_t* data, std::size_t n) {
    buf_.insert(buf_.end(), data, data + n);
  }

  void Str16(std::string_view s, const char* field) {
    if (s.size() > 0xFFFF) {
      throw util::InvalidArgument(std::string(field) + " exceeds 65535 bytes");
    }
    U16(static_cast<std::uint16_t>(s.size()));
    Raw(reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
  }

  void Str32(std::string_view s) {
    U32(static_cast<std::uint32_t>(s.size()));
    Raw(reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
  }

  void Bytes16(const std::vector<std::uint8_t>& b, const char* field) {
    if (b.size() > 0xFFFF) {
      throw util::InvalidArgument(std::string(field) + " exceeds 65535 bytes");
    }
    U16(static_cast<std::uint16_t>(b.size()));
    Raw(b.data(), b.size());
  }

  std::vector<std::uint8_t> Take() {
    return std::move(buf_);
  }

 private:
  void Put(std::uint64_t v, int width) {
    for (int i = 0; i < width; ++i) {
      buf_.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
    }
  }

  std::vector<std::uint8_t> buf_;
};

/*
  Bounds-checked reader over one frame payload. Every read that would
  cross the end of the frame throws DecodeError naming the field.
*/
class WireReader {
 public:
  WireReader(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {
  }

  std::uint8_t U8(const char* field) {
    Need(1, field);
    return data_[pos_++];
  }

  std::uint16_t U16(const char* field) {
    return static_cast<std::uint16_t>(Get(2, field));
  }

  std::uint32_t U32(const char* field) {
    return static_cast<std::uint32_t>(Get(4, field));
  }

  std::uint64_t U64(const char* field) {
    return Get(8, field);
  }

  std::int64_t I64(const char* field) {
    return static_cast<std::int64_t>(Get(8, field));
  }

  void Raw(std::uint8_t* out, std::size_t n, const char* field) {
    Need(n, field);
    for (std::size_t i = 0; i < n; ++i) {
      out[i] = data_[pos_ + i];
    }
    pos_ += n;
  }

  std::string Str16(const char* field) {
    return Text(U16(field), field);
  }

  std::string Str32(const char* field) {
    return Text(U32(field), field);
  }

  std::vector<std::uint8_t> Bytes16(const char* field) {
    const std::size_t n = U16(field);
    Need(n, field);
    std::vector<std::uint8_t> out(data_ + pos_, data_ + pos_ + n);
    pos_ += n;
    return out;
  }

  std::size_t Remaining() const {
    return size_ - pos_;
  }

  void ExpectEnd() const {
    if (pos_ != size_) {
      throw util::DecodeError(std::to_string(size_ - pos_) + " trailing bytes after frame payload");
    }
  }

 private:
  void Need(std::size_t n, const char* field) const {
    if (n > size_ - pos_) {
      throw util::DecodeError(std::string("truncated field ") + field + ": need " + std::to_string(n) + " bytes, have " +
                              std::to_string(size_ - pos_));
    }
  }

  std::uint64_t Get(int width, const char* field) {
    Need(static_cast<std::size_t>(width), field);
    std::uint64_t v = 0;
    for (int i = 0; i < width; ++i) {
      v |= static_cast<std::uint64_t>(data_[pos_ + i]) << (8 * i);
    }
    pos_ += static_cast<std::size_t>(width);
    return v;
  }

  std::string Text(std::size_t n, const char* field) {
    Need(n, field);
    std::string out(reinterpret_cast<const char*>(data_ + pos_), n);
    pos_ += n;
    return out;
  }

  const std::uint8_t* data_;
  std::size_t         size_;
  std::size_t         pos_ = 0;
};

} // namespace vigil::codec
