#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace vigil::ring {

/*
  Scoped mapping of a shared memory region.

  The side that creates a named region owns its lifetime and unlinks the
  name on destruction; the other side only maps and unmaps it.
*/
class SharedRegion {
 public:
  static SharedRegion Create(const std::string& name, std::size_t bytes);
  static SharedRegion Open(const std::string& name);
  // Unnamed region for a channel whose both ends live in this process.
  static SharedRegion Anonymous(std::size_t bytes);

  SharedRegion() = default;
  ~SharedRegion();

  SharedRegion(const SharedRegion&)            = delete;
  SharedRegion& operator=(const SharedRegion&) = delete;

  SharedRegion(SharedRegion&& other) noexcept;
  SharedRegion& operator=(SharedRegion&& other) noexcept;

  std::uint8_t* Data() const {
    return base_;
  }

  std::size_t Size() const {
    return size_;
  }

  const std::string& Name() const {
    return name_;
  }

  bool IsOwner() const {
    return owner_;
  }

 private:
  SharedRegion(std::string name, std::uint8_t* base, std::size_t size, bool owner);

  void Release() noexcept;

  std::string   name_;
  std::uint8_t* base_  = nullptr;
  std::size_t   size_  = 0;
  bool          owner_ = false;
};

} // namespace vigil::ring
