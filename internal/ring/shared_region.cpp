#include "shared_region.hpp"

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

namespace vigil::ring {

namespace {

[[noreturn]] void ThrowErrno(const std::string& what) {
  throw std::system_error(errno, std::generic_category(), what);
}

std::uint8_t* MapFd(int fd, std::size_t bytes, const std::string& name) {
  void* ptr = mmap(nullptr, bytes, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
  if (ptr == MAP_FAILED) {
    const int err = errno;
    ::close(fd);
    errno = err;
    ThrowErrno("mmap " + name);
  }
  return static_cast<std::uint8_t*>(ptr);
}

} // namespace

SharedRegion::SharedRegion(std::string name, std::uint8_t* base, std::size_t size, bool owner)
    : name_(std::move(name)), base_(base), size_(size), owner_(owner) {
}

SharedRegion SharedRegion::Create(const std::string& name, std::size_t bytes) {
  int fd = shm_open(name.c_str(), O_CREAT | O_RDWR, 0600);
  if (fd < 0) {
    ThrowErrno("shm_open create " + name);
  }

  if (ftruncate(fd, static_cast<off_t>(bytes)) != 0) {
    const int err = errno;
    ::close(fd);
    shm_unlink(name.c_str());
    errno = err;
    ThrowErrno("ftruncate " + name);
  }

  auto* base = MapFd(fd, bytes, name);
  ::close(fd);

  std::memset(base, 0, bytes);
  return SharedRegion(name, base, bytes, true);
}

SharedRegion SharedRegion::Open(const std::string& name) {
  int fd = shm_open(name.c_str(), O_RDWR, 0600);
  if (fd < 0) {
    ThrowErrno("shm_open " + name);
  }

  struct stat st {};
  if (fstat(fd, &st) != 0) {
    const int err = errno;
    ::close(fd);
    errno = err;
    ThrowErrno("fstat " + name);
  }

  const auto bytes = static_cast<std::size_t>(st.st_size);
  auto*      base  = MapFd(fd, bytes, name);
  ::close(fd);
  return SharedRegion(name, base, bytes, false);
}

SharedRegion SharedRegion::Anonymous(std::size_t bytes) {
  void* ptr = mmap(nullptr, bytes, PROT_READ | PROT_WRITE, MAP_SHARED | MAP_ANONYMOUS, -1, 0);
  if (ptr == MAP_FAILED) {
    ThrowErrno("mmap anonymous");
  }
  return SharedRegion({}, static_cast<std::uint8_t*>(ptr), bytes, true);
}

SharedRegion::~SharedRegion() {
  Release();
}

SharedRegion::SharedRegion(SharedRegion&& other) noexcept
    : name_(std::move(other.name_)), base_(std::exchange(other.base_, nullptr)), size_(std::exchange(other.size_, 0)),
      owner_(std::exchange(other.owner_, false)) {
}

SharedRegion& SharedRegion::operator=(SharedRegion&& other) noexcept {
  if (this != &other) {
    Release();
    name_  = std::move(other.name_);
    base_  = std::exchange(other.base_, nullptr);
    size_  = std::exchange(other.size_, 0);
    owner_ = std::exchange(other.owner_, false);
  }
  return *this;
}

void SharedRegion::Release() noexcept {
  if (base_) {
    munmap(base_, size_);
  }
  if (owner_ && !name_.empty()) {
    shm_unlink(name_.c_str());
  }
  base_  = nullptr;
  size_  = 0;
  owner_ = false;
  name_.clear();
}

} // namespace vigil::ring
