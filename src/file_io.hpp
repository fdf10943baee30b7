#pragma once
/*
 * FileIO
 *
 * Purpose: whole-file line reading (mmap) and safe line writing.
 * Read: splits on '\n', drops a preceding '\r', no row for the final terminator.
 * Write: every line followed by '\n'; write .tmp → fdatasync → atomic rename.
 * Usage: both return false with msg on failure and leave out_lines/target untouched.
 */
#include <string>
#include <vector>
#include <filesystem>
#include <functional>
#include <string_view>
#include <unistd.h>

class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) reset(other.release());
    return *this;
  }
  ~UniqueFd() { reset(); }
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  int release() { int fd = fd_; fd_ = -1; return fd; }
  void reset(int fd = -1) { if (fd_ >= 0) ::close(fd_); fd_ = fd; }
private:
  int fd_ = -1;
};

bool read_lines(const std::filesystem::path& path,
                std::vector<std::string>& out_lines,
                std::string& msg);

// line(i) yields the raw bytes of line i, for i in [0, count).
bool write_lines(const std::filesystem::path& path,
                 std::size_t count,
                 const std::function<std::string_view(std::size_t)>& line,
                 std::string& msg);
