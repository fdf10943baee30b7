#include "file_io.hpp"
#include <cerrno>
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include "config.hpp"

bool read_lines(const std::filesystem::path& path,
                std::vector<std::string>& out_lines,
                std::string& msg) {
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
  if (S_ISDIR(st.st_mode)) { msg = std::string("is a directory: ") + path.string(); return false; }
  std::vector<std::string> lines;
  size_t n = static_cast<size_t>(st.st_size);
  if (n > 0) {
    void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0);
    if (mem == MAP_FAILED) { msg = std::string("can not mmap file: ") + path.string(); return false; }
    const char* data = static_cast<const char*>(mem);
    (void)::madvise(mem, n, MADV_SEQUENTIAL);
    size_t start = 0;
    for (size_t i = 0; i < n; ++i) {
      if (data[i] != '\n') continue;
      size_t end = i;
      if (end > start && data[end - 1] == '\r') end--;
      lines.emplace_back(data + start, end - start);
      start = i + 1;
    }
    // an unterminated last line still counts
    if (start < n) {
      size_t end = n;
      if (end > start && data[end - 1] == '\r') end--;
      lines.emplace_back(data + start, end - start);
    }
    ::munmap(mem, n);
  }
  out_lines = std::move(lines);
  msg = std::string("opened file: ") + path.string();
  return true;
}

bool write_lines(const std::filesystem::path& path,
                 std::size_t count,
                 const std::function<std::string_view(std::size_t)>& line,
                 std::string& msg) {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) {
    msg = std::string("write file failed: ") + tmp.string();
    return false;
  }
  auto fail = [&](const std::filesystem::path& p) {
    ufd.reset();
    ::unlink(tmp.string().c_str());
    msg = std::string("write file failed: ") + p.string();
    return false;
  };
  auto write_all = [&](const char* p, size_t len) -> bool {
    while (len > 0) {
      ssize_t w = ::write(ufd.get(), p, len);
      if (w < 0) {
        if (errno == EINTR) continue;
        return false;
      }
      p += w;
      len -= static_cast<size_t>(w);
    }
    return true;
  };
  std::string buf;
  buf.reserve(static_cast<size_t>(XED_WRITE_CHUNK_SIZE));
  for (std::size_t i = 0; i < count; ++i) {
    std::string_view s = line(i);
    if (buf.size() + s.size() + 1 > buf.capacity() && !buf.empty()) {
      if (!write_all(buf.data(), buf.size())) return fail(tmp);
      buf.clear();
    }
    if (s.size() + 1 > buf.capacity()) {
      if (!write_all(s.data(), s.size()) || !write_all("\n", 1)) return fail(tmp);
      continue;
    }
    buf.append(s);
    buf.push_back('\n');
  }
  if (!buf.empty() && !write_all(buf.data(), buf.size())) return fail(tmp);
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) return fail(tmp);
#else
  if (::fdatasync(ufd.get()) != 0) return fail(tmp);
#endif
  if (::close(ufd.release()) != 0) return fail(tmp);
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) return fail(path);
  msg = std::string("saved file: ") + path.string();
  return true;
}
