#include "file_io.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <algorithm>
#include "posix_fd.hpp"
#include "config.hpp"

bool read_file_bytes(const std::filesystem::path& path, std::string& out, std::string& msg) {
  out.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
  if (!S_ISREG(st.st_mode)) { msg = std::string("not a regular file: ") + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) { msg = std::string("opened file: ") + path.string(); return true; }
  void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0);
  if (mem == MAP_FAILED) { msg = std::string("can not mmap file: ") + path.string(); return false; }
  (void)::madvise(mem, n, MADV_SEQUENTIAL);
  out.assign(static_cast<const char*>(mem), n);
  ::munmap(mem, n);
  msg = std::string("opened file: ") + path.string();
  return true;
}

static bool write_all(int fd, const char* p, size_t len) {
  while (len > 0) {
    size_t chunk = std::min(len, static_cast<size_t>(MG_WRITE_CHUNK_SIZE));
    ssize_t w = ::write(fd, p, chunk);
    if (w < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    p += w;
    len -= static_cast<size_t>(w);
  }
  return true;
}

bool write_file_atomic(const std::filesystem::path& path, const std::string& data, std::string& msg) {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  std::error_code ec;
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) {
    msg = std::string("write file failed: ") + tmp.string();
    return false;
  }
  bool ok = write_all(ufd.get(), data.data(), data.size());
#if defined(__APPLE__)
  ok = ok && ::fsync(ufd.get()) == 0;
#else
  ok = ok && ::fdatasync(ufd.get()) == 0;
#endif
  ok = ufd.reset() && ok;
  if (!ok) {
    std::filesystem::remove(tmp, ec);
    msg = std::string("write file failed: ") + tmp.string();
    return false;
  }
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    msg = std::string("write file failed: ") + path.string();
    return false;
  }
  msg = std::string("saved file: ") + path.string();
  return true;
}
