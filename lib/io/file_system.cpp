#include "chartok/file_system.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <stdlib.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

#include "chartok/errors.hpp"

namespace chartok {

namespace {

std::string errno_text(int err) { return std::strerror(err); }

[[noreturn]] void throw_io(const std::string& what, const std::string& path,
                           int err) {
  if (err == ENOENT) throw FileNotFoundError(path);
  throw IoError(what + " " + path + " (" + errno_text(err) + ")");
}

void write_all(int fd, const std::string& path, const std::string& content) {
  const char* ptr = content.data();
  size_t remaining = content.size();
  while (remaining > 0) {
    ssize_t written = ::write(fd, ptr, remaining);
    if (written < 0) {
      if (errno == EINTR) continue;
      throw IoError("write failed for " + path + " (" + errno_text(errno) +
                    ")");
    }
    ptr += written;
    remaining -= static_cast<size_t>(written);
  }
}

}  // namespace

bool LocalFileSystem::is_file(const std::string& path) const {
  struct stat st{};
  return !path.empty() && ::stat(path.c_str(), &st) == 0 &&
         S_ISREG(st.st_mode);
}

bool LocalFileSystem::is_directory(const std::string& path) const {
  struct stat st{};
  return !path.empty() && ::stat(path.c_str(), &st) == 0 &&
         S_ISDIR(st.st_mode);
}

void LocalFileSystem::create_directories(const std::string& path) {
  if (path.empty() || is_directory(path)) return;
  const std::string parent = parent_directory(path);
  if (parent != path && parent != ".") create_directories(parent);
  if (::mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
    throw IoError("mkdir failed for " + path + " (" + errno_text(errno) + ")");
  }
}

std::string LocalFileSystem::read_file(const std::string& path) const {
  int fd = ::open(path.c_str(), O_RDONLY);
  if (fd == -1) throw_io("Failed to open", path, errno);

  std::string data;
  std::vector<char> buffer(1 << 16);
  while (true) {
    ssize_t n = ::read(fd, buffer.data(), buffer.size());
    if (n < 0) {
      if (errno == EINTR) continue;
      int err = errno;
      ::close(fd);
      throw IoError("read failed for " + path + " (" + errno_text(err) + ")");
    }
    if (n == 0) break;
    data.append(buffer.data(), static_cast<size_t>(n));
  }
  ::close(fd);
  return data;
}

std::string LocalFileSystem::create_temp_file(const std::string& dir,
                                              const std::string& prefix,
                                              const std::string& suffix) {
  std::string pattern = dir + "/" + prefix + "XXXXXX" + suffix;
  std::vector<char> name(pattern.begin(), pattern.end());
  name.push_back('\0');
  int fd = ::mkstemps(name.data(), static_cast<int>(suffix.size()));
  if (fd == -1) {
    throw IoError("mkstemps failed in " + dir + " (" + errno_text(errno) +
                  ")");
  }
  ::close(fd);
  return std::string(name.data());
}

void LocalFileSystem::write_file(const std::string& path,
                                 const std::string& content) {
  int fd = ::open(path.c_str(), O_WRONLY | O_TRUNC);
  if (fd == -1) throw_io("Failed to open for writing", path, errno);
  try {
    write_all(fd, path, content);
    if (::fsync(fd) != 0) {
      throw IoError("fsync failed for " + path + " (" + errno_text(errno) +
                    ")");
    }
  } catch (...) {
    ::close(fd);
    throw;
  }
  if (::close(fd) != 0) {
    throw IoError("close failed for " + path + " (" + errno_text(errno) +
                  ")");
  }
}

void LocalFileSystem::rename(const std::string& from, const std::string& to) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    throw IoError("rename " + from + " -> " + to + " failed (" +
                  errno_text(errno) + ")");
  }
  // Persist the directory entry as well.
  const std::string dir = parent_directory(to);
  int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd == -1) {
    throw IoError("Failed to open directory " + dir + " (" +
                  errno_text(errno) + ")");
  }
  if (::fsync(fd) != 0) {
    int err = errno;
    ::close(fd);
    throw IoError("fsync failed for directory " + dir + " (" +
                  errno_text(err) + ")");
  }
  ::close(fd);
}

bool LocalFileSystem::remove(const std::string& path) {
  return ::unlink(path.c_str()) == 0;
}

FileSystem& default_file_system() {
  static LocalFileSystem fs;
  return fs;
}

std::string parent_directory(const std::string& path) {
  std::string trimmed = path;
  while (trimmed.size() > 1 && trimmed.back() == '/') trimmed.pop_back();
  const auto slash = trimmed.find_last_of('/');
  if (slash == std::string::npos) return ".";
  if (slash == 0) return "/";
  return trimmed.substr(0, slash);
}

}  // namespace chartok
