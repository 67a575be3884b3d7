#pragma once

#include <string>

namespace chartok {

/**
 * @class FileSystem
 * @brief File access used by corpus loading and vocabulary persistence.
 *
 * Failures are reported as FileNotFoundError or IoError. remove() is the only
 * best-effort operation: it reports success instead of throwing so it can be
 * used on cleanup paths.
 */
class FileSystem {
 public:
  virtual ~FileSystem() = default;

  virtual bool is_file(const std::string& path) const = 0;
  virtual bool is_directory(const std::string& path) const = 0;
  virtual void create_directories(const std::string& path) = 0;

  virtual std::string read_file(const std::string& path) const = 0;

  /**
   * @brief Creates a new, empty, uniquely named file in @p dir.
   * @return Path of the created file.
   */
  virtual std::string create_temp_file(const std::string& dir,
                                       const std::string& prefix,
                                       const std::string& suffix) = 0;

  // Replaces the full content of an existing file and flushes it to disk.
  virtual void write_file(const std::string& path,
                          const std::string& content) = 0;

  // Atomically replaces @p to with @p from.
  virtual void rename(const std::string& from, const std::string& to) = 0;

  virtual bool remove(const std::string& path) = 0;
};

// POSIX implementation.
class LocalFileSystem : public FileSystem {
 public:
  bool is_file(const std::string& path) const override;
  bool is_directory(const std::string& path) const override;
  void create_directories(const std::string& path) override;
  std::string read_file(const std::string& path) const override;
  std::string create_temp_file(const std::string& dir,
                               const std::string& prefix,
                               const std::string& suffix) override;
  void write_file(const std::string& path,
                  const std::string& content) override;
  void rename(const std::string& from, const std::string& to) override;
  bool remove(const std::string& path) override;
};

FileSystem& default_file_system();

// Directory part of @p path, "." when it has none.
std::string parent_directory(const std::string& path);

}  // namespace chartok
