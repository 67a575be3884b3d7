#pragma once

#include <string>
#include <utility>
#include <vector>

namespace chartok {

class FileSystem;

/**
 * @class CorpusSource
 * @brief Where the fitting corpus comes from: inline text, one file, or an
 * ordered list of files.
 */
class CorpusSource {
 public:
  enum class Kind { Text, File, Files };

  static CorpusSource text(std::string text);
  static CorpusSource file(std::string path);
  static CorpusSource files(std::vector<std::string> paths);

  // Reads @p text_or_path as a file when it names one, else as inline text.
  static CorpusSource detect(const std::string& text_or_path,
                             const FileSystem& fs);

  Kind kind() const { return kind_; }
  const std::string& inline_text() const { return text_; }
  const std::vector<std::string>& paths() const { return paths_; }

  // Produces the single corpus string; files are joined with '\n'.
  std::string load(const FileSystem& fs) const;

 private:
  CorpusSource(Kind kind, std::string text, std::vector<std::string> paths)
      : kind_(kind), text_(std::move(text)), paths_(std::move(paths)) {}

  Kind kind_;
  std::string text_;
  std::vector<std::string> paths_;
};

}  // namespace chartok
