#include "chartok/corpus.hpp"

#include <string>
#include <utility>
#include <vector>

#include "chartok/errors.hpp"
#include "chartok/file_system.hpp"
#include "chartok/utf8.hpp"

namespace chartok {

namespace {

std::string load_text_file(const FileSystem& fs, const std::string& path) {
  return normalize_newlines(fs.read_file(path));
}

}  // namespace

CorpusSource CorpusSource::text(std::string text) {
  return CorpusSource(Kind::Text, std::move(text), {});
}

CorpusSource CorpusSource::file(std::string path) {
  std::vector<std::string> paths;
  paths.push_back(std::move(path));
  return CorpusSource(Kind::File, {}, std::move(paths));
}

CorpusSource CorpusSource::files(std::vector<std::string> paths) {
  return CorpusSource(Kind::Files, {}, std::move(paths));
}

CorpusSource CorpusSource::detect(const std::string& text_or_path,
                                  const FileSystem& fs) {
  if (fs.is_file(text_or_path)) return file(text_or_path);
  return text(text_or_path);
}

std::string CorpusSource::load(const FileSystem& fs) const {
  switch (kind_) {
    case Kind::Text:
      return text_;
    case Kind::File: {
      const std::string& path = paths_.front();
      if (!fs.is_file(path)) {
        throw InvalidInputError("Expected an existing file path, got: '" +
                                path + "'");
      }
      return load_text_file(fs, path);
    }
    case Kind::Files:
      break;
  }

  if (paths_.empty()) {
    throw InvalidInputError("No files provided to build a corpus.");
  }
  // Validate every entry before reading any of them.
  for (size_t i = 0; i < paths_.size(); ++i) {
    if (!fs.is_file(paths_[i])) {
      throw InvalidInputError("Expected file path at index " +
                              std::to_string(i) + ", got: '" + paths_[i] +
                              "'");
    }
  }
  std::string corpus;
  for (size_t i = 0; i < paths_.size(); ++i) {
    if (i > 0) corpus.push_back('\n');
    corpus += load_text_file(fs, paths_[i]);
  }
  return corpus;
}

}  // namespace chartok
