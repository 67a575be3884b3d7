#include <initializer_list>
#include <string>
#include <utility>

#include "chartok/errors.hpp"
#include "chartok/file_system.hpp"
#include "chartok/serialization.hpp"
#include "chartok/tokenizer.hpp"

namespace chartok {

namespace {

constexpr const char* kTempPrefix = ".tmp_tok_";
constexpr const char* kTempSuffix = ".json";

// Owns a temporary file until commit() renames it into place. Any other way
// out of scope removes it.
class ScopedTempFile {
 public:
  ScopedTempFile(FileSystem& fs, const std::string& dir)
      : fs_(fs), path_(fs.create_temp_file(dir, kTempPrefix, kTempSuffix)) {}

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;

  ~ScopedTempFile() {
    if (!committed_) fs_.remove(path_);
  }

  void write(const std::string& content) { fs_.write_file(path_, content); }

  void commit(const std::string& destination) {
    fs_.rename(path_, destination);
    committed_ = true;
  }

 private:
  FileSystem& fs_;
  std::string path_;
  bool committed_ = false;
};

}  // namespace

void CharTokenizer::persist(const std::string& path) const {
  require_fitted("persist");
  if (path.empty()) throw InvalidInputError("persist() needs a file path");

  const std::string content = dump_vocab(state());

  const std::string parent = parent_directory(path);
  if (!fs_->is_directory(parent)) fs_->create_directories(parent);

  ScopedTempFile tmp(*fs_, parent);
  tmp.write(content);
  tmp.commit(path);
}

void CharTokenizer::restore(const std::string& path) {
  if (!fs_->is_file(path)) throw FileNotFoundError(path);

  VocabState loaded = parse_vocab(fs_->read_file(path));
  IdToChar itos = invert(loaded.stoi);
  if (!is_bijection(loaded.stoi, itos)) {
    throw CorruptStateError("Loaded tokenizer has inconsistent stoi/itos.");
  }
  for (const auto& special : {loaded.pad_id, loaded.unk_id}) {
    if (special && itos.find(*special) == itos.end()) {
      throw CorruptStateError("Loaded tokenizer references special id " +
                              std::to_string(*special) +
                              " that is not in 'stoi'.");
    }
  }

  char_to_id_ = std::move(loaded.stoi);
  id_to_char_ = std::move(itos);
  pad_id_ = loaded.pad_id;
  unk_id_ = loaded.unk_id;
}

CharTokenizer CharTokenizer::from_file(const std::string& path) {
  return from_file(path, default_file_system());
}

CharTokenizer CharTokenizer::from_file(const std::string& path,
                                       FileSystem& fs) {
  CharTokenizer tokenizer(fs);
  tokenizer.restore(path);
  return tokenizer;
}

}  // namespace chartok
