#include "cli.hpp"

#include <cerrno>
#include <cstdlib>
#include <exception>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <string>

#include "chartok/corpus.hpp"
#include "chartok/errors.hpp"
#include "chartok/tokenizer.hpp"
#include "chartok/utils.hpp"

namespace chartok::cli {

namespace {

struct Command {
  std::string usage;
  std::string description;
  std::function<int(const Args&, std::ostream&)> action;
};

std::string optional_to_string(const std::optional<TokenId>& id) {
  return id ? std::to_string(*id) : std::string("null");
}

int run_fit(const Args& args, std::ostream& out) {
  const FitRequest request = parse_fit_args(args, fit_config_from_env());
  const FitConfig& config = request.config;

  auto corpus = request.text ? CorpusSource::text(*request.text)
                             : CorpusSource::files(request.files);
  CharTokenizer tokenizer;
  tokenizer.fit(corpus, config.include_specials, config.min_freq);
  tokenizer.persist(request.output);

  if (config.verbose) {
    out << "fitted " << tokenizer.vocab_size() << " tokens (min_freq="
        << config.min_freq << ", specials="
        << (config.include_specials ? "yes" : "no") << ")" << std::endl;
  }
  out << "Saved vocabulary to " << request.output << std::endl;
  return 0;
}

int run_encode(const Args& args, std::ostream& out) {
  const EncodeRequest request = parse_encode_args(args);
  auto tokenizer = CharTokenizer::from_file(request.vocab);
  out << join_token_ids(tokenizer.encode(request.text, request.strict))
      << std::endl;
  return 0;
}

int run_decode(const Args& args, std::ostream& out) {
  const DecodeRequest request = parse_decode_args(args);
  auto tokenizer = CharTokenizer::from_file(request.vocab);
  out << tokenizer.decode(request.ids, request.skip_specials) << std::endl;
  return 0;
}

int run_info(const Args& args, std::ostream& out) {
  if (args.size() != 1) throw UsageError("expected <vocab.json>");
  auto tokenizer = CharTokenizer::from_file(args[0]);
  out << "vocab_size\t" << tokenizer.vocab_size() << "\n"
      << "pad_id\t" << optional_to_string(tokenizer.pad_id()) << "\n"
      << "unk_id\t" << optional_to_string(tokenizer.unk_id()) << std::endl;
  return 0;
}

const std::map<std::string, Command>& commands() {
  static const std::map<std::string, Command> table = {
      {"fit",
       {"<vocab.json> [--text TEXT | FILE...] [--min-freq N] "
        "[--specials | --no-specials]",
        "Build a vocabulary from a corpus and save it", run_fit}},
      {"encode",
       {"<vocab.json> <text> [--strict]", "Print the token ids of a text",
        run_encode}},
      {"decode",
       {"<vocab.json> <id>... [--keep-specials]",
        "Print the text of a token id sequence", run_decode}},
      {"info",
       {"<vocab.json>", "Print vocabulary size and special ids", run_info}},
  };
  return table;
}

void print_usage(std::ostream& out) {
  out << "Usage: chartok <command> [args]\n\nCommands:" << std::endl;
  for (const auto& entry : commands()) {
    out << "  " << entry.first << " " << entry.second.usage << "\n      "
        << entry.second.description << std::endl;
  }
}

}  // namespace

int parse_min_freq(const std::string& value) {
  if (value.empty() ||
      value.find_first_not_of("0123456789") != std::string::npos) {
    throw UsageError("--min-freq expects a non-negative integer, got: '" +
                     value + "'");
  }
  errno = 0;
  const unsigned long long parsed = std::strtoull(value.c_str(), nullptr, 10);
  if (errno == ERANGE ||
      parsed > static_cast<unsigned long long>(
                   std::numeric_limits<int>::max())) {
    throw UsageError("--min-freq is out of range: " + value);
  }
  return static_cast<int>(parsed);
}

FitRequest parse_fit_args(const Args& args, const FitConfig& defaults) {
  FitRequest request;
  request.config = defaults;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--no-specials") {
      request.config.include_specials = false;
    } else if (arg == "--specials") {
      request.config.include_specials = true;
    } else if (arg == "--min-freq" || arg == "--text") {
      if (i + 1 >= args.size()) throw UsageError(arg + " needs a value");
      const std::string& value = args[++i];
      if (arg == "--text") {
        if (request.text) throw UsageError("--text given more than once");
        request.text = value;
      } else {
        request.config.min_freq = parse_min_freq(value);
      }
    } else if (request.output.empty()) {
      request.output = arg;
    } else {
      request.files.push_back(arg);
    }
  }

  if (request.output.empty()) {
    throw UsageError("missing output vocabulary path");
  }
  if (request.text.has_value() == !request.files.empty()) {
    throw UsageError("give either --text TEXT or one or more corpus files");
  }
  return request;
}

EncodeRequest parse_encode_args(const Args& args) {
  EncodeRequest request;
  Args positional;
  for (const auto& arg : args) {
    if (arg == "--strict") {
      request.strict = true;
    } else {
      positional.push_back(arg);
    }
  }
  if (positional.size() != 2) throw UsageError("expected <vocab.json> <text>");
  request.vocab = positional[0];
  request.text = positional[1];
  return request;
}

DecodeRequest parse_decode_args(const Args& args) {
  DecodeRequest request;
  Args positional;
  for (const auto& arg : args) {
    if (arg == "--keep-specials") {
      request.skip_specials = false;
    } else {
      positional.push_back(arg);
    }
  }
  if (positional.empty()) throw UsageError("expected <vocab.json> <id>...");
  request.vocab = positional[0];
  try {
    request.ids =
        parse_token_ids(Args(positional.begin() + 1, positional.end()));
  } catch (const InvalidInputError& e) {
    throw UsageError(e.what());
  }
  return request;
}

int run(const Args& args, std::ostream& out, std::ostream& err) {
  if (args.empty()) {
    print_usage(err);
    return 1;
  }

  const std::string& name = args[0];
  if (name == "--list" || name == "-l") {
    for (const auto& entry : commands()) {
      out << entry.first << '\t' << entry.second.description << std::endl;
    }
    return 0;
  }
  if (name == "--help" || name == "-h") {
    print_usage(out);
    return 0;
  }

  const auto it = commands().find(name);
  if (it == commands().end()) {
    err << "Unknown command: " << name << std::endl;
    print_usage(err);
    return 1;
  }

  try {
    return it->second.action(Args(args.begin() + 1, args.end()), out);
  } catch (const UsageError& e) {
    err << "chartok " << name << ": " << e.what() << "\nUsage: chartok "
        << name << " " << it->second.usage << std::endl;
    return 1;
  } catch (const Error& e) {
    err << "error [" << to_string(e.code()) << "]: " << e.what() << std::endl;
    return 2;
  } catch (const std::exception& e) {
    err << "error: " << e.what() << std::endl;
    return 2;
  }
}

}  // namespace chartok::cli
