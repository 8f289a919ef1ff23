#include "cli.hpp"

#include <cctype>
#include <exception>
#include <limits>
#include <stdexcept>

#include "errors.hpp"
#include "file_io.hpp"
#include "logger.hpp"

namespace {

// Splits "--name=value" and fetches the value of "--name value" / "-n value"
class ArgCursor {
 public:
  explicit ArgCursor(const std::vector<std::string>& args) : args_(args), pos_(0) {}

  bool done() const { return pos_ >= args_.size(); }
  const std::string& peek() const { return args_[pos_]; }
  std::string next() { return args_[pos_++]; }

  // True if arg names the option, value is filled from "=" or the next argument
  bool option(const std::string& arg, const std::string& short_name, const std::string& long_name,
              std::string& value) {
    if (arg == short_name || arg == long_name) {
      if (done()) throw UsageError("Missing value for " + long_name);
      value = next();
      return true;
    }
    if (arg.rfind(long_name + "=", 0) == 0) {
      value = arg.substr(long_name.size() + 1);
      return true;
    }
    return false;
  }

 private:
  const std::vector<std::string>& args_;
  size_t pos_;
};

bool isHelp(const std::string& arg) { return arg == "-h" || arg == "--help"; }

void parseGenerate(ArgCursor& cursor, CliOptions& options) {
  bool page_size_set = false;
  std::string value;
  while (!cursor.done()) {
    std::string arg = cursor.next();
    if (isHelp(arg)) {
      options.command = Command::HELP;
      return;
    } else if (cursor.option(arg, "-i", "--input", value)) {
      options.generate.input = value;
    } else if (cursor.option(arg, "-o", "--output", value)) {
      options.generate.output = value;
    } else if (cursor.option(arg, "-p", "--page-size", value)) {
      options.generate.page_size = parseU32(value, "--page-size");
      page_size_set = true;
    } else if (cursor.option(arg, "-f", "--family", value)) {
      options.generate.family = parseU32(value, "--family");
    } else {
      throw UsageError("Unexpected argument for generate: " + arg);
    }
  }

  if (options.generate.input.empty()) throw UsageError("generate requires --input");
  if (options.generate.output.empty()) throw UsageError("generate requires --output");
  if (page_size_set && options.generate.page_size == 0)
    throw UsageError("--page-size must be at least 1");
}

void parseCombine(ArgCursor& cursor, CliOptions& options) {
  std::string value;
  while (!cursor.done()) {
    std::string arg = cursor.next();
    if (isHelp(arg)) {
      options.command = Command::HELP;
      return;
    } else if (cursor.option(arg, "-o", "--output", value)) {
      options.combine.output = value;
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw UsageError("Unexpected option for combine: " + arg);
    } else {
      options.combine.inputs.push_back(arg);
    }
  }

  if (options.combine.output.empty()) throw UsageError("combine requires --output");
}

}  // namespace

uint32_t parseU32(const std::string& value, const std::string& flag) {
  std::string digits = value;
  int base = 10;
  if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
    digits = digits.substr(2);
    base = 16;
  }

  if (digits.empty()) throw UsageError("Invalid value for " + flag + ": '" + value + "'");
  for (char c : digits) {
    bool ok = base == 16 ? std::isxdigit(static_cast<unsigned char>(c))
                         : std::isdigit(static_cast<unsigned char>(c));
    if (!ok) throw UsageError("Invalid value for " + flag + ": '" + value + "'");
  }

  unsigned long long parsed = 0;
  try {
    parsed = std::stoull(digits, nullptr, base);
  } catch (const std::out_of_range&) {
    throw UsageError("Value for " + flag + " out of range: " + value);
  }
  if (parsed > std::numeric_limits<uint32_t>::max())
    throw UsageError("Value for " + flag + " out of range: " + value);

  return static_cast<uint32_t>(parsed);
}

CliOptions parseArgs(const std::vector<std::string>& args) {
  CliOptions options;
  ArgCursor cursor(args);

  while (!cursor.done() && !cursor.peek().empty() && cursor.peek()[0] == '-') {
    std::string arg = cursor.next();
    if (arg == "-v" || arg == "--verbose") {
      options.verbose = true;
    } else if (isHelp(arg)) {
      options.command = Command::HELP;
      return options;
    } else {
      throw UsageError("Unknown option: " + arg);
    }
  }

  if (cursor.done()) throw UsageError("Missing command");

  std::string command = cursor.next();
  if (command == "generate") {
    options.command = Command::GENERATE;
    parseGenerate(cursor, options);
  } else if (command == "combine") {
    options.command = Command::COMBINE;
    parseCombine(cursor, options);
  } else if (command == "help") {
    options.command = Command::HELP;
  } else {
    throw UsageError("Unknown command: " + command);
  }

  return options;
}

std::string usage() {
  return "uf2tool: convert raw firmware images to UF2 and combine UF2 blocks\n"
         "Usage:\n"
         "  uf2tool [-v] generate -i|--input <file> -o|--output <file>\n"
         "                        [-p|--page-size N] [-f|--family ID]\n"
         "  uf2tool [-v] combine -o|--output <file> <input>...\n"
         "  uf2tool help\n"
         "Options:\n"
         "  -p, --page-size N   device page size in bytes (default 1, >476 treated as 1)\n"
         "  -f, --family ID     family id stored in every block (decimal or 0x hex)\n"
         "  -v, --verbose       log every block\n"
         "Examples:\n"
         "  uf2tool generate -i firmware.bin -o firmware.uf2 --page-size 256 --family 0xe48bff56\n"
         "  uf2tool combine -o all.uf2 block0.uf2 block1.uf2\n";
}

int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
  CliOptions options;
  try {
    options = parseArgs(args);
  } catch (const UsageError& e) {
    err << "error: " << e.what() << "\n\n" << usage();
    return 2;
  }

  if (options.command == Command::HELP) {
    out << usage();
    return 0;
  }

  Logger logger{out, options.verbose};
  logger.debug("Running " + SharedFunctions::commandToStr(options.command));

  try {
    switch (options.command) {
      case Command::GENERATE:
        generateFile(options.generate, logger);
        break;
      case Command::COMBINE:
        combineFiles(options.combine, logger);
        break;
      case Command::HELP:
        break;
    }
  } catch (const std::exception& e) {
    err << "error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
