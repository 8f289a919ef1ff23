#pragma once
#include <ostream>
#include <string>

class Logger {
 public:
  Logger(std::ostream& out, bool verbose = false) : out(out), verbose(verbose) {}
  void log(const std::string& stmt);

  // Only written when verbose
  void debug(const std::string& stmt);

  bool isVerbose() const { return verbose; }

 private:
  void write(const char* level, const std::string& stmt);

  std::ostream& out;
  bool verbose;
};
