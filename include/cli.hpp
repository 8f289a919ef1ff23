#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "options.hpp"
#include "shared.hpp"

struct CliOptions {
  Command command = Command::HELP;
  bool verbose = false;
  GenerateOptions generate;
  CombineOptions combine;
};

// Parse argv (without the program name), throws UsageError
CliOptions parseArgs(const std::vector<std::string>& args);

// Decimal, or hexadecimal with a 0x prefix
uint32_t parseU32(const std::string& value, const std::string& flag);

std::string usage();

// Runs one command line and returns the process exit status:
// 0 on success, 1 on a failed command, 2 on a usage error
int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
