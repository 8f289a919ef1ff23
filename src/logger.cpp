#include "logger.hpp"

#include <cstdint>
#include <ctime>

void Logger::write(const char *level, const std::string &stmt) {
  auto now = static_cast<uint32_t>(std::time(nullptr));
  out << "[" << now << "] " << level << ": " << stmt << std::endl;
}

void Logger::log(const std::string &stmt) { write("info", stmt); }

void Logger::debug(const std::string &stmt) {
  if (verbose) write("debug", stmt);
}
