#include "shared.hpp"

std::string SharedFunctions::commandToStr(Command command) {
  switch (command) {
    case Command::COMBINE:
      return "combine";
    case Command::GENERATE:
      return "generate";
    case Command::HELP:
      return "help";
    default:
      return "INVALID";
  }
}
