#pragma once

#include <stdexcept>
#include <string>

// Base of every error the tool reports to the user
class Uf2Error : public std::runtime_error {
 public:
  explicit Uf2Error(const std::string& what) : std::runtime_error(what) {}
};

// Failure to open, size, read or write a source or destination
class IoError : public Uf2Error {
 public:
  explicit IoError(const std::string& what) : Uf2Error(what) {}
};

// An input to combine held less than one full frame
class ShortRead : public IoError {
 public:
  explicit ShortRead(const std::string& what) : IoError(what) {}
};

// Source length is not a whole number of device pages
class IncompatibleLength : public Uf2Error {
 public:
  explicit IncompatibleLength(const std::string& what) : Uf2Error(what) {}
};

// Malformed command line
class UsageError : public Uf2Error {
 public:
  explicit UsageError(const std::string& what) : Uf2Error(what) {}
};
