#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>

#include "logger.hpp"
#include "options.hpp"

// Binary streams on local files, IoError when they cannot be opened
std::ifstream openInputFile(const std::string& filename);
std::ofstream openOutputFile(const std::string& filename);

// Length of a local file; IoError if it does not fit the 32 bit size field
uint32_t inputFileSize(const std::string& filename);

// Encode options.input into UF2 frames in options.output
// The output is not touched when the input length does not fit the page size
uint32_t generateFile(const GenerateOptions& options, Logger& logger);

// Concatenate the first frame of every input into options.output
size_t combineFiles(const CombineOptions& options, Logger& logger);
