#pragma once

#include <string>

namespace empire {

// Reads an entire file into a string. Throws std::runtime_error on failure.
//
// Relative paths that do not exist from the working directory are also tried
// against the source tree and its parents, so tests and tools can find
// data/ files no matter where they are launched from.
std::string read_text_file(const std::string& path);

// Writes a string to a file, creating parent directories if needed.
//
// The data goes to a temporary sibling first and is then renamed into place,
// so a crash mid-write never leaves a truncated save behind.
void write_text_file(const std::string& path, const std::string& contents);

// Creates a directory (and parents) if needed; no-op if it exists.
void ensure_dir(const std::string& path);

} // namespace empire
