#pragma once

#include <string>
#include <vector>

namespace empire {

std::string to_lower(std::string s);

// Strips leading/trailing ASCII whitespace.
std::string trim_copy(const std::string& s);

// Splits on runs of whitespace; empty tokens are dropped.
std::vector<std::string> split_ws(const std::string& s);

} // namespace empire
