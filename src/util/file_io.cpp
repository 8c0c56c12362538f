#include "empire/util/file_io.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace empire {

namespace {

namespace fs = std::filesystem;

fs::path make_temp_sibling_path(const fs::path& target) {
  const auto dir = target.parent_path();
  const std::string base = target.filename().string();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();

  for (int attempt = 0; attempt < 100; ++attempt) {
    std::string name = base + ".tmp." + std::to_string(now);
    if (attempt > 0) name += "." + std::to_string(attempt);
    fs::path candidate = dir.empty() ? fs::path(name) : (dir / name);
    std::error_code ec;
    if (!fs::exists(candidate, ec) && !ec) return candidate;
  }

  std::string name = base + ".tmp." + std::to_string(now);
  return dir.empty() ? fs::path(name) : (dir / name);
}

// Removes the temp file unless the rename succeeded.
struct TempFileCleanup {
  fs::path path;
  bool active{true};
  explicit TempFileCleanup(fs::path p) : path(std::move(p)) {}
  ~TempFileCleanup() {
    if (!active) return;
    std::error_code ec;
    fs::remove(path, ec);
  }
  void release() { active = false; }
};

fs::path resolve_existing_read_path(const fs::path& requested) {
  if (requested.empty() || requested.is_absolute()) return requested;

  std::error_code ec;
  if (fs::exists(requested, ec) && !ec) return requested;

  std::vector<fs::path> roots;
#ifdef EMPIRE_SOURCE_DIR
  roots.emplace_back(EMPIRE_SOURCE_DIR);
#endif

  ec.clear();
  fs::path cur = fs::current_path(ec);
  if (!ec && !cur.empty()) {
    for (int depth = 0; depth < 8; ++depth) {
      roots.push_back(cur);
      const auto parent = cur.parent_path();
      if (parent.empty() || parent == cur) break;
      cur = parent;
    }
  }

  for (const auto& root : roots) {
    ec.clear();
    const auto candidate = root / requested;
    if (fs::exists(candidate, ec) && !ec) return candidate;
  }
  return requested;
}

} // namespace

std::string read_text_file(const std::string& path) {
  const fs::path requested(path);
  const fs::path resolved = resolve_existing_read_path(requested);

  std::ifstream in(resolved, std::ios::in | std::ios::binary);
  if (!in) {
    if (resolved != requested) {
      throw std::runtime_error("Failed to open file for reading: " + path + " (resolved to: " +
                               resolved.string() + ")");
    }
    throw std::runtime_error("Failed to open file for reading: " + path);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void ensure_dir(const std::string& path) {
  if (path.empty()) return;
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) throw std::runtime_error("Failed to create directory: " + path + " (" + ec.message() + ")");
}

void write_text_file(const std::string& path, const std::string& contents) {
  const fs::path p(path);
  if (p.has_parent_path()) ensure_dir(p.parent_path().string());

  const fs::path tmp = make_temp_sibling_path(p);
  TempFileCleanup cleanup(tmp);

  {
    std::ofstream out(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + tmp.string());
    out << contents;
    out.flush();
    if (!out) throw std::runtime_error("Failed to write file: " + tmp.string());
  }

  std::error_code ec;
  fs::rename(tmp, p, ec);
  if (ec) {
    // Windows rename does not replace an existing file.
    std::error_code rm_ec;
    fs::remove(p, rm_ec);
    ec.clear();
    fs::rename(tmp, p, ec);
  }
  if (ec) throw std::runtime_error("Failed to replace file: " + path + " (" + ec.message() + ")");

  cleanup.release();
}

} // namespace empire
