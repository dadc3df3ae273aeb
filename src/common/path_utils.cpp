#include "common/path_utils.h"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace rfpos::pathu {

std::string Dirname(const std::string& path) {
  fs::path p(path);
  return p.has_parent_path() ? p.parent_path().string() : std::string(".");
}

std::string Normalize(const std::string& p) {
  return fs::path(p).lexically_normal().string();
}

std::string ResolveHref(const std::string& owner_xml_path,
                        const std::string& base_dir,
                        const std::string& href) {
  fs::path href_p(href);
  if (href_p.is_absolute()) {
    return Normalize(href_p.string());
  }

  fs::path owner_dir = fs::path(Dirname(owner_xml_path));

  if (!base_dir.empty()) {
    // base_dir is relative to the "owner" file's directory
    fs::path base = owner_dir / fs::path(base_dir);
    return Normalize((base / href_p).string());
  }

  return Normalize((owner_dir / href_p).string());
}

bool EnsureDirectory(const std::string& dir) {
  if (dir.empty()) return false;
  std::error_code ec;
  fs::create_directories(fs::path(dir), ec);
  return !ec && fs::is_directory(fs::path(dir), ec);
}

bool EnsureParentDirectory(const std::string& file_path) {
  fs::path p(file_path);
  if (!p.has_parent_path()) return true;
  return EnsureDirectory(p.parent_path().string());
}

} // namespace rfpos::pathu
