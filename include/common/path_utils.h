#pragma once
#include <string>

namespace rfpos::pathu {

// Resolve href relative to base_dir and the directory containing the "owner" xml file.
std::string ResolveHref(const std::string& owner_xml_path,
                        const std::string& base_dir,
                        const std::string& href);

// Return directory portion of a path ("." when there is none).
std::string Dirname(const std::string& path);

// Normalize (lexically) a path.
std::string Normalize(const std::string& p);

// Create a directory (and parents) if missing. Returns false on failure.
bool EnsureDirectory(const std::string& dir);

// Create the parent directory of a file path if missing. Returns false on failure.
bool EnsureParentDirectory(const std::string& file_path);

} // namespace rfpos::pathu
