#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace cfg::xmlu {

// Read file into libxml2 document and return opaque pointer as void* to avoid exposing libxml headers here.
void* ReadXmlDocOrThrow(const std::string& xml_path);

// Free a doc returned by ReadXmlDocOrThrow.
void FreeXmlDoc(void* doc);

// Owns a document from ReadXmlDocOrThrow for the lifetime of a scope.
class ScopedXmlDoc {
public:
  explicit ScopedXmlDoc(const std::string& xml_path)
      : doc_(ReadXmlDocOrThrow(xml_path)), path_(xml_path) {}
  ~ScopedXmlDoc() { FreeXmlDoc(doc_); }

  ScopedXmlDoc(const ScopedXmlDoc&) = delete;
  ScopedXmlDoc& operator=(const ScopedXmlDoc&) = delete;

  void* get() const { return doc_; }
  const std::string& path() const { return path_; }

private:
  void* doc_;
  std::string path_;
};

// Return the root element name.
std::string RootName(void* doc);

// Validate doc against an XSD file. Throws on failure.
// Note: requires libxml2 built with schema support (standard for distro packages).
void ValidateOrThrow(void* doc, const std::string& xsd_path, const std::string& xml_path_for_errors);

// Extract helpers (first child element text, attribute, etc.)
// Paths are "Element/Child/Subchild" relative to the root; missing returns empty.
std::string GetText(void* doc, const std::string& path);
std::string GetAttr(void* doc, const std::string& path, const std::string& attr);

// Parse helpers: the default applies only when the element is missing or empty.
// Malformed text throws std::runtime_error naming the path.
double GetDouble(void* doc, const std::string& path, double default_val);
int GetInt(void* doc, const std::string& path, int default_val);
std::uint64_t GetUInt64(void* doc, const std::string& path, std::uint64_t default_val);
bool GetBoolText(void* doc, const std::string& path, bool default_val);

// Return all element nodes matching a simple path, e.g. "Store/Profile" (relative to root).
std::vector<void*> FindNodes(void* doc, const std::string& path);

// Node-scoped helpers
std::string NodeGetAttr(void* node, const std::string& attr);
std::string NodeGetTextChild(void* node, const std::string& child_name);

// Paths relative to a node, e.g. "Sqlite/DbUri".
std::string NodeGetTextPath(void* node, const std::string& path);

} // namespace cfg::xmlu
