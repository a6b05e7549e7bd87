#pragma once

#include <string>

namespace rmp {

// Opaque reference to a media resource on local storage
class ResourceLocator {
public:
    ResourceLocator() = default;
    explicit ResourceLocator(std::string path) : m_path(std::move(path)) {}

    // Accepts a plain path or a file:// URL.
    // URL form: empty or "localhost" authority, percent-escapes decoded,
    // query and fragment dropped. Any other host yields an empty locator.
    static ResourceLocator FromString(const std::string& text);

    const std::string& path() const { return m_path; }
    bool empty() const { return m_path.empty(); }

    bool operator==(const ResourceLocator& other) const { return m_path == other.m_path; }
    bool operator!=(const ResourceLocator& other) const { return !(*this == other); }

private:
    std::string m_path;
};

} // namespace rmp
