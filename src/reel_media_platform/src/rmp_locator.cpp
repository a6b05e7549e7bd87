#include <reel_media_platform/rmp_locator.h>

namespace rmp {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Malformed escapes are kept literally
std::string percent_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(text[i]);
    }
    return out;
}

} // namespace

ResourceLocator ResourceLocator::FromString(const std::string& text) {
    static const std::string kFileScheme = "file://";
    if (text.compare(0, kFileScheme.size(), kFileScheme) != 0) {
        return ResourceLocator(text);
    }

    std::string rest = text.substr(kFileScheme.size());
    const size_t end = rest.find_first_of("?#");
    if (end != std::string::npos) {
        rest.erase(end);
    }

    const size_t slash = rest.find('/');
    const std::string authority = rest.substr(0, slash);
    if (!authority.empty() && authority != "localhost") {
        return ResourceLocator();
    }
    if (slash == std::string::npos) {
        return ResourceLocator();
    }
    return ResourceLocator(percent_decode(rest.substr(slash)));
}

} // namespace rmp
