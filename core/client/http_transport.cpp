#include "http_transport.hpp"

#include <algorithm>
#include <cctype>

namespace micsync {
namespace client {

bool CaseInsensitiveLess::operator()(const std::string &a, const std::string &b) const {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](unsigned char x, unsigned char y) {
        return std::tolower(x) < std::tolower(y);
    });
}

const char *transport_error_to_string(TransportError error) {
    switch (error) {
        case TransportError::NONE:
            return "none";
        case TransportError::CONNECTION:
            return "connection";
        case TransportError::TIMEOUT:
            return "timeout";
        case TransportError::OTHER:
            return "other";
        default:
            return "other";
    }
}

std::string escape_path_segment(const std::string &segment) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string result;
    result.reserve(segment.size());
    for (unsigned char c : segment) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            result += static_cast<char>(c);
        } else {
            result += '%';
            result += kHex[c >> 4];
            result += kHex[c & 0x0F];
        }
    }
    return result;
}

}  // namespace client
}  // namespace micsync
