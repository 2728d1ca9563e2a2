#include "icepack/byte_range.hpp"
#include <cctype>
#include <limits>

namespace icepack {

namespace {

// Strict non-negative decimal, no sign, no whitespace, no overflow
bool parse_offset(const std::string& s, int64_t& out) {
    if (s.empty()) {
        return false;
    }
    int64_t value = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        int digit = c - '0';
        if (value > (std::numeric_limits<int64_t>::max() - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

} // namespace

std::optional<ByteRange> ByteRange::parse(const std::string& text) {
    size_t dash = text.find('-');
    if (dash == std::string::npos || text.find('-', dash + 1) != std::string::npos) {
        return std::nullopt;
    }

    int64_t begin = 0;
    int64_t end = 0;
    if (!parse_offset(text.substr(0, dash), begin) || !parse_offset(text.substr(dash + 1), end)) {
        return std::nullopt;
    }
    if (end < begin || end == std::numeric_limits<int64_t>::max()) {
        return std::nullopt;
    }

    return ByteRange(begin, end - begin + 1);
}

std::string ByteRange::to_string() const {
    return std::to_string(offset_) + "-" + std::to_string(last());
}

std::ostream& operator<<(std::ostream& os, const ByteRange& range) {
    return os << range.to_string();
}

} // namespace icepack
