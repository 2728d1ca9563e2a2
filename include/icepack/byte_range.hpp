#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace icepack {

// Half-open interval [offset, offset + length) of an archive's bytes.
// Text form uses inclusive endpoints: "offset-last".
class ByteRange {
public:
    ByteRange(int64_t offset, int64_t length) : offset_(offset), length_(length) {}

    // Returns std::nullopt unless the text is "<begin>-<end>" with two
    // non-negative decimal integers and begin <= end. Never throws.
    static std::optional<ByteRange> parse(const std::string& text);

    int64_t offset() const { return offset_; }
    int64_t length() const { return length_; }
    int64_t end() const { return offset_ + length_; }
    int64_t last() const { return offset_ + length_ - 1; }

    std::string to_string() const;

    bool operator==(const ByteRange& other) const {
        return offset_ == other.offset_ && length_ == other.length_;
    }

private:
    int64_t offset_;
    int64_t length_;
};

std::ostream& operator<<(std::ostream& os, const ByteRange& range);

} // namespace icepack
