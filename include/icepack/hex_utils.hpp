#pragma once

#include <cstddef>
#include <string>

namespace icepack {

// Lowercase hex of raw bytes, two characters per byte
std::string to_hex(const unsigned char* data, std::size_t len);
std::string to_hex(const std::string& s);

} // namespace icepack
