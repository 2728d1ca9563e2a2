#include "icepack/hex_utils.hpp"
#include <iomanip>
#include <sstream>

namespace icepack {

std::string to_hex(const unsigned char* data, std::size_t len) {
    std::stringstream hex_stream;
    hex_stream << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < len; ++i) {
        hex_stream << std::setw(2) << static_cast<int>(data[i]);
    }
    return hex_stream.str();
}

std::string to_hex(const std::string& s) {
    return to_hex(reinterpret_cast<const unsigned char*>(s.data()), s.size());
}

} // namespace icepack
