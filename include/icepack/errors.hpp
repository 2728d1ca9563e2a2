#pragma once

#include <boost/system/error_code.hpp>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace icepack {

// Failure kinds raised by the transfer engine itself. Local I/O failures use
// errno values in boost::system::generic_category() instead.
enum class errc {
    // validation
    invalid_range = 1,
    file_size_mismatch,
    part_size_mismatch,
    unsupported_file,
    invalid_part_size,
    // integrity
    hashing_failed,
    size_mismatch,
    hash_mismatch,
    short_write,
    // remote state
    unsupported_action,
    job_not_ready,
    job_failed,
    unexpected_status,
    unaligned_range,
    // directory vault bookkeeping
    not_found,
    incomplete_upload,
};

const boost::system::error_category& icepack_category();

boost::system::error_code make_error_code(errc e);

// Exception carrying an error code next to the human-readable message.
// Callers branch on code(), e.g. retry later on errc::job_not_ready.
class Error : public std::runtime_error {
public:
    Error(errc code, const std::string& what);
    Error(boost::system::error_code code, const std::string& what);

    const boost::system::error_code& code() const noexcept { return code_; }

private:
    boost::system::error_code code_;
};

// Builds an Error from the current errno: "<op> <path>: <reason>"
Error io_error(const std::string& op, const std::string& path);

} // namespace icepack

namespace boost {
namespace system {

template <>
struct is_error_code_enum<icepack::errc> : std::true_type {};

} // namespace system
} // namespace boost
