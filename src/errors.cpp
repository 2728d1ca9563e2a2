#include "icepack/errors.hpp"
#include <cerrno>

namespace icepack {

namespace {

class IcepackCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "icepack"; }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
        case errc::invalid_range: return "invalid byte range";
        case errc::file_size_mismatch: return "file size mismatch";
        case errc::part_size_mismatch: return "part size mismatch";
        case errc::unsupported_file: return "unsupported file type";
        case errc::invalid_part_size: return "part size must be positive";
        case errc::hashing_failed: return "could not compute tree hash";
        case errc::size_mismatch: return "size mismatch";
        case errc::hash_mismatch: return "hash mismatch";
        case errc::short_write: return "short write";
        case errc::unsupported_action: return "unsupported job action";
        case errc::job_not_ready: return "job not succeeded yet";
        case errc::job_failed: return "job failed";
        case errc::unexpected_status: return "unexpected job status";
        case errc::unaligned_range: return "range is not tree-hash aligned";
        case errc::not_found: return "no such resource";
        case errc::incomplete_upload: return "multipart upload is incomplete";
        }
        return "unknown icepack error";
    }
};

} // namespace

const boost::system::error_category& icepack_category() {
    static IcepackCategory category;
    return category;
}

boost::system::error_code make_error_code(errc e) {
    return boost::system::error_code(static_cast<int>(e), icepack_category());
}

Error::Error(errc code, const std::string& what)
    : std::runtime_error(what), code_(make_error_code(code)) {}

Error::Error(boost::system::error_code code, const std::string& what)
    : std::runtime_error(what), code_(code) {}

Error io_error(const std::string& op, const std::string& path) {
    boost::system::error_code ec(errno, boost::system::generic_category());
    return Error(ec, op + " " + path + ": " + ec.message());
}

} // namespace icepack
