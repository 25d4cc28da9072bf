#pragma once

#include <stdexcept>
#include <string>

namespace mnist {

/// Broad categories of failures raised while fetching or decoding the dataset.
enum class ErrorKind {
    Transport,  ///< DNS, socket, TLS, HTTP status or redirect failures
    Filesystem, ///< directory creation or file open/read/write failures
    Decompress, ///< malformed gzip or zstd stream
    Corrupt     ///< truncated header or record data inside an archive
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Transport:
        return "transport";
    case ErrorKind::Filesystem:
        return "filesystem";
    case ErrorKind::Decompress:
        return "decompress";
    case ErrorKind::Corrupt:
        return "corrupt";
    }
    return "unknown";
}

/**
 * @brief Exception thrown by every stage of the loader.
 *
 * Only transport failures are worth retrying. A corrupt archive will fail
 * the same way on every attempt until the cached file is removed.
 */
class LoadError : public std::runtime_error {
  public:
    LoadError(ErrorKind kind, const std::string& msg) : std::runtime_error{msg}, kind_{kind} {}

    ErrorKind kind() const noexcept { return kind_; }
    bool is_retryable() const noexcept { return kind_ == ErrorKind::Transport; }

  private:
    ErrorKind kind_{ErrorKind::Transport};
};

} // namespace mnist
