#pragma once

/// \file fetcher.hpp
/// \brief Download the dataset archives into a local cache directory.
///
/// The cache is the directory itself: an archive that exists on disk is
/// considered fetched and is never downloaded again. Nothing checks its size
/// or contents, so removing a damaged file is the only way to refetch it.

#include <array>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <ostream>
#include <string>
#include <system_error>

#include "mnist/errors.hpp"
#include "mnist/http_client.hpp"

namespace mnist {

/// Default location of the gzip compressed archives.
constexpr const char* kDefaultMnistUrl = "https://raw.githubusercontent.com/fgnt/mnist/master";

/// Names of the four archives making up the dataset.
inline const std::array<std::string, 4>& archive_files() {
    static const std::array<std::string, 4> files{
        "train-images-idx3-ubyte.gz",
        "train-labels-idx1-ubyte.gz",
        "t10k-images-idx3-ubyte.gz",
        "t10k-labels-idx1-ubyte.gz",
    };
    return files;
}

/**
 * @brief Download @p url into @p out_path.
 *
 * The response body is streamed to disk as it arrives. Any status other
 * than 200 after redirects is reported as a transport error. When the
 * download fails the partially written file is removed so it is not
 * mistaken for a cached archive on the next run.
 */
inline void download_file(const std::string& url, const std::string& out_path) {
    std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw LoadError(ErrorKind::Filesystem, "failed to create " + out_path);
    try {
        int status = http_get(url, out);
        if (status != 200)
            throw LoadError(ErrorKind::Transport,
                            "Failed to download file: " + std::to_string(status) + " (" + url + ")");
        out.close();
        if (!out)
            throw LoadError(ErrorKind::Filesystem, "failed to write " + out_path);
    } catch (...) {
        out.close();
        std::error_code ec;
        std::filesystem::remove(out_path, ec);
        throw;
    }
}

/**
 * @brief Make sure every archive exists under @p save_dir.
 *
 * Creates @p save_dir and its parents when needed, then downloads each
 * archive missing from it from `{base_url}/{file}`. Progress messages are
 * written to @p log unless it is null.
 *
 * @return number of archives actually downloaded
 */
inline std::size_t download_files(const std::string& save_dir, const std::string& base_url,
                                  std::ostream* log = &std::cout) {
    std::error_code ec;
    std::filesystem::create_directories(save_dir, ec);
    if (ec)
        throw LoadError(ErrorKind::Filesystem,
                        "failed to create directory " + save_dir + ": " + ec.message());

    std::size_t downloaded = 0;
    for (const auto& file : archive_files()) {
        std::string url = base_url + "/" + file;
        std::string out_path = save_dir + "/" + file;
        bool present = std::filesystem::exists(out_path, ec);
        if (ec)
            throw LoadError(ErrorKind::Filesystem,
                            "failed to check " + out_path + ": " + ec.message());
        if (!present) {
            if (log)
                *log << "Downloading: " << file << "..." << std::endl;
            download_file(url, out_path);
            ++downloaded;
        } else if (log) {
            *log << "File: " << file << std::endl;
        }
    }
    return downloaded;
}

} // namespace mnist
