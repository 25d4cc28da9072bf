#pragma once

/// \file compression.hpp
/// \brief Decompression of dataset archives into memory.
///
/// The canonical archives are gzip files and are inflated with zlib.
/// Archives recompressed with zstd are recognised by their frame magic and
/// handled by libzstd. Anything carrying neither magic is rejected.

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include <zlib.h>
#include <zstd.h>

#include "mnist/errors.hpp"

namespace mnist {

inline std::vector<std::uint8_t> read_file_bytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw LoadError(ErrorKind::Filesystem, "failed to open " + path);
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                                    std::istreambuf_iterator<char>());
    if (in.bad())
        throw LoadError(ErrorKind::Filesystem, "failed to read " + path);
    return bytes;
}

inline bool is_gzip(const std::vector<std::uint8_t>& data) {
    return data.size() >= 2 && data[0] == 0x1f && data[1] == 0x8b;
}

inline bool is_zstd(const std::vector<std::uint8_t>& data) {
    return data.size() >= 4 && data[0] == 0x28 && data[1] == 0xb5 && data[2] == 0x2f &&
           data[3] == 0xfd;
}

/**
 * @brief Inflate a complete gzip stream held in memory.
 *
 * Concatenated gzip members are decoded back to back as `gunzip` does.
 */
inline std::vector<std::uint8_t> gunzip_bytes(const std::vector<std::uint8_t>& input) {
    std::vector<std::uint8_t> out;
    if (input.empty())
        throw LoadError(ErrorKind::Decompress, "empty gzip stream");

    z_stream zs{};
    // 16 + MAX_WBITS selects the gzip wrapper.
    if (inflateInit2(&zs, 16 + MAX_WBITS) != Z_OK)
        throw LoadError(ErrorKind::Decompress, "failed to initialise zlib");

    zs.next_in = const_cast<Bytef*>(input.data());
    zs.avail_in = static_cast<uInt>(input.size());
    std::uint8_t chunk[16384];
    int rc = Z_OK;
    while (true) {
        zs.next_out = chunk;
        zs.avail_out = sizeof(chunk);
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            std::string msg = zs.msg ? zs.msg : "inflate error " + std::to_string(rc);
            inflateEnd(&zs);
            throw LoadError(ErrorKind::Decompress, "malformed gzip stream: " + msg);
        }
        out.insert(out.end(), chunk, chunk + (sizeof(chunk) - zs.avail_out));
        if (rc == Z_STREAM_END) {
            if (zs.avail_in == 0)
                break;
            // Another gzip member follows.
            if (inflateReset(&zs) != Z_OK) {
                inflateEnd(&zs);
                throw LoadError(ErrorKind::Decompress, "failed to reset zlib stream");
            }
        } else if (zs.avail_in == 0 && zs.avail_out != 0) {
            inflateEnd(&zs);
            throw LoadError(ErrorKind::Decompress, "truncated gzip stream");
        }
    }
    inflateEnd(&zs);
    return out;
}

/// Decode every zstd frame in @p input using the streaming API.
inline std::vector<std::uint8_t> unzstd_bytes(const std::vector<std::uint8_t>& input) {
    std::unique_ptr<ZSTD_DCtx, decltype(&ZSTD_freeDCtx)> dctx{ZSTD_createDCtx(), &ZSTD_freeDCtx};
    if (!dctx)
        throw LoadError(ErrorKind::Decompress, "failed to create zstd context");

    std::vector<std::uint8_t> out;
    std::vector<std::uint8_t> chunk(ZSTD_DStreamOutSize());
    ZSTD_inBuffer in{input.data(), input.size(), 0};
    size_t last = 0;
    while (in.pos < in.size) {
        ZSTD_outBuffer buf{chunk.data(), chunk.size(), 0};
        last = ZSTD_decompressStream(dctx.get(), &buf, &in);
        if (ZSTD_isError(last))
            throw LoadError(ErrorKind::Decompress,
                            std::string("malformed zstd stream: ") + ZSTD_getErrorName(last));
        out.insert(out.end(), chunk.begin(), chunk.begin() + buf.pos);
    }
    // Drain anything still buffered inside the decoder.
    while (last != 0) {
        ZSTD_outBuffer buf{chunk.data(), chunk.size(), 0};
        last = ZSTD_decompressStream(dctx.get(), &buf, &in);
        if (ZSTD_isError(last) || buf.pos == 0)
            throw LoadError(ErrorKind::Decompress, "truncated zstd stream");
        out.insert(out.end(), chunk.begin(), chunk.begin() + buf.pos);
    }
    return out;
}

/// Read a gzip compressed file fully into memory.
inline std::vector<std::uint8_t> read_gzip(const std::string& path) {
    return gunzip_bytes(read_file_bytes(path));
}

/**
 * @brief Read an archive and return its decompressed contents.
 *
 * The format is chosen from the leading magic bytes rather than the file
 * extension. A file that is neither gzip nor zstd, such as an HTML error
 * page saved under an archive name, is a decompression error.
 */
inline std::vector<std::uint8_t> read_archive(const std::string& path) {
    auto raw = read_file_bytes(path);
    if (is_gzip(raw))
        return gunzip_bytes(raw);
    if (is_zstd(raw))
        return unzstd_bytes(raw);
    throw LoadError(ErrorKind::Decompress, path + " is neither a gzip nor a zstd archive");
}

/// Decompress the gzip file at @p in_path into @p out_path.
inline void ungzip(const std::string& in_path, const std::string& out_path) {
    auto data = read_gzip(in_path);
    std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw LoadError(ErrorKind::Filesystem, "failed to create " + out_path);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out)
        throw LoadError(ErrorKind::Filesystem, "failed to write " + out_path);
}

} // namespace mnist
