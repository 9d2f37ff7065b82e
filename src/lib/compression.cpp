#include "pmtiles.h"

#include <zlib.h>

#include <array>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace pmtiles {

namespace {

struct inflate_deleter {
    void operator()(z_stream *stream) const noexcept {
        if (stream != nullptr) {
            inflateEnd(stream);
        }
    }
};

std::vector<std::byte> gunzip(const std::vector<std::byte> &data) {
    if (data.size() > std::numeric_limits<uInt>::max()) {
        throw decompression_error("Compressed block of " + std::to_string(data.size()) + " bytes is too large");
    }

    z_stream stream{};
    // 15 + 32: accept both gzip and zlib headers
    if (inflateInit2(&stream, 15 + 32) != Z_OK) {
        throw decompression_error("Failed to initialise zlib inflate stream");
    }
    std::unique_ptr<z_stream, inflate_deleter> guard(&stream);

    stream.next_in = reinterpret_cast<Bytef *>(const_cast<std::byte *>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());

    std::vector<std::byte> result;
    result.reserve(data.size() * 4);
    std::array<unsigned char, 16384> chunk{};

    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        stream.next_out = chunk.data();
        stream.avail_out = static_cast<uInt>(chunk.size());
        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc == Z_BUF_ERROR) {
            throw decompression_error("Truncated gzip stream");
        }
        if (rc != Z_OK && rc != Z_STREAM_END) {
            const std::string reason = stream.msg != nullptr ? stream.msg : zError(rc);
            throw decompression_error("Failed to inflate gzip stream: " + reason);
        }
        const std::size_t produced = chunk.size() - stream.avail_out;
        const auto *begin = reinterpret_cast<const std::byte *>(chunk.data());
        result.insert(result.end(), begin, begin + produced);
    }
    return result;
}

}  // namespace

std::vector<std::byte> decompress(const std::vector<std::byte> &data, Compression compression) {
    switch (compression) {
        case Compression::NONE:
            return data;
        case Compression::GZIP:
            return gunzip(data);
        case Compression::UNKNOWN:
        case Compression::BROTLI:
        case Compression::ZSTD:
            break;
    }
    throw decompression_error("Unsupported internal compression: " + to_string(compression));
}

}  // namespace pmtiles
