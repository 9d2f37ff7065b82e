#include "pmtiles.h"

#include <cstring>
#include <limits>
#include <string>
#include <vector>

namespace pmtiles {

namespace {

constexpr int kMaxVarintLength = 10;

template <class T>
T read_le(const std::vector<std::byte> &data, std::size_t offset) {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<std::uint64_t>(std::to_integer<std::uint8_t>(data[offset + i])) << (8 * i);
    }
    return static_cast<T>(value);
}

std::uint8_t read_u8(const std::vector<std::byte> &data, std::size_t offset) {
    return std::to_integer<std::uint8_t>(data[offset]);
}

std::uint64_t decode_varint(const std::vector<std::byte> &data, std::size_t &pos) {
    std::uint64_t value = 0;
    for (int i = 0; i < kMaxVarintLength; ++i) {
        if (pos >= data.size()) {
            throw directory_parse_error("Directory ends inside a varint");
        }
        const std::uint8_t byte = std::to_integer<std::uint8_t>(data[pos++]);
        value |= static_cast<std::uint64_t>(byte & 0x7fU) << (7 * i);
        if ((byte & 0x80U) == 0) {
            return value;
        }
    }
    throw directory_parse_error("Varint in directory is too long");
}

std::uint32_t decode_u32_varint(const std::vector<std::byte> &data, std::size_t &pos, const char *field) {
    const std::uint64_t value = decode_varint(data, pos);
    if (value > std::numeric_limits<std::uint32_t>::max()) {
        throw directory_parse_error(std::string("Directory entry ") + field + " does not fit in 32 bits");
    }
    return static_cast<std::uint32_t>(value);
}

}  // namespace

Header deserialize_header(const std::vector<std::byte> &data) {
    if (data.size() < kHeaderLength) {
        throw header_parse_error("PMTiles header is truncated (" + std::to_string(data.size()) + " of " +
                                 std::to_string(kHeaderLength) + " bytes)");
    }
    if (std::memcmp(data.data(), "PMTiles", 7) != 0) {
        throw header_parse_error("Invalid PMTiles magic number");
    }
    const std::uint8_t version = read_u8(data, 7);
    if (version != 3) {
        throw header_parse_error("Unsupported PMTiles version " + std::to_string(version) + ", expected 3");
    }

    Header h;
    h.root_dir_offset = read_le<std::uint64_t>(data, 8);
    h.root_dir_length = read_le<std::uint64_t>(data, 16);
    h.json_metadata_offset = read_le<std::uint64_t>(data, 24);
    h.json_metadata_length = read_le<std::uint64_t>(data, 32);
    h.leaf_dirs_offset = read_le<std::uint64_t>(data, 40);
    h.leaf_dirs_length = read_le<std::uint64_t>(data, 48);
    h.tile_data_offset = read_le<std::uint64_t>(data, 56);
    h.tile_data_length = read_le<std::uint64_t>(data, 64);
    h.addressed_tiles_count = read_le<std::uint64_t>(data, 72);
    h.tile_entries_count = read_le<std::uint64_t>(data, 80);
    h.tile_contents_count = read_le<std::uint64_t>(data, 88);
    h.clustered = read_u8(data, 96) == 0x1;
    h.internal_compression = static_cast<Compression>(read_u8(data, 97));
    h.tile_compression = static_cast<Compression>(read_u8(data, 98));
    h.tile_type = static_cast<TileType>(read_u8(data, 99));
    h.min_zoom = read_u8(data, 100);
    h.max_zoom = read_u8(data, 101);
    h.min_lon_e7 = read_le<std::int32_t>(data, 102);
    h.min_lat_e7 = read_le<std::int32_t>(data, 106);
    h.max_lon_e7 = read_le<std::int32_t>(data, 110);
    h.max_lat_e7 = read_le<std::int32_t>(data, 114);
    h.center_zoom = read_u8(data, 118);
    h.center_lon_e7 = read_le<std::int32_t>(data, 119);
    h.center_lat_e7 = read_le<std::int32_t>(data, 123);
    return h;
}

std::vector<Entry> deserialize_directory(const std::vector<std::byte> &data) {
    std::size_t pos = 0;
    const std::uint64_t num_entries = decode_varint(data, pos);
    // each entry takes at least 4 bytes
    if (num_entries > data.size() / 4U) {
        throw directory_parse_error("Directory claims " + std::to_string(num_entries) + " entries in " +
                                    std::to_string(data.size()) + " bytes");
    }

    std::vector<Entry> entries(static_cast<std::size_t>(num_entries));

    std::uint64_t last_id = 0;
    for (auto &entry : entries) {
        const std::uint64_t delta = decode_varint(data, pos);
        if (delta > std::numeric_limits<std::uint64_t>::max() - last_id) {
            throw directory_parse_error("Directory tile id overflows 64 bits");
        }
        entry.tile_id = last_id + delta;
        last_id = entry.tile_id;
    }
    for (auto &entry : entries) {
        entry.run_length = decode_u32_varint(data, pos, "run length");
    }
    for (auto &entry : entries) {
        entry.length = decode_u32_varint(data, pos, "length");
    }
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const std::uint64_t value = decode_varint(data, pos);
        if (i > 0 && value == 0) {
            const Entry &previous = entries[i - 1];
            if (previous.offset > std::numeric_limits<std::uint64_t>::max() - previous.length) {
                throw directory_parse_error("Directory entry offset overflows 64 bits");
            }
            entries[i].offset = previous.offset + previous.length;
        } else if (value == 0) {
            throw directory_parse_error("First directory entry has no explicit offset");
        } else {
            entries[i].offset = value - 1;
        }
    }

    if (pos != data.size()) {
        throw directory_parse_error("Directory has " + std::to_string(data.size() - pos) + " trailing bytes");
    }
    return entries;
}

std::optional<Entry> find_entry(const std::vector<Entry> &entries, std::uint64_t tile_id) {
    std::ptrdiff_t m = 0;
    std::ptrdiff_t n = static_cast<std::ptrdiff_t>(entries.size()) - 1;
    while (m <= n) {
        const std::ptrdiff_t k = (n + m) >> 1;
        if (tile_id > entries[k].tile_id) {
            m = k + 1;
        } else if (tile_id < entries[k].tile_id) {
            n = k - 1;
        } else {
            return entries[k];
        }
    }

    // n is now the last entry with tile_id below the target
    if (n >= 0) {
        const Entry &candidate = entries[n];
        if (candidate.run_length == 0) {
            return candidate;
        }
        if (tile_id - candidate.tile_id < candidate.run_length) {
            return candidate;
        }
    }
    return std::nullopt;
}

}  // namespace pmtiles
