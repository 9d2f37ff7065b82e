#ifndef PMTILES_H
#define PMTILES_H
#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pmtiles {

class pmtiles_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The fixed 127-byte header is truncated, has a bad magic/version or points
// outside the archive.
class header_parse_error : public pmtiles_error {
public:
    using pmtiles_error::pmtiles_error;
};

// A read against the byte source failed. The original failure is nested.
class archive_read_error : public pmtiles_error {
public:
    using pmtiles_error::pmtiles_error;
};

class decompression_error : public pmtiles_error {
public:
    using pmtiles_error::pmtiles_error;
};

class invalid_tile_id : public pmtiles_error {
public:
    using pmtiles_error::pmtiles_error;
};

class directory_parse_error : public pmtiles_error {
public:
    using pmtiles_error::pmtiles_error;
};

// Raised by byte sources on short reads, out-of-range access or use after close.
class io_error : public pmtiles_error {
public:
    using pmtiles_error::pmtiles_error;
};

struct ExtractOptions {
    ExtractOptions(const std::string& output_directory = ".",
        const std::string& pattern = "{z}/{x}/{y}.{ext}") :
        output_directory(output_directory), pattern(pattern) {}
    std::string output_directory;
    std::string pattern;
};


enum class LogLevel {
    Trace,
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

class Logger {
public:
    static void set_level(LogLevel level);
    static LogLevel level();

private:
    struct Impl;
    static Impl &impl();
};


enum class Compression : std::uint8_t {
    UNKNOWN = 0,
    NONE = 1,
    GZIP = 2,
    BROTLI = 3,
    ZSTD = 4,
};

enum class TileType : std::uint8_t {
    UNKNOWN = 0,
    MVT = 1,
    PNG = 2,
    JPEG = 3,
    WEBP = 4,
    AVIF = 5,
};

std::string to_string(Compression compression);
std::string to_string(TileType tile_type);

// File extension (without dot) used when writing tiles of this type to disk.
std::string tile_type_extension(TileType tile_type);

constexpr std::size_t kHeaderLength = 127;
constexpr int kMaxDirectoryDepth = 4;
constexpr std::uint8_t kMaxZoom = 31;

struct Header {
    std::uint64_t root_dir_offset = 0;
    std::uint64_t root_dir_length = 0;
    std::uint64_t json_metadata_offset = 0;
    std::uint64_t json_metadata_length = 0;
    std::uint64_t leaf_dirs_offset = 0;
    std::uint64_t leaf_dirs_length = 0;
    std::uint64_t tile_data_offset = 0;
    std::uint64_t tile_data_length = 0;
    std::uint64_t addressed_tiles_count = 0;
    std::uint64_t tile_entries_count = 0;
    std::uint64_t tile_contents_count = 0;
    bool clustered = false;
    Compression internal_compression = Compression::UNKNOWN;
    Compression tile_compression = Compression::UNKNOWN;
    TileType tile_type = TileType::UNKNOWN;
    std::uint8_t min_zoom = 0;
    std::uint8_t max_zoom = 0;
    std::int32_t min_lon_e7 = 0;
    std::int32_t min_lat_e7 = 0;
    std::int32_t max_lon_e7 = 0;
    std::int32_t max_lat_e7 = 0;
    std::uint8_t center_zoom = 0;
    std::int32_t center_lon_e7 = 0;
    std::int32_t center_lat_e7 = 0;

    // Bounds and center in degrees
    double lonMin() const;
    double latMin() const;
    double lonMax() const;
    double latMax() const;
    double centerLon() const;
    double centerLat() const;
};

// A directory entry. run_length == 0 marks a pointer to a leaf directory,
// otherwise run_length consecutive tile ids share the same tile data.
struct Entry {
    std::uint64_t tile_id = 0;
    std::uint64_t offset = 0;
    std::uint32_t length = 0;
    std::uint32_t run_length = 0;

    bool isLeaf() const { return run_length == 0; }
};

struct TileCoord {
    std::uint8_t z = 0;
    std::uint32_t x = 0;
    std::uint32_t y = 0;
};

inline bool operator==(const TileCoord &lhs, const TileCoord &rhs) {
    return lhs.z == rhs.z && lhs.x == rhs.x && lhs.y == rhs.y;
}

inline bool operator!=(const TileCoord &lhs, const TileCoord &rhs) {
    return !(lhs == rhs);
}

// Hilbert tile id: ids of zoom z start at (4^z - 1) / 3, so ids of all zoom
// levels form one ascending sequence. Both throw invalid_tile_id outside
// zoom 0..31.
std::uint64_t zxy_to_tileid(int z, std::uint32_t x, std::uint32_t y);
TileCoord tileid_to_zxy(std::uint64_t tile_id);

Header deserialize_header(const std::vector<std::byte> &data);

// Takes an uncompressed directory buffer.
std::vector<Entry> deserialize_directory(const std::vector<std::byte> &data);

// Exact match first, then the closest preceding entry if it is a leaf pointer
// or its run covers tile_id.
std::optional<Entry> find_entry(const std::vector<Entry> &entries, std::uint64_t tile_id);


using Decompressor =
    std::function<std::vector<std::byte>(const std::vector<std::byte> &, Compression)>;

// NONE returns the input unchanged, GZIP is inflated with zlib. Other
// compressions throw decompression_error.
std::vector<std::byte> decompress(const std::vector<std::byte> &data, Compression compression);


class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Returns exactly length bytes or throws io_error.
    virtual std::vector<std::byte> read_at(std::uint64_t offset, std::uint32_t length) = 0;
    virtual std::uint64_t size() const = 0;
    virtual void close() = 0;
};

class FileByteSource : public ByteSource {
public:
    explicit FileByteSource(const std::string &path);
    ~FileByteSource() override;

    std::vector<std::byte> read_at(std::uint64_t offset, std::uint32_t length) override;
    std::uint64_t size() const override;
    void close() override;

private:
    std::string _path;
    std::ifstream _file;
    std::uint64_t _size = 0;
    std::mutex _mutex;
};

class MemoryByteSource : public ByteSource {
public:
    explicit MemoryByteSource(std::vector<std::byte> data);

    std::vector<std::byte> read_at(std::uint64_t offset, std::uint32_t length) override;
    std::uint64_t size() const override;
    void close() override;

private:
    std::vector<std::byte> _data;
    bool _closed = false;
};


struct TileInfo {
    int zoom = 0;
    int x = 0;
    int y = 0;
    std::vector<std::byte> data;  // tile bytes as stored, still tile-compressed
    std::string extension;        // "mvt", "png", "jpg", "webp", ...

    // Compute latitude/longitude bounds on demand (no storage overhead)
    double latMin() const;
    double latMax() const;
    double lonMin() const;
    double lonMax() const;
};

std::pair<double, double> tile2latlon(int zoom, int x, int y);
std::pair<double, double> tile2latlon(const TileInfo& tile);


class PMTiles;

// Single pass over every tile coordinate of an archive in ascending tile id
// order. Leaf directories are loaded when the walk reaches them.
class TileCoordIterator {
public:
    explicit TileCoordIterator(const PMTiles* archive);

    // Returns the next coordinate, or std::nullopt once the walk is done.
    std::optional<TileCoord> next();

    // Data entry covering the coordinate last returned by next().
    const Entry& currentEntry() const { return _current; }

private:
    struct Frame {
        std::vector<Entry> entries;
        std::size_t index = 0;
    };

    const PMTiles* _archive;
    std::vector<Frame> _stack;
    Entry _current;
    std::uint64_t _next_id = 0;
    std::uint64_t _end_id = 0;
    bool _started = false;
};

class TileIterator {
public:
    explicit TileIterator(const PMTiles* archive);

    // Returns the next tile, or std::nullopt if done.
    // Throws on read or decompression errors.
    std::optional<TileInfo> next();

private:
    const PMTiles* _archive;
    TileCoordIterator _coords;
    std::string _extension;
    std::optional<std::uint64_t> _cached_offset;
    std::vector<std::byte> _cached_data;
};

class PMTiles {
  public:
    PMTiles();
    PMTiles(const std::string& path);
    PMTiles(std::unique_ptr<ByteSource> source, Decompressor decompressor = decompress);
    ~PMTiles();

    PMTiles(const PMTiles&) = delete;
    PMTiles& operator=(const PMTiles&) = delete;

    void open(const std::string& path);
    void open(std::unique_ptr<ByteSource> source, Decompressor decompressor = decompress);
    void close();
    bool isOpen() const;

    const Header& header() const;

    // Tile bytes for (x, y, z), or std::nullopt if the archive has no such tile.
    std::optional<std::vector<std::byte>> getTile(std::uint32_t x, std::uint32_t y, int z) const;

    std::string jsonMetadata() const;
    std::map<std::string, std::string> metadata() const;

    TileCoordIterator allTileCoordinates() const;
    TileIterator tiles() const;

    size_t extract(const std::string& output_directory = ".",
            const std::string& pattern = "{z}/{x}/{y}.{ext}") const;
    size_t extract(const ExtractOptions& options) const;

  private:
    friend class TileCoordIterator;
    friend class TileIterator;

    std::vector<std::byte> readBytes(std::uint64_t offset, std::uint64_t length) const;
    std::vector<Entry> readDirectory(std::uint64_t offset, std::uint64_t length) const;

    std::string _name;
    std::unique_ptr<ByteSource> _source;
    Decompressor _decompressor;
    Header _header;
};

}  // namespace pmtiles

#endif // PMTILES_H
