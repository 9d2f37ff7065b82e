#include "pmtiles.h"

#include "aixlog.hpp"

#include <cmath>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace pmtiles {

namespace {

AixLog::Severity to_aixlog_severity(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:
            return AixLog::Severity::trace;
        case LogLevel::DEBUG:
            return AixLog::Severity::debug;
        case LogLevel::INFO:
            return AixLog::Severity::info;
        case LogLevel::WARNING:
            return AixLog::Severity::warning;
        case LogLevel::ERROR:
            return AixLog::Severity::error;
        case LogLevel::FATAL:
            return AixLog::Severity::fatal;
    }
    return AixLog::Severity::warning;
}

}  // namespace

struct Logger::Impl {
    LogLevel level = LogLevel::WARNING;

    void apply() {
        AixLog::Filter filter;
        filter.add_filter(to_aixlog_severity(level));
        auto sink = std::make_shared<AixLog::SinkCout>(filter, "[#severity] #message");
        AixLog::Log::init({sink});
    }
};

Logger::Impl &Logger::impl() {
    static Logger::Impl instance;
    static bool initialized = false;
    if (!initialized) {
        instance.apply();
        initialized = true;
    }
    return instance;
}

void Logger::set_level(LogLevel level) {
    auto &state = impl();
    if (state.level == level) {
        return;
    }
    state.level = level;
    state.apply();
}

LogLevel Logger::level() {
    return impl().level;
}


std::string to_string(Compression compression) {
    switch (compression) {
        case Compression::NONE:
            return "none";
        case Compression::GZIP:
            return "gzip";
        case Compression::BROTLI:
            return "brotli";
        case Compression::ZSTD:
            return "zstd";
        case Compression::UNKNOWN:
            break;
    }
    return "unknown";
}

std::string to_string(TileType tile_type) {
    switch (tile_type) {
        case TileType::MVT:
            return "mvt";
        case TileType::PNG:
            return "png";
        case TileType::JPEG:
            return "jpeg";
        case TileType::WEBP:
            return "webp";
        case TileType::AVIF:
            return "avif";
        case TileType::UNKNOWN:
            break;
    }
    return "unknown";
}

std::string tile_type_extension(TileType tile_type) {
    switch (tile_type) {
        case TileType::MVT:
            return "mvt";
        case TileType::PNG:
            return "png";
        case TileType::JPEG:
            return "jpg";
        case TileType::WEBP:
            return "webp";
        case TileType::AVIF:
            return "avif";
        case TileType::UNKNOWN:
            break;
    }
    return "bin";
}

double Header::lonMin() const {
    return min_lon_e7 / 1e7;
}

double Header::latMin() const {
    return min_lat_e7 / 1e7;
}

double Header::lonMax() const {
    return max_lon_e7 / 1e7;
}

double Header::latMax() const {
    return max_lat_e7 / 1e7;
}

double Header::centerLon() const {
    return center_lon_e7 / 1e7;
}

double Header::centerLat() const {
    return center_lat_e7 / 1e7;
}


namespace {

std::string format_decimal(double value, int precision = 6) {
    std::ostringstream stream;
    stream << std::fixed << std::setprecision(precision) << value;
    return stream.str();
}

std::string leading_digits(long long value, std::size_t count) {
    std::string digits = std::to_string(std::llabs(value));
    if (digits.size() < count) {
        digits = std::string(count - digits.size(), '0') + digits;
    }
    return digits.substr(0, count);
}

bool token_is_repeat_of(const std::string &token, char expected) {
    if (token.empty()) {
        return false;
    }
    for (char ch : token) {
        if (ch != expected) {
            return false;
        }
    }
    return true;
}

// Expands {z} {x} {y} {a} {o} {ext} and the zero-padded {ZZ} {XX} {YY} {AA} {OO}
// families for one tile.
std::string format_pattern(const TileInfo &tile, const std::string &pattern) {
    const auto nw_corner = tile2latlon(tile.zoom, tile.x, tile.y);
    const double lat = nw_corner.first;
    const double lon = nw_corner.second;

    std::string result;
    result.reserve(pattern.size() + 32);

    for (std::size_t i = 0; i < pattern.size();) {
        if (pattern[i] != '{') {
            result.push_back(pattern[i]);
            ++i;
            continue;
        }

        const std::size_t closing = pattern.find('}', i + 1);
        if (closing == std::string::npos) {
            throw pmtiles_error("Unclosed placeholder in pattern: " + pattern);
        }

        const std::string token = pattern.substr(i + 1, closing - i - 1);
        if (token.empty()) {
            throw pmtiles_error("Empty placeholder in pattern: " + pattern);
        }

        if (token == "z") {
            result += std::to_string(tile.zoom);
        } else if (token == "x") {
            result += std::to_string(tile.x);
        } else if (token == "y") {
            result += std::to_string(tile.y);
        } else if (token == "a") {
            result += format_decimal(lat);
        } else if (token == "o") {
            result += format_decimal(lon);
        } else if (token == "ext") {
            result += tile.extension;
        } else if (token_is_repeat_of(token, 'Z')) {
            result += leading_digits(tile.zoom, token.size());
        } else if (token_is_repeat_of(token, 'X')) {
            result += leading_digits(tile.x, token.size());
        } else if (token_is_repeat_of(token, 'Y')) {
            result += leading_digits(tile.y, token.size());
        } else if (token_is_repeat_of(token, 'A')) {
            result += leading_digits(static_cast<long long>(std::floor(std::fabs(lat))), token.size());
        } else if (token_is_repeat_of(token, 'O')) {
            result += leading_digits(static_cast<long long>(std::floor(std::fabs(lon))), token.size());
        } else {
            throw pmtiles_error("Unknown placeholder '{" + token + "}' in pattern: " + pattern);
        }
        i = closing + 1;
    }

    return result;
}

void check_region(const char *name, std::uint64_t offset, std::uint64_t length, std::uint64_t size) {
    if (offset > size || length > size - offset) {
        throw header_parse_error(std::string("PMTiles ") + name + " (offset=" + std::to_string(offset) +
                                 ", length=" + std::to_string(length) + ") extends beyond the archive (size: " +
                                 std::to_string(size) + ")");
    }
}

}  // namespace


PMTiles::PMTiles() : _name("") {
}

PMTiles::PMTiles(const std::string& path) : _name("") {
    open(path);
}

PMTiles::PMTiles(std::unique_ptr<ByteSource> source, Decompressor decompressor) : _name("") {
    open(std::move(source), std::move(decompressor));
}

PMTiles::~PMTiles() {
    close();
}

void PMTiles::close() {
    if (_source) {
        _source->close();
        LOG(DEBUG) << "Closed PMTiles archive '" << _name << "'\n";
    }
    _source.reset();
    _header = Header{};
}

bool PMTiles::isOpen() const {
    return _source != nullptr;
}

void PMTiles::open(const std::string& path) {
    if (path.empty()) {
        throw std::invalid_argument("PMTiles path must not be empty");
    }
    open(std::make_unique<FileByteSource>(path));

    const fs::path file_path = fs::absolute(path);
    _name = file_path.filename().string();
    LOG(INFO) << "Opened PMTiles archive '" << _name << "'\n";
}

void PMTiles::open(std::unique_ptr<ByteSource> source, Decompressor decompressor) {
    if (!source) {
        throw std::invalid_argument("PMTiles byte source must not be null");
    }
    if (!decompressor) {
        throw std::invalid_argument("PMTiles decompressor must not be empty");
    }
    close();

    const std::uint64_t size = source->size();
    if (size < kHeaderLength) {
        throw header_parse_error("File too small to be a PMTiles archive (size: " + std::to_string(size) + ")");
    }

    std::vector<std::byte> header_bytes;
    try {
        header_bytes = source->read_at(0, static_cast<std::uint32_t>(kHeaderLength));
    } catch (const std::exception &ex) {
        std::throw_with_nested(archive_read_error(std::string("Failed to read PMTiles header: ") + ex.what()));
    }

    const Header header = deserialize_header(header_bytes);
    check_region("root directory", header.root_dir_offset, header.root_dir_length, size);
    check_region("JSON metadata", header.json_metadata_offset, header.json_metadata_length, size);
    check_region("leaf directories", header.leaf_dirs_offset, header.leaf_dirs_length, size);
    check_region("tile data", header.tile_data_offset, header.tile_data_length, size);
    if (header.root_dir_length > std::numeric_limits<std::uint32_t>::max()) {
        throw header_parse_error("PMTiles root directory is larger than 4 GiB");
    }

    _source = std::move(source);
    _decompressor = std::move(decompressor);
    _header = header;
    _name = "<byte source>";

    LOG(DEBUG) << "PMTiles header: root=" << _header.root_dir_offset << "+" << _header.root_dir_length
               << " leaves=" << _header.leaf_dirs_offset << "+" << _header.leaf_dirs_length
               << " tiles=" << _header.tile_data_offset << "+" << _header.tile_data_length
               << " internal_compression=" << to_string(_header.internal_compression) << "\n";
}

const Header& PMTiles::header() const {
    if (!_source) {
        throw pmtiles_error("PMTiles archive is not open");
    }
    return _header;
}

std::vector<std::byte> PMTiles::readBytes(std::uint64_t offset, std::uint64_t length) const {
    if (!_source) {
        throw pmtiles_error("PMTiles archive is not open");
    }
    if (length > std::numeric_limits<std::uint32_t>::max()) {
        throw archive_read_error("Read of " + std::to_string(length) + " bytes at offset " +
                                 std::to_string(offset) + " exceeds the 4 GiB limit");
    }

    try {
        return _source->read_at(offset, static_cast<std::uint32_t>(length));
    } catch (const std::exception &ex) {
        std::throw_with_nested(archive_read_error("Failed to read " + std::to_string(length) + " bytes at offset " +
                                                  std::to_string(offset) + " from '" + _name + "': " + ex.what()));
    }
}

std::vector<Entry> PMTiles::readDirectory(std::uint64_t offset, std::uint64_t length) const {
    const auto raw = readBytes(offset, length);
    return deserialize_directory(_decompressor(raw, _header.internal_compression));
}

std::optional<std::vector<std::byte>> PMTiles::getTile(std::uint32_t x, std::uint32_t y, int z) const {
    const std::uint64_t tile_id = zxy_to_tileid(z, x, y);

    std::uint64_t dir_offset = header().root_dir_offset;
    std::uint64_t dir_length = _header.root_dir_length;

    for (int depth = 0; depth < kMaxDirectoryDepth; ++depth) {
        const auto entries = readDirectory(dir_offset, dir_length);
        const auto entry = find_entry(entries, tile_id);
        if (!entry) {
            return std::nullopt;
        }
        if (entry->run_length > 0) {
            return readBytes(_header.tile_data_offset + entry->offset, entry->length);
        }

        LOG(DEBUG) << "Tile " << z << "/" << x << "/" << y << " (id " << tile_id
                   << ") continues in leaf directory at depth " << depth + 1 << "\n";
        dir_offset = _header.leaf_dirs_offset + entry->offset;
        dir_length = entry->length;
    }

    LOG(DEBUG) << "Tile " << z << "/" << x << "/" << y << " not resolved within " << kMaxDirectoryDepth
               << " directory levels\n";
    return std::nullopt;
}

std::string PMTiles::jsonMetadata() const {
    const auto raw = readBytes(header().json_metadata_offset, _header.json_metadata_length);
    const auto decompressed = _decompressor(raw, _header.internal_compression);
    return std::string(reinterpret_cast<const char *>(decompressed.data()), decompressed.size());
}

std::map<std::string, std::string> PMTiles::metadata() const {
    const Header &h = header();
    std::map<std::string, std::string> result;
    result.emplace("spec_version", "3");
    result.emplace("tile_type", to_string(h.tile_type));
    result.emplace("tile_compression", to_string(h.tile_compression));
    result.emplace("internal_compression", to_string(h.internal_compression));
    result.emplace("clustered", h.clustered ? "true" : "false");
    result.emplace("min_zoom", std::to_string(h.min_zoom));
    result.emplace("max_zoom", std::to_string(h.max_zoom));
    result.emplace("bounds", format_decimal(h.lonMin(), 7) + "," + format_decimal(h.latMin(), 7) + "," +
                                 format_decimal(h.lonMax(), 7) + "," + format_decimal(h.latMax(), 7));
    result.emplace("center", format_decimal(h.centerLon(), 7) + "," + format_decimal(h.centerLat(), 7) + "," +
                                 std::to_string(h.center_zoom));
    result.emplace("addressed_tiles_count", std::to_string(h.addressed_tiles_count));
    result.emplace("tile_entries_count", std::to_string(h.tile_entries_count));
    result.emplace("tile_contents_count", std::to_string(h.tile_contents_count));
    return result;
}

TileCoordIterator PMTiles::allTileCoordinates() const {
    header();
    return TileCoordIterator(this);
}

TileIterator PMTiles::tiles() const {
    header();
    return TileIterator(this);
}

size_t PMTiles::extract(const ExtractOptions& options) const {
    return extract(options.output_directory, options.pattern);
}

std::size_t PMTiles::extract(const std::string& output_directory, const std::string& pattern) const {
    fs::path output_root = output_directory.empty() ? fs::current_path() : fs::path(output_directory);
    std::error_code ec;
    fs::create_directories(output_root, ec);
    if (ec) {
        throw pmtiles_error("Failed to create output directory '" + output_root.string() + "': " + ec.message());
    }

    TileIterator iter = tiles();

    std::size_t count = 0;
    while (auto tile = iter.next()) {
        fs::path output_path = output_root / fs::path(format_pattern(*tile, pattern));

        if (output_path.extension().empty() && !tile->extension.empty()) {
            output_path += "." + tile->extension;
        }

        if (output_path.has_parent_path()) {
            fs::create_directories(output_path.parent_path(), ec);
            if (ec) {
                throw pmtiles_error("Failed to create directory '" + output_path.parent_path().string() +
                                    "': " + ec.message());
            }
        }

        std::ofstream file(output_path, std::ios::binary);
        if (!file) {
            throw pmtiles_error("Failed to open output file '" + output_path.string() + "'");
        }
        if (!tile->data.empty()) {
            file.write(reinterpret_cast<const char*>(tile->data.data()),
                       static_cast<std::streamsize>(tile->data.size()));
        }
        if (!file) {
            throw pmtiles_error("Failed to write tile to '" + output_path.string() + "'");
        }

        ++count;
        if (count % 100 == 0) {
            LOG(INFO) << "Extracted " << count << " tiles...\n";
        }
    }

    LOG(INFO) << "Extraction completed. Total tiles: " << count << "\n";
    return count;
}


namespace {

// Latitude/longitude of a Web Mercator tile grid point
std::pair<double, double> grid_to_latlon(int zoom, double x, double y) {
    constexpr double kPi = 3.141592653589793238462643383279502884;
    const double n = std::pow(2.0, zoom);
    const double lon_deg = x / n * 360.0 - 180.0;
    const double lat_rad = std::atan(std::sinh(kPi * (1 - 2.0 * y / n)));
    return {lat_rad * 180.0 / kPi, lon_deg};
}

}  // namespace

// Latitude/longitude of the north-west corner of a Web Mercator tile
std::pair<double, double> tile2latlon(int zoom, int x, int y) {
    return grid_to_latlon(zoom, x, y);
}

std::pair<double, double> tile2latlon(const TileInfo& tile) {
    return tile2latlon(tile.zoom, tile.x, tile.y);
}

double TileInfo::latMin() const {
    // Bottom edge = y+1
    return grid_to_latlon(zoom, x, y + 1.0).first;
}

double TileInfo::latMax() const {
    return tile2latlon(zoom, x, y).first;
}

double TileInfo::lonMin() const {
    return tile2latlon(zoom, x, y).second;
}

double TileInfo::lonMax() const {
    // Right edge = x+1
    return grid_to_latlon(zoom, x + 1.0, y).second;
}

}  // namespace pmtiles
