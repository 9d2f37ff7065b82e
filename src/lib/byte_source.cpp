#include "pmtiles.h"

#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

namespace pmtiles {

namespace {

void check_range(std::uint64_t offset, std::uint32_t length, std::uint64_t size) {
    if (offset > size || length > size - offset) {
        throw io_error("Read of " + std::to_string(length) + " bytes at offset " + std::to_string(offset) +
                       " is outside the archive (size: " + std::to_string(size) + ")");
    }
}

}  // namespace

FileByteSource::FileByteSource(const std::string &path) : _path(path) {
    if (path.empty()) {
        throw std::invalid_argument("PMTiles path must not be empty");
    }
    std::error_code ec;
    const auto file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw io_error("Unable to open PMTiles file: " + path + ": " + ec.message());
    }
    _file.open(path, std::ios::binary);
    if (!_file) {
        throw io_error("Unable to open PMTiles file: " + path);
    }
    _size = static_cast<std::uint64_t>(file_size);
}

FileByteSource::~FileByteSource() {
    close();
}

std::vector<std::byte> FileByteSource::read_at(std::uint64_t offset, std::uint32_t length) {
    // seek + read must not interleave between threads sharing this source
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_file.is_open()) {
        throw io_error("PMTiles file is closed: " + _path);
    }
    check_range(offset, length, _size);

    std::vector<std::byte> buffer(length);
    _file.clear();
    _file.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!_file) {
        throw io_error("Failed to seek to offset " + std::to_string(offset) + " in " + _path);
    }
    if (length > 0) {
        _file.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(length));
    }
    const auto got = _file.gcount();
    if (length > 0 && got != static_cast<std::streamsize>(length)) {
        throw io_error("Short read in " + _path + ": expected " + std::to_string(length) + " bytes at offset " +
                       std::to_string(offset) + ", got " + std::to_string(got));
    }
    return buffer;
}

std::uint64_t FileByteSource::size() const {
    return _size;
}

void FileByteSource::close() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_file.is_open()) {
        _file.close();
    }
}


MemoryByteSource::MemoryByteSource(std::vector<std::byte> data) : _data(std::move(data)) {
}

std::vector<std::byte> MemoryByteSource::read_at(std::uint64_t offset, std::uint32_t length) {
    if (_closed) {
        throw io_error("Memory byte source is closed");
    }
    check_range(offset, length, _data.size());
    const auto begin = _data.begin() + static_cast<std::ptrdiff_t>(offset);
    return std::vector<std::byte>(begin, begin + length);
}

std::uint64_t MemoryByteSource::size() const {
    return _data.size();
}

void MemoryByteSource::close() {
    _closed = true;
}

}  // namespace pmtiles
