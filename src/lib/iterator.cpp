#include "pmtiles.h"

#include "aixlog.hpp"

#include <stdexcept>
#include <utility>

namespace pmtiles {

TileCoordIterator::TileCoordIterator(const PMTiles* archive) : _archive(archive) {
    if (_archive == nullptr) {
        throw std::invalid_argument("PMTiles archive is null");
    }
}

std::optional<TileCoord> TileCoordIterator::next() {
    if (!_started) {
        const Header &h = _archive->header();
        _stack.push_back(Frame{_archive->readDirectory(h.root_dir_offset, h.root_dir_length), 0});
        _started = true;
    }

    // Depth-first in entry order: a leaf is fully walked before its next
    // sibling, which keeps the output ascending by tile id.
    while (_next_id == _end_id) {
        if (_stack.empty()) {
            return std::nullopt;
        }
        Frame &frame = _stack.back();
        if (frame.index == frame.entries.size()) {
            _stack.pop_back();
            continue;
        }

        const Entry entry = frame.entries[frame.index++];
        if (entry.isLeaf()) {
            const Header &h = _archive->header();
            LOG(DEBUG) << "Entering leaf directory at offset " << h.leaf_dirs_offset + entry.offset << " (depth "
                       << _stack.size() << ")\n";
            _stack.push_back(Frame{_archive->readDirectory(h.leaf_dirs_offset + entry.offset, entry.length), 0});
        } else {
            _current = entry;
            _next_id = entry.tile_id;
            _end_id = entry.tile_id + entry.run_length;
        }
    }

    return tileid_to_zxy(_next_id++);
}


TileIterator::TileIterator(const PMTiles* archive) : _archive(archive), _coords(archive) {
    _extension = tile_type_extension(_archive->header().tile_type);
}

std::optional<TileInfo> TileIterator::next() {
    const auto coord = _coords.next();
    if (!coord) {
        return std::nullopt;
    }

    // every id of a run shares one byte range, read it once
    const Entry &entry = _coords.currentEntry();
    if (!_cached_offset || *_cached_offset != entry.offset || _cached_data.size() != entry.length) {
        _cached_data = _archive->readBytes(_archive->header().tile_data_offset + entry.offset, entry.length);
        _cached_offset = entry.offset;
    }

    return TileInfo{
        coord->z,
        static_cast<int>(coord->x),
        static_cast<int>(coord->y),
        _cached_data,
        _extension
    };
}

}  // namespace pmtiles
