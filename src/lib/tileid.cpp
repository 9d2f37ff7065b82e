#include "pmtiles.h"

#include <limits>
#include <string>
#include <utility>

namespace pmtiles {

namespace {

// (4^32 - 1) / 3: first id past zoom 31
constexpr std::uint64_t kTileIdLimit = std::numeric_limits<std::uint64_t>::max() / 3;

std::uint64_t zoom_base(int z) {
    return ((std::uint64_t(1) << (2 * z)) - 1) / 3;
}

void rotate(std::uint64_t n, std::uint64_t &x, std::uint64_t &y, std::uint64_t rx, std::uint64_t ry) {
    if (ry == 0) {
        if (rx == 1) {
            x = n - 1 - x;
            y = n - 1 - y;
        }
        std::swap(x, y);
    }
}

TileCoord t_on_level(std::uint8_t z, std::uint64_t pos) {
    const std::uint64_t n = std::uint64_t(1) << z;
    std::uint64_t t = pos;
    std::uint64_t tx = 0;
    std::uint64_t ty = 0;

    for (std::uint64_t s = 1; s < n; s *= 2) {
        const std::uint64_t rx = 1 & (t / 2);
        const std::uint64_t ry = 1 & (t ^ rx);
        rotate(s, tx, ty, rx, ry);
        tx += s * rx;
        ty += s * ry;
        t /= 4;
    }
    return TileCoord{z, static_cast<std::uint32_t>(tx), static_cast<std::uint32_t>(ty)};
}

}  // namespace

std::uint64_t zxy_to_tileid(int z, std::uint32_t x, std::uint32_t y) {
    if (z < 0 || z > kMaxZoom) {
        throw invalid_tile_id("Tile zoom " + std::to_string(z) + " is outside 0.." + std::to_string(kMaxZoom));
    }
    const std::uint64_t n = std::uint64_t(1) << z;
    if (x >= n || y >= n) {
        throw invalid_tile_id("Tile " + std::to_string(z) + "/" + std::to_string(x) + "/" + std::to_string(y) +
                              " is outside the bounds of its zoom level");
    }

    std::uint64_t tx = x;
    std::uint64_t ty = y;
    std::uint64_t d = 0;
    for (std::uint64_t s = n / 2; s > 0; s /= 2) {
        const std::uint64_t rx = (tx & s) > 0 ? 1 : 0;
        const std::uint64_t ry = (ty & s) > 0 ? 1 : 0;
        d += s * s * ((3 * rx) ^ ry);
        tx &= s - 1;
        ty &= s - 1;
        rotate(s, tx, ty, rx, ry);
    }
    return zoom_base(z) + d;
}

TileCoord tileid_to_zxy(std::uint64_t tile_id) {
    if (tile_id >= kTileIdLimit) {
        throw invalid_tile_id("Tile id " + std::to_string(tile_id) + " is beyond zoom " +
                              std::to_string(kMaxZoom));
    }

    std::uint64_t acc = 0;
    for (std::uint8_t z = 0; z <= kMaxZoom; ++z) {
        const std::uint64_t num_tiles = std::uint64_t(1) << (2 * z);
        if (tile_id - acc < num_tiles) {
            return t_on_level(z, tile_id - acc);
        }
        acc += num_tiles;
    }
    throw invalid_tile_id("Tile id " + std::to_string(tile_id) + " is beyond zoom " +
                          std::to_string(kMaxZoom));
}

}  // namespace pmtiles
