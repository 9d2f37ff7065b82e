#include "CLI11.hpp"
#include "pmtiles.h"

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>

namespace {

void print_exception(const std::exception &ex, int level = 0) {
    std::cerr << std::string(level * 2, ' ') << ex.what() << std::endl;
    try {
        std::rethrow_if_nested(ex);
    } catch (const std::exception &nested) {
        print_exception(nested, level + 1);
    }
}

}  // namespace

int main(int argc, char **argv) {
    CLI::App app{"libpmtiles command line interface"};
    app.require_subcommand(1);

    int verbosity = 0;
    auto add_logging_flags = [&](CLI::App *cmd) {
        cmd->add_flag("-v,--verbose", verbosity, "Increase logging verbosity");
        cmd->add_flag_function("--verbose-extra", [&](int count) { verbosity += count * 2; },
                               "Enable extra verbose logging");
    };

    auto header_cmd = app.add_subcommand("header", "Print the header fields of a PMTiles archive");
    add_logging_flags(header_cmd);
    std::string header_path;
    header_cmd->add_option("pmtiles", header_path, "Path to the PMTiles file")
        ->required()
        ->check(CLI::ExistingFile);

    auto metadata_cmd = app.add_subcommand("metadata", "Print the JSON metadata of a PMTiles archive");
    add_logging_flags(metadata_cmd);
    std::string metadata_path;
    metadata_cmd->add_option("pmtiles", metadata_path, "Path to the PMTiles file")
        ->required()
        ->check(CLI::ExistingFile);

    auto tile_cmd = app.add_subcommand("tile", "Read a single tile");
    add_logging_flags(tile_cmd);
    std::string tile_path;
    int tile_z = 0;
    std::uint32_t tile_x = 0;
    std::uint32_t tile_y = 0;
    std::string tile_output;
    tile_cmd->add_option("pmtiles", tile_path, "Path to the PMTiles file")
        ->required()
        ->check(CLI::ExistingFile);
    tile_cmd->add_option("z", tile_z, "Zoom level")
        ->required()
        ->check(CLI::Range(0, static_cast<int>(pmtiles::kMaxZoom)));
    tile_cmd->add_option("x", tile_x, "Tile column")->required();
    tile_cmd->add_option("y", tile_y, "Tile row (XYZ scheme)")->required();
    tile_cmd->add_option("-o,--output", tile_output, "Write the tile to this file instead of stdout");

    auto list_cmd = app.add_subcommand("list", "List the z/x/y of every tile in ascending tile id order");
    add_logging_flags(list_cmd);
    std::string list_path;
    list_cmd->add_option("pmtiles", list_path, "Path to the PMTiles file")
        ->required()
        ->check(CLI::ExistingFile);

    auto extract_cmd = app.add_subcommand("extract", "Extract tiles from a PMTiles archive");
    add_logging_flags(extract_cmd);
    std::string extract_input;
    pmtiles::ExtractOptions extract_options;
    extract_cmd->add_option("pmtiles", extract_input, "Path to the PMTiles file")
        ->required()
        ->check(CLI::ExistingFile);
    extract_cmd->add_option("-o,--output-dir", extract_options.output_directory,
                            "Destination directory for the extracted tiles")
        ->default_val(".");
    extract_cmd->add_option("-p,--pattern", extract_options.pattern,
                            "Output filename pattern using placeholders like {z}, {x}, {y}, {a}, {o}, {XX}, {ext}.")
        ->default_val("{z}/{x}/{y}.{ext}");

    CLI11_PARSE(app, argc, argv);

    if (verbosity >= 2) {
        pmtiles::Logger::set_level(pmtiles::LogLevel::DEBUG);
    } else if (verbosity == 1) {
        pmtiles::Logger::set_level(pmtiles::LogLevel::INFO);
    } else {
        pmtiles::Logger::set_level(pmtiles::LogLevel::WARNING);
    }

    try {
        if (*header_cmd) {
            const auto fields = pmtiles::PMTiles(header_path).metadata();
            for (const auto &entry : fields) {
                std::cout << entry.first << "=" << entry.second << '\n';
            }
            return EXIT_SUCCESS;
        }

        if (*metadata_cmd) {
            std::cout << pmtiles::PMTiles(metadata_path).jsonMetadata() << std::endl;
            return EXIT_SUCCESS;
        }

        if (*tile_cmd) {
            pmtiles::PMTiles archive(tile_path);
            const auto data = archive.getTile(tile_x, tile_y, tile_z);
            if (!data) {
                std::cerr << "Tile " << tile_z << "/" << tile_x << "/" << tile_y << " not found" << std::endl;
                return EXIT_FAILURE;
            }
            if (tile_output.empty()) {
                std::cout.write(reinterpret_cast<const char *>(data->data()),
                                static_cast<std::streamsize>(data->size()));
                std::cout.flush();
            } else {
                std::ofstream out(tile_output, std::ios::binary);
                out.write(reinterpret_cast<const char *>(data->data()), static_cast<std::streamsize>(data->size()));
                if (!out) {
                    std::cerr << "Failed to write tile to '" << tile_output << "'" << std::endl;
                    return EXIT_FAILURE;
                }
            }
            return EXIT_SUCCESS;
        }

        if (*list_cmd) {
            pmtiles::PMTiles archive(list_path);
            auto coords = archive.allTileCoordinates();
            while (auto coord = coords.next()) {
                std::cout << int(coord->z) << "/" << coord->x << "/" << coord->y << '\n';
            }
            return EXIT_SUCCESS;
        }

        if (*extract_cmd) {
            pmtiles::PMTiles archive(extract_input);
            const auto count = archive.extract(extract_options);
            std::cout << "Extracted " << count << " tiles to '" << extract_options.output_directory << "'"
                      << std::endl;
            return EXIT_SUCCESS;
        }
    } catch (const std::exception &ex) {
        print_exception(ex);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
