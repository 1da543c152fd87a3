// =============================================================================
// VOXSTREAM - GAME DATA LOADER IMPLEMENTATION
// =============================================================================

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include "Server/GameDataLoader.hpp"
#include "Server/GameDataBuilder.hpp"
#include "Shared/Logger.hpp"
#include "Shared/Settings.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace voxstream::server {

namespace {

// First readable candidate from the settings search path
bool read_config_file(const std::string& filename, std::string& out, std::string& found_path) {
    for (const char* dir : Settings::SEARCH_DIRS) {
        std::ifstream file(std::string(dir) + filename);
        if (!file.is_open()) {
            continue;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        out = buffer.str();
        found_path = std::string(dir) + filename;
        return true;
    }
    return false;
}

// Texture directories are resolved next to the config directory
std::string find_textures_dir(const std::string& textures_dir) {
    namespace fs = std::filesystem;

    const char* prefixes[] = {"", "../", "../../"};
    for (const char* prefix : prefixes) {
        std::string candidate = std::string(prefix) + textures_dir;
        std::error_code ec;
        if (fs::is_directory(candidate, ec)) {
            return candidate;
        }
    }
    return {};
}

bool load_png(const std::string& path, TextureImage& image) {
    int width = 0, height = 0, channels = 0;
    unsigned char* pixels = stbi_load(path.c_str(), &width, &height, &channels, 4);
    if (!pixels) {
        std::printf("[GameDataLoader] Failed to load %s: %s\n", path.c_str(), stbi_failure_reason());
        return false;
    }

    image.width = static_cast<std::uint32_t>(width);
    image.height = static_cast<std::uint32_t>(height);
    image.rgba.assign(pixels, pixels + static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4);
    stbi_image_free(pixels);
    return true;
}

} // namespace

GameDataPtr load_game_data(const GameDataPaths& paths) {
    std::string error;

    // Block definitions are required
    std::string blocks_text;
    std::string blocks_path;
    if (!read_config_file(paths.blocks_file, blocks_text, blocks_path)) {
        std::fprintf(stderr, "[GameDataLoader] %s not found\n", paths.blocks_file.c_str());
        return nullptr;
    }

    std::vector<BlockDefinition> blocks;
    if (!parse_block_definitions(blocks_text, blocks, error)) {
        std::fprintf(stderr, "[GameDataLoader] %s: %s\n", blocks_path.c_str(), error.c_str());
        return nullptr;
    }

    // Items are optional
    std::vector<ItemDefinition> items;
    std::string items_text;
    std::string items_path;
    if (read_config_file(paths.items_file, items_text, items_path)) {
        if (!parse_item_definitions(items_text, items, error)) {
            std::fprintf(stderr, "[GameDataLoader] %s: %s\n", items_path.c_str(), error.c_str());
            return nullptr;
        }
    }

    std::printf("[GameDataLoader] %zu block and %zu item definitions\n", blocks.size(), items.size());

    // Tiles
    const std::string textures_dir = find_textures_dir(paths.textures_dir);
    if (textures_dir.empty()) {
        std::printf("[GameDataLoader] Texture directory %s not found, using checkerboards\n",
                    paths.textures_dir.c_str());
    }

    TextureAtlasBuilder atlas_builder;
    for (const std::string& name : referenced_textures(blocks, items)) {
        TextureImage image;
        image.name = name;

        const std::string path = textures_dir + "/" + name + ".png";
        if (!textures_dir.empty() && std::filesystem::exists(path) && load_png(path, image)) {
            LOG("GameDataLoader", "Loaded texture ", path);
            atlas_builder.add(std::move(image));
        } else {
            LOG("GameDataLoader", "Missing texture ", name);
            atlas_builder.add_missing(name);
        }
    }

    AtlasImage atlas;
    Registry<TextureRect> rects;
    atlas_builder.build(atlas, rects);

    GameDataPtr data = build_game_data(blocks, items, std::move(atlas), rects, error);
    if (!data) {
        std::fprintf(stderr, "[GameDataLoader] %s\n", error.c_str());
        return nullptr;
    }
    return data;
}

} // namespace voxstream::server
