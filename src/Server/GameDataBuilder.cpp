// =============================================================================
// VOXSTREAM - GAME DATA BUILDER IMPLEMENTATION
// =============================================================================

#include "Server/GameDataBuilder.hpp"
#include "Shared/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <memory>
#include <sstream>

namespace voxstream::server {

namespace {

// =============================================================================
// TOML TABLE SCANNER
// Calls on_table(name, line) for "[[kind.name]]" headers of the wanted kind and
// on_property(key, value, line) for the assignments inside them.
// =============================================================================
template<typename TableFn, typename PropertyFn>
bool scan_tables(std::string_view text, std::string_view kind, std::string& error,
                 TableFn&& on_table, PropertyFn&& on_property) {
    std::istringstream stream{std::string(text)};
    std::string line;
    std::size_t line_number = 0;
    bool in_table = false;

    while (std::getline(stream, line)) {
        ++line_number;

        // Skip empty lines and comments
        size_t start = line.find_first_not_of(" \t");
        if (start == std::string::npos) continue;
        line = line.substr(start);
        if (line[0] == '#') continue;

        // Section header [[kind.name]]
        if (line[0] == '[') {
            in_table = false;
            if (line.size() < 4 || line[1] != '[') {
                continue;
            }
            size_t end = line.find("]]");
            size_t dot = line.find('.');
            if (end == std::string::npos || dot == std::string::npos || dot > end) {
                error = "line " + std::to_string(line_number) + ": malformed table header";
                return false;
            }
            if (std::string_view(line).substr(2, dot - 2) != kind) {
                continue;
            }
            std::string name = line.substr(dot + 1, end - dot - 1);
            if (name.empty()) {
                error = "line " + std::to_string(line_number) + ": empty " + std::string(kind) + " name";
                return false;
            }
            if (!on_table(std::move(name), line_number)) {
                return false;
            }
            in_table = true;
            continue;
        }

        // Key = value pairs
        if (!in_table) continue;

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);

        if (value.find('"') == std::string::npos) {
            size_t hash = value.find('#');
            if (hash != std::string::npos) {
                value = value.substr(0, hash);
            }
        }

        // Trim
        key.erase(key.find_last_not_of(" \t") + 1);
        value.erase(value.find_last_not_of(" \t\r\n") + 1);
        value.erase(0, value.find_first_not_of(" \t"));

        // Remove quotes, dropping anything after the closing one
        if (!value.empty() && value.front() == '"') {
            size_t close = value.find('"', 1);
            value = close != std::string::npos ? value.substr(1, close - 1) : value.substr(1);
        }

        if (!on_property(key, value, line_number)) {
            return false;
        }
    }
    return true;
}

} // namespace

// =============================================================================
// DEFINITION PARSING
// =============================================================================

bool parse_block_definitions(std::string_view text, std::vector<BlockDefinition>& out, std::string& error) {
    out.clear();

    return scan_tables(text, "blocks", error,
        [&](std::string name, std::size_t) {
            BlockDefinition def;
            def.name = std::move(name);
            out.push_back(std::move(def));
            return true;
        },
        [&](const std::string& key, const std::string& value, std::size_t line_number) {
            BlockDefinition& block = out.back();
            if (key == "type") {
                if (value == "normal_cube") {
                    block.type = BlockType::NORMAL_CUBE;
                } else if (value == "air") {
                    block.type = BlockType::AIR;
                } else {
                    error = "line " + std::to_string(line_number) + ": unknown block type '" + value +
                            "' for block '" + block.name + "'";
                    return false;
                }
            } else if (key == "texture") {
                block.face_textures.fill(value);
            } else if (key == "texture_top") {
                block.face_textures[FACE_POS_Y] = value;
            } else if (key == "texture_bottom") {
                block.face_textures[FACE_NEG_Y] = value;
            } else if (key == "texture_side") {
                block.face_textures[FACE_NEG_X] = value;
                block.face_textures[FACE_POS_X] = value;
                block.face_textures[FACE_NEG_Z] = value;
                block.face_textures[FACE_POS_Z] = value;
            }
            return true;
        });
}

bool parse_item_definitions(std::string_view text, std::vector<ItemDefinition>& out, std::string& error) {
    out.clear();

    return scan_tables(text, "items", error,
        [&](std::string name, std::size_t) {
            out.push_back(ItemDefinition{std::move(name), {}});
            return true;
        },
        [&](const std::string& key, const std::string& value, std::size_t) {
            if (key == "texture") {
                out.back().texture = value;
            }
            return true;
        });
}

std::vector<std::string> referenced_textures(const std::vector<BlockDefinition>& blocks,
                                             const std::vector<ItemDefinition>& items) {
    std::vector<std::string> names;
    for (const auto& block : blocks) {
        if (block.type != BlockType::NORMAL_CUBE) continue;
        for (const auto& texture : block.face_textures) {
            if (!texture.empty()) {
                names.push_back(texture);
            }
        }
    }
    for (const auto& item : items) {
        if (!item.texture.empty()) {
            names.push_back(item.texture);
        }
    }

    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
    return names;
}

// =============================================================================
// TEXTURE ATLAS BUILDER
// =============================================================================

bool TextureAtlasBuilder::add(TextureImage image) {
    for (const auto& tile : m_tiles) {
        if (tile.name == image.name) {
            return false;
        }
    }

    const bool sized = image.width == TILE_SIZE && image.height == TILE_SIZE &&
                       image.rgba.size() == static_cast<std::size_t>(TILE_SIZE) * TILE_SIZE * 4;
    if (!sized) {
        std::printf("[TextureAtlas] Wrong size for %s (%ux%u, expected %ux%u)\n",
                    image.name.c_str(), image.width, image.height, TILE_SIZE, TILE_SIZE);
        image = checkerboard(std::move(image.name));
    }

    m_tiles.push_back(std::move(image));
    return true;
}

bool TextureAtlasBuilder::add_missing(const std::string& name) {
    return add(checkerboard(name));
}

TextureImage TextureAtlasBuilder::checkerboard(std::string name) {
    TextureImage image;
    image.name = std::move(name);
    image.width = TILE_SIZE;
    image.height = TILE_SIZE;
    image.rgba.resize(static_cast<std::size_t>(TILE_SIZE) * TILE_SIZE * 4);

    for (std::uint32_t y = 0; y < TILE_SIZE; ++y) {
        for (std::uint32_t x = 0; x < TILE_SIZE; ++x) {
            std::size_t idx = (y * TILE_SIZE + x) * 4;
            bool checker = ((x / 4) + (y / 4)) % 2 == 0;
            image.rgba[idx + 0] = checker ? 255 : 0;    // R
            image.rgba[idx + 1] = 0;                     // G
            image.rgba[idx + 2] = checker ? 255 : 0;    // B
            image.rgba[idx + 3] = 255;                   // A
        }
    }
    return image;
}

void TextureAtlasBuilder::build(AtlasImage& atlas, Registry<TextureRect>& rects) const {
    const auto count = static_cast<std::uint32_t>(std::max<std::size_t>(m_tiles.size(), 1));
    const auto columns = static_cast<std::uint32_t>(std::ceil(std::sqrt(static_cast<double>(count))));
    const std::uint32_t rows = (count + columns - 1) / columns;

    atlas.width = columns * TILE_SIZE;
    atlas.height = rows * TILE_SIZE;
    atlas.rgba.assign(static_cast<std::size_t>(atlas.width) * atlas.height * 4, 0);

    const auto atlas_w = static_cast<float>(atlas.width);
    const auto atlas_h = static_cast<float>(atlas.height);

    for (std::uint32_t i = 0; i < m_tiles.size(); ++i) {
        const TextureImage& tile = m_tiles[i];
        const std::uint32_t origin_x = (i % columns) * TILE_SIZE;
        const std::uint32_t origin_y = (i / columns) * TILE_SIZE;

        for (std::uint32_t row = 0; row < TILE_SIZE; ++row) {
            const std::size_t src = static_cast<std::size_t>(row) * TILE_SIZE * 4;
            const std::size_t dst = ((static_cast<std::size_t>(origin_y) + row) * atlas.width + origin_x) * 4;
            std::copy_n(tile.rgba.begin() + static_cast<std::ptrdiff_t>(src), TILE_SIZE * 4,
                        atlas.rgba.begin() + static_cast<std::ptrdiff_t>(dst));
        }

        TextureRect rect{
            static_cast<float>(origin_x) / atlas_w,
            static_cast<float>(origin_y) / atlas_h,
            static_cast<float>(TILE_SIZE) / atlas_w,
            static_cast<float>(TILE_SIZE) / atlas_h
        };
        if (!rects.register_entry(tile.name, rect)) {
            LOG("TextureAtlas", "Texture ", tile.name, " already has a rect, keeping the first");
        }
    }

    LOG("TextureAtlas", "Built ", atlas.width, "x", atlas.height, " atlas with ", m_tiles.size(), " tiles");
}

// =============================================================================
// ITEM MODELS
// =============================================================================

VoxelModel extrude_item_model(const TextureRect& rect, const AtlasImage& atlas) {
    VoxelModel model;
    if (!atlas.valid()) {
        return model;
    }

    const auto px = static_cast<std::uint32_t>(std::lround(rect.x * static_cast<float>(atlas.width)));
    const auto py = static_cast<std::uint32_t>(std::lround(rect.y * static_cast<float>(atlas.height)));
    auto w = static_cast<std::uint32_t>(std::lround(rect.width * static_cast<float>(atlas.width)));
    auto h = static_cast<std::uint32_t>(std::lround(rect.height * static_cast<float>(atlas.height)));
    w = std::min(w, atlas.width > px ? atlas.width - px : 0u);
    h = std::min(h, atlas.height > py ? atlas.height - py : 0u);

    model.size_x = w;
    model.size_y = h;
    model.size_z = 1;
    model.voxels.resize(static_cast<std::size_t>(w) * h);

    // Image rows run top to bottom, model y runs bottom to top
    for (std::uint32_t y = 0; y < h; ++y) {
        const std::uint32_t image_row = py + (h - 1 - y);
        for (std::uint32_t x = 0; x < w; ++x) {
            const std::size_t idx = (static_cast<std::size_t>(image_row) * atlas.width + px + x) * 4;
            const std::uint32_t r = atlas.rgba[idx + 0];
            const std::uint32_t g = atlas.rgba[idx + 1];
            const std::uint32_t b = atlas.rgba[idx + 2];
            const std::uint32_t a = atlas.rgba[idx + 3];
            model.voxels[x + static_cast<std::size_t>(w) * y] = r | (g << 8) | (b << 16) | (a << 24);
        }
    }
    return model;
}

// =============================================================================
// GAME DATA
// =============================================================================

GameDataPtr build_game_data(const std::vector<BlockDefinition>& blocks,
                            const std::vector<ItemDefinition>& items,
                            AtlasImage atlas,
                            const Registry<TextureRect>& textures,
                            std::string& error) {
    if (!atlas.valid()) {
        error = "texture atlas is empty or has the wrong pixel count";
        return nullptr;
    }

    auto data = std::make_shared<GameData>();
    data->texture_atlas = std::move(atlas);

    data->blocks.register_entry("air", Block{"air", BlockType::AIR, {}});
    data->meshes.push_back(BlockMesh::empty());

    for (const auto& def : blocks) {
        std::array<TextureRect, FACE_COUNT> rects{};
        if (def.type == BlockType::NORMAL_CUBE) {
            for (std::uint8_t face = 0; face < FACE_COUNT; ++face) {
                const TextureRect* rect = textures.get_value_by_name(def.face_textures[face]);
                if (!rect) {
                    error = "block '" + def.name + "' uses unknown texture '" + def.face_textures[face] + "'";
                    return nullptr;
                }
                rects[face] = *rect;
            }
        }

        if (!data->blocks.register_entry(def.name, Block{def.name, def.type, def.face_textures})) {
            error = "duplicate block name '" + def.name + "'";
            return nullptr;
        }
        data->meshes.push_back(def.type == BlockType::NORMAL_CUBE ? BlockMesh::full_cube(rects)
                                                                  : BlockMesh::empty());
    }

    if (data->blocks.size() > static_cast<std::size_t>(UINT16_MAX) + 1) {
        error = "too many blocks for 16-bit block ids";
        return nullptr;
    }

    for (const auto& def : items) {
        const TextureRect* rect = textures.get_value_by_name(def.texture);
        if (!rect) {
            error = "item '" + def.name + "' uses unknown texture '" + def.texture + "'";
            return nullptr;
        }

        VoxelModel model = extrude_item_model(*rect, data->texture_atlas);

        ItemMesh mesh;
        mesh.mesh_center[0] = static_cast<float>(model.size_x) / 2.0f;
        mesh.mesh_center[1] = static_cast<float>(model.size_y) / 2.0f;
        mesh.mesh_center[2] = static_cast<float>(model.size_z) / 2.0f;
        mesh.scale = 1.0f / static_cast<float>(std::max({model.size_x, model.size_y, 1u}));

        if (!data->items.register_entry(def.name, Item{def.name, def.texture})) {
            error = "duplicate item name '" + def.name + "'";
            return nullptr;
        }
        auto model_id = data->models.register_entry("item:" + def.name, std::move(model));
        if (!model_id) {
            error = "duplicate model name 'item:" + def.name + "'";
            return nullptr;
        }
        mesh.mesh_id = *model_id;
        data->item_meshes.push_back(mesh);
    }

    std::printf("[GameData] %zu blocks, %zu items, atlas %ux%u\n",
                data->blocks.size(), data->items.size(),
                data->texture_atlas.width, data->texture_atlas.height);
    return data;
}

} // namespace voxstream::server
