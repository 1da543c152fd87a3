// =============================================================================
// VOXSTREAM - WORLD GENERATOR IMPLEMENTATION
// =============================================================================

#include "Server/WorldGenerator.hpp"

namespace voxstream::server {

// =============================================================================
// SUPERFLAT CONFIGURATION
// =============================================================================

std::optional<SuperflatConfig> SuperflatConfig::from_names(
    const Registry<Block>& blocks,
    const std::vector<std::pair<std::string, std::uint32_t>>& layer_names,
    std::string& error)
{
    SuperflatConfig config;
    for (const auto& [name, thickness] : layer_names) {
        auto id = blocks.get_id_by_name(name);
        if (!id) {
            error = "superflat layer uses unknown block '" + name + "'";
            return std::nullopt;
        }
        config.layers.push_back(Layer{static_cast<BlockId>(*id), thickness});
    }
    return config;
}

// =============================================================================
// SUPERFLAT GENERATOR
// =============================================================================

SuperflatGenerator::SuperflatGenerator(SuperflatConfig config)
    : m_config(std::move(config))
{}

BlockId SuperflatGenerator::block_at(BlockCoord world_y) const noexcept {
    if (world_y < m_config.bottom_y() || world_y >= m_config.surface_y) {
        return AIR_BLOCK;
    }

    BlockCoord layer_top = m_config.bottom_y();
    for (const auto& layer : m_config.layers) {
        layer_top += static_cast<BlockCoord>(layer.thickness);
        if (world_y < layer_top) {
            return layer.block;
        }
    }
    return AIR_BLOCK;
}

bool SuperflatGenerator::should_generate(ChunkPosition pos) const noexcept {
    const BlockCoord chunk_bottom = coord::chunk_to_world(pos.y);
    const BlockCoord chunk_top = chunk_bottom + static_cast<BlockCoord>(CHUNK_SIZE);

    // Chunk entirely above or below the layer stack
    return chunk_bottom < m_config.surface_y && chunk_top > m_config.bottom_y();
}

std::unique_ptr<Chunk> SuperflatGenerator::generate(ChunkPosition pos) const {
    const BlockCoord chunk_bottom = coord::chunk_to_world(pos.y);

    // Block id for each local Y, the same in every column
    BlockId layer_types[CHUNK_SIZE];
    for (std::uint32_t local_y = 0; local_y < CHUNK_SIZE; ++local_y) {
        layer_types[local_y] = block_at(chunk_bottom + static_cast<BlockCoord>(local_y));
    }

    // Column-major fill (Y varies fastest)
    auto blocks = std::make_unique<BlockArray>();
    for (LocalCoord x = 0; x < static_cast<LocalCoord>(CHUNK_SIZE); ++x) {
        for (LocalCoord z = 0; z < static_cast<LocalCoord>(CHUNK_SIZE); ++z) {
            for (LocalCoord y = 0; y < static_cast<LocalCoord>(CHUNK_SIZE); ++y) {
                (*blocks)[coord::to_index(x, y, z)] = layer_types[y];
            }
        }
    }

    return Chunk::adopt(pos, std::move(blocks));
}

} // namespace voxstream::server
