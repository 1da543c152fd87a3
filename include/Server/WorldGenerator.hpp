// =============================================================================
// VOXSTREAM - WORLD GENERATOR
// Produces the chunks the integrated server streams to its players
// =============================================================================
#pragma once

#include "Shared/Types.hpp"
#include "Shared/Block.hpp"
#include "Shared/Chunk.hpp"
#include "Shared/Registry.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace voxstream::server {

// =============================================================================
// WORLD GENERATOR INTERFACE
// =============================================================================
class WorldGenerator {
public:
    virtual ~WorldGenerator() = default;

    // Full chunk at `pos`. Never returns nullptr.
    [[nodiscard]] virtual std::unique_ptr<Chunk> generate(ChunkPosition pos) const = 0;

    [[nodiscard]] virtual std::string_view type_name() const noexcept = 0;

    // False when the chunk is known to be all air and need not be sent
    [[nodiscard]] virtual bool should_generate([[maybe_unused]] ChunkPosition pos) const noexcept {
        return true;
    }
};

// =============================================================================
// SUPERFLAT CONFIGURATION
// Layers from bottom to top. The top layer ends at y = surface_y - 1, so a
// player whose feet are at surface_y stands on it.
// =============================================================================
struct SuperflatConfig {
    struct Layer {
        BlockId block;
        std::uint32_t thickness;
    };

    std::vector<Layer> layers;
    BlockCoord surface_y = 0;

    [[nodiscard]] std::uint32_t total_height() const noexcept {
        std::uint32_t height = 0;
        for (const auto& layer : layers) {
            height += layer.thickness;
        }
        return height;
    }

    [[nodiscard]] BlockCoord bottom_y() const noexcept {
        return surface_y - static_cast<BlockCoord>(total_height());
    }

    // Default layer stack, by block name
    static std::vector<std::pair<std::string, std::uint32_t>> default_layer_names() {
        return {{"stone", 4}, {"dirt", 3}, {"grass", 1}};
    }

    // Resolve block names through the registry. Unknown names yield nullopt.
    [[nodiscard]] static std::optional<SuperflatConfig> from_names(
        const Registry<Block>& blocks,
        const std::vector<std::pair<std::string, std::uint32_t>>& layer_names,
        std::string& error);
};

// =============================================================================
// SUPERFLAT GENERATOR
// =============================================================================
class SuperflatGenerator final : public WorldGenerator {
public:
    explicit SuperflatGenerator(SuperflatConfig config);
    ~SuperflatGenerator() override = default;

    [[nodiscard]] std::unique_ptr<Chunk> generate(ChunkPosition pos) const override;

    [[nodiscard]] std::string_view type_name() const noexcept override {
        return "superflat";
    }

    [[nodiscard]] bool should_generate(ChunkPosition pos) const noexcept override;

    [[nodiscard]] const SuperflatConfig& config() const noexcept { return m_config; }

    // Block at a world height, AIR_BLOCK outside the layer stack
    [[nodiscard]] BlockId block_at(BlockCoord world_y) const noexcept;

private:
    SuperflatConfig m_config;
};

} // namespace voxstream::server
