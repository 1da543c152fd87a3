// =============================================================================
// VOXSTREAM - CHUNK
// Immutable 32^3 block grid. A changed chunk arrives as a new object.
// =============================================================================
#pragma once

#include "Shared/Types.hpp"

#include <algorithm>
#include <array>
#include <memory>

namespace voxstream {

// Full-size block payload, indexed by coord::to_index (Y fastest)
using BlockArray = std::array<BlockId, CHUNK_VOLUME>;

class Chunk {
public:
    static constexpr std::size_t DATA_SIZE_BYTES = sizeof(BlockArray);

    Chunk(ChunkPosition pos, const BlockArray& blocks)
        : Chunk(pos, std::make_unique<BlockArray>(blocks)) {}

    // Takes ownership of a filled array without copying. nullptr when
    // `blocks` is null.
    [[nodiscard]] static std::unique_ptr<Chunk> adopt(ChunkPosition pos, std::unique_ptr<BlockArray> blocks) {
        if (!blocks) {
            return nullptr;
        }
        return std::unique_ptr<Chunk>(new Chunk(pos, std::move(blocks)));
    }

    [[nodiscard]] static std::unique_ptr<Chunk> filled(ChunkPosition pos, BlockId id) {
        auto blocks = std::make_unique<BlockArray>();
        blocks->fill(id);
        return adopt(pos, std::move(blocks));
    }

    Chunk(const Chunk&) = delete;
    Chunk& operator=(const Chunk&) = delete;

    // Unchecked
    [[nodiscard]] BlockId get(LocalCoord x, LocalCoord y, LocalCoord z) const noexcept {
        return (*m_blocks)[coord::to_index(x, y, z)];
    }
    [[nodiscard]] BlockId get(VoxelIndex index) const noexcept { return (*m_blocks)[index]; }

    // Air outside [0, CHUNK_SIZE)
    [[nodiscard]] BlockId get_safe(LocalCoord x, LocalCoord y, LocalCoord z) const noexcept {
        return coord::is_valid_local(x, y, z) ? get(x, y, z) : AIR_BLOCK;
    }

    [[nodiscard]] const ChunkPosition& position() const noexcept { return m_position; }

    // Summaries taken once at construction
    [[nodiscard]] std::uint32_t count_solid() const noexcept { return m_solid; }
    [[nodiscard]] bool is_empty() const noexcept { return m_solid == 0; }
    [[nodiscard]] BlockId max_block_id() const noexcept { return m_max_id; }

private:
    // `blocks` is never null
    Chunk(ChunkPosition pos, std::unique_ptr<BlockArray> blocks)
        : m_blocks(std::move(blocks))
        , m_position(pos) {
        summarize();
    }

    void summarize() noexcept {
        const BlockArray& blocks = *m_blocks;
        m_solid = static_cast<std::uint32_t>(
            std::count_if(blocks.begin(), blocks.end(), [](BlockId id) { return id != AIR_BLOCK; }));
        m_max_id = *std::max_element(blocks.begin(), blocks.end());
    }

    std::unique_ptr<BlockArray> m_blocks;
    ChunkPosition m_position;
    std::uint32_t m_solid = 0;
    BlockId m_max_id = AIR_BLOCK;
};

static_assert(Chunk::DATA_SIZE_BYTES == 65536, "32^3 16-bit ids");

} // namespace voxstream
