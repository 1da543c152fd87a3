// =============================================================================
// VOXSTREAM - WORLD (CHUNK STORE)
// =============================================================================
#pragma once

#include "Shared/Types.hpp"
#include "Shared/Chunk.hpp"

#include <memory>
#include <unordered_map>
#include <vector>

namespace voxstream {

// Session-local chunk store. Storing at an occupied position replaces the
// chunk there; reads outside every stored chunk return air. Owned and mutated
// by one thread.
class World {
public:
    using ChunkPtr = std::unique_ptr<Chunk>;

    // Takes ownership; returns false and stores nothing for a null chunk
    bool set_chunk(ChunkPtr chunk);

    [[nodiscard]] const Chunk* get_chunk(ChunkPosition pos) const;
    [[nodiscard]] const Chunk* get_chunk(ChunkCoord x, ChunkCoord y, ChunkCoord z) const {
        return get_chunk(ChunkPosition{x, y, z});
    }
    [[nodiscard]] bool has_chunk(ChunkPosition pos) const { return get_chunk(pos) != nullptr; }

    [[nodiscard]] BlockId get_block(const BlockPosition& pos) const;
    [[nodiscard]] BlockId get_block(BlockCoord x, BlockCoord y, BlockCoord z) const {
        return get_block(BlockPosition{x, y, z});
    }

    [[nodiscard]] std::size_t chunk_count() const noexcept { return m_chunks.size(); }
    [[nodiscard]] std::vector<ChunkPosition> get_loaded_positions() const;

    // set_chunk calls that overwrote a stored chunk
    [[nodiscard]] std::uint64_t replaced_count() const noexcept { return m_replaced; }

private:
    std::unordered_map<ChunkPosition, ChunkPtr> m_chunks;
    std::uint64_t m_replaced = 0;
};

} // namespace voxstream
