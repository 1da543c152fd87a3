// =============================================================================
// VOXSTREAM - WORLD IMPLEMENTATION
// =============================================================================

#include "Shared/World.hpp"
#include "Shared/Logger.hpp"

namespace voxstream {

bool World::set_chunk(ChunkPtr chunk) {
    if (!chunk) {
        return false;
    }

    const ChunkPosition pos = chunk->position();
    auto [it, inserted] = m_chunks.try_emplace(pos, nullptr);
    if (!inserted) {
        ++m_replaced;
        LOG("World", "Chunk (", pos.x, ", ", pos.y, ", ", pos.z, ") replaced");
    }
    it->second = std::move(chunk);
    return true;
}

const Chunk* World::get_chunk(ChunkPosition pos) const {
    auto it = m_chunks.find(pos);
    return it == m_chunks.end() ? nullptr : it->second.get();
}

BlockId World::get_block(const BlockPosition& pos) const {
    const Chunk* chunk = get_chunk(pos.chunk());
    return chunk ? chunk->get(pos.local_x(), pos.local_y(), pos.local_z()) : AIR_BLOCK;
}

std::vector<ChunkPosition> World::get_loaded_positions() const {
    std::vector<ChunkPosition> positions;
    positions.reserve(m_chunks.size());
    for (const auto& entry : m_chunks) {
        positions.push_back(entry.first);
    }
    return positions;
}

} // namespace voxstream
