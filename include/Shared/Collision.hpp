// =============================================================================
// VOXSTREAM - AABB COLLISION RESOLUTION
// Axis-by-axis sweep of a box against solid unit blocks
// =============================================================================
#pragma once

#include "Shared/Types.hpp"
#include "Shared/Block.hpp"
#include "Shared/World.hpp"

#include <cmath>
#include <cstdint>
#include <vector>

namespace voxstream {

// =============================================================================
// AXIS-ALIGNED BOUNDING BOX
// =============================================================================
struct AABB {
    double min_x, min_y, min_z;
    double max_x, max_y, max_z;

    // Create AABB from center and half-extents
    static AABB from_center(double cx, double cy, double cz,
                            double half_width, double half_height, double half_depth) {
        return AABB{
            cx - half_width, cy - half_height, cz - half_depth,
            cx + half_width, cy + half_height, cz + half_depth
        };
    }

    // Create AABB for a block at world position
    static AABB from_block(std::int64_t x, std::int64_t y, std::int64_t z) {
        return AABB{
            static_cast<double>(x), static_cast<double>(y), static_cast<double>(z),
            static_cast<double>(x + 1), static_cast<double>(y + 1), static_cast<double>(z + 1)
        };
    }

    // Strict overlap: touching faces do not intersect
    [[nodiscard]] bool intersects(const AABB& other) const noexcept {
        return (max_x > other.min_x && min_x < other.max_x) &&
               (max_y > other.min_y && min_y < other.max_y) &&
               (max_z > other.min_z && min_z < other.max_z);
    }

    [[nodiscard]] AABB offset(double dx, double dy, double dz) const noexcept {
        return AABB{
            min_x + dx, min_y + dy, min_z + dz,
            max_x + dx, max_y + dy, max_z + dz
        };
    }
};

struct Displacement {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    [[nodiscard]] bool operator==(const Displacement& other) const noexcept = default;
};

// =============================================================================
// COLLISION RESOLVER
// Resolves X, then Y, then Z. Each axis sweeps from the box already moved by
// the previous axes. Movement stops flush against the first solid layer; blocks
// the box overlaps before moving are ignored.
// =============================================================================
class CollisionResolver {
public:
    template<typename IsSolidFn>
    [[nodiscard]] static Displacement resolve(const AABB& box, const Displacement& requested,
                                              IsSolidFn&& is_solid) {
        AABB current = box;
        Displacement actual{};

        actual.x = sweep_axis(current, requested.x, AXIS_X, is_solid);
        current = current.offset(actual.x, 0.0, 0.0);

        actual.y = sweep_axis(current, requested.y, AXIS_Y, is_solid);
        current = current.offset(0.0, actual.y, 0.0);

        actual.z = sweep_axis(current, requested.z, AXIS_Z, is_solid);
        return actual;
    }

    // Solidity from the chunk store: a block is solid when its mesh is opaque
    [[nodiscard]] static Displacement resolve(const AABB& box, const Displacement& requested,
                                              const World& world, const std::vector<BlockMesh>& meshes) {
        return resolve(box, requested, [&](BlockCoord x, BlockCoord y, BlockCoord z) {
            const BlockId id = world.get_block(x, y, z);
            return id < meshes.size() && meshes[id].is_opaque();
        });
    }

private:
    enum Axis { AXIS_X = 0, AXIS_Y = 1, AXIS_Z = 2 };

    [[nodiscard]] static double lo(const AABB& b, int axis) noexcept {
        return axis == AXIS_X ? b.min_x : (axis == AXIS_Y ? b.min_y : b.min_z);
    }

    [[nodiscard]] static double hi(const AABB& b, int axis) noexcept {
        return axis == AXIS_X ? b.max_x : (axis == AXIS_Y ? b.max_y : b.max_z);
    }

    // Block range strictly overlapped by [min, max)
    [[nodiscard]] static std::int64_t first_block(double min) noexcept {
        return static_cast<std::int64_t>(std::floor(min));
    }

    [[nodiscard]] static std::int64_t last_block(double max) noexcept {
        return static_cast<std::int64_t>(std::ceil(max)) - 1;
    }

    // Any solid block in the layer at `layer` along `axis` that overlaps the box
    // on the two other axes
    template<typename IsSolidFn>
    [[nodiscard]] static bool layer_blocked(const AABB& box, int axis, std::int64_t layer,
                                            IsSolidFn& is_solid) {
        const int a1 = (axis + 1) % 3;
        const int a2 = (axis + 2) % 3;
        const std::int64_t a1_min = first_block(lo(box, a1));
        const std::int64_t a1_max = last_block(hi(box, a1));
        const std::int64_t a2_min = first_block(lo(box, a2));
        const std::int64_t a2_max = last_block(hi(box, a2));

        for (std::int64_t i = a1_min; i <= a1_max; ++i) {
            for (std::int64_t j = a2_min; j <= a2_max; ++j) {
                std::int64_t c[3];
                c[axis] = layer;
                c[a1] = i;
                c[a2] = j;
                if (is_solid(c[0], c[1], c[2])) {
                    return true;
                }
            }
        }
        return false;
    }

    template<typename IsSolidFn>
    [[nodiscard]] static double sweep_axis(const AABB& box, double delta, int axis,
                                           IsSolidFn& is_solid) {
        if (delta == 0.0) {
            return 0.0;
        }

        const double box_lo = lo(box, axis);
        const double box_hi = hi(box, axis);

        if (delta > 0.0) {
            // Layers whose near face lies in [box_hi, box_hi + delta)
            const std::int64_t start = static_cast<std::int64_t>(std::ceil(box_hi));
            const std::int64_t end = static_cast<std::int64_t>(std::ceil(box_hi + delta)) - 1;
            for (std::int64_t layer = start; layer <= end; ++layer) {
                if (layer_blocked(box, axis, layer, is_solid)) {
                    const double allowed = static_cast<double>(layer) - box_hi;
                    return allowed < delta ? allowed : delta;
                }
            }
            return delta;
        }

        // Layers whose far face lies in (box_lo + delta, box_lo]
        const std::int64_t start = static_cast<std::int64_t>(std::floor(box_lo)) - 1;
        const std::int64_t end = static_cast<std::int64_t>(std::floor(box_lo + delta));
        for (std::int64_t layer = start; layer >= end; --layer) {
            if (layer_blocked(box, axis, layer, is_solid)) {
                const double allowed = static_cast<double>(layer + 1) - box_lo;
                return allowed > delta ? allowed : delta;
            }
        }
        return delta;
    }
};

} // namespace voxstream
