#pragma once

/*
    EMBER UI САН

    ФАЙЛ: types.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Host interface-уудын хооронд дамжих handle, vertex, scissor төрлүүд.
            Бүх handle-ийн 0 утга нь "хүчингүй" гэсэн утгатай.
*/


#include <algorithm>
#include <cstdint>

#include <glm/glm.hpp>

#include "ember/gfx/rt_types.hpp"

namespace ember
{
    using FileHandle = uintptr_t;
    using TextureHandle = uintptr_t;
    using CompiledGeometryHandle = uintptr_t;

    inline constexpr FileHandle kInvalidFileHandle = 0;
    inline constexpr TextureHandle kInvalidTextureHandle = 0;
    inline constexpr CompiledGeometryHandle kInvalidCompiledGeometryHandle = 0;

    enum class SeekOrigin : uint8_t
    {
        Start = 0,
        Current = 1,
        End = 2
    };

    // Position is in pixels relative to the render context's top-left corner.
    struct Vertex
    {
        glm::vec2 position{0.0f};
        Color colour{255, 255, 255, 255};
        glm::vec2 tex_coord{0.0f};
    };

    struct ScissorRect
    {
        int x = 0;
        int y = 0;
        int w = 0;
        int h = 0;

        bool empty() const { return w <= 0 || h <= 0; }

        bool contains(int px, int py) const
        {
            return px >= x && py >= y && px < x + w && py < y + h;
        }
    };

    inline bool operator==(const ScissorRect& lhs, const ScissorRect& rhs)
    {
        return lhs.x == rhs.x && lhs.y == rhs.y && lhs.w == rhs.w && lhs.h == rhs.h;
    }

    inline bool operator!=(const ScissorRect& lhs, const ScissorRect& rhs)
    {
        return !(lhs == rhs);
    }

    inline ScissorRect intersect_rects(const ScissorRect& a, const ScissorRect& b)
    {
        const int x0 = std::max(a.x, b.x);
        const int y0 = std::max(a.y, b.y);
        const int x1 = std::min(a.x + a.w, b.x + b.w);
        const int y1 = std::min(a.y + a.h, b.y + b.h);
        return ScissorRect{x0, y0, std::max(0, x1 - x0), std::max(0, y1 - y0)};
    }
}
