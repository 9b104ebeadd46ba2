#pragma once

/*
    EMBER UI САН

    ФАЙЛ: texture.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: Энэ файл нь ember-ui-lib-ийн resources модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "ember/gfx/rt_types.hpp"

namespace ember
{
    // Row 0 is the top row.
    struct Texture2DData
    {
        std::string source_path{};
        int w = 0;
        int h = 0;
        std::vector<Color> texels{};

        Texture2DData() = default;
        Texture2DData(int W, int H, Color clear = {0, 0, 0, 255})
            : w(W), h(H), texels((size_t)W * (size_t)H, clear)
        {}

        bool valid() const
        {
            return w > 0 && h > 0 && texels.size() == (size_t)w * (size_t)h;
        }

        Color& at(int x, int y)
        {
            return texels[(size_t)y * (size_t)w + (size_t)x];
        }

        const Color& at(int x, int y) const
        {
            return texels[(size_t)y * (size_t)w + (size_t)x];
        }
    };

    inline Texture2DData texture_from_rgba8(std::span<const uint8_t> rgba, int w, int h)
    {
        if (w <= 0 || h <= 0 || rgba.size() < (size_t)w * (size_t)h * 4u) return Texture2DData{};
        Texture2DData out{w, h};
        for (size_t i = 0; i < out.texels.size(); ++i)
        {
            out.texels[i] = Color{rgba[i * 4 + 0], rgba[i * 4 + 1], rgba[i * 4 + 2], rgba[i * 4 + 3]};
        }
        return out;
    }
}
