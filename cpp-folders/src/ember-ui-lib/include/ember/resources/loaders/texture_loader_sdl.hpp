#pragma once

/*
    EMBER UI САН

    ФАЙЛ: texture_loader_sdl.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: Энэ файл нь ember-ui-lib-ийн resources модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <string>
#include <vector>

#include <SDL2/SDL.h>
#include <SDL2/SDL_image.h>

#include "ember/core/result.hpp"
#include "ember/interfaces/file_interface.hpp"
#include "ember/resources/texture.hpp"

namespace ember
{
    // Bytes come through the host file interface; SDL2_image only decodes.
    inline Result<Texture2DData> load_texture2d_sdl_image(IFileInterface& files, const std::string& path)
    {
        std::vector<uint8_t> bytes{};
        if (!read_file_to_vector(files, path, bytes) || bytes.empty())
        {
            return Result<Texture2DData>::failure("Cannot read image file: " + path);
        }

        SDL_RWops* rw = SDL_RWFromConstMem(bytes.data(), (int)bytes.size());
        if (!rw) return Result<Texture2DData>::failure(std::string("SDL_RWFromConstMem failed: ") + SDL_GetError());

        SDL_Surface* loaded = IMG_Load_RW(rw, 1);
        if (!loaded) return Result<Texture2DData>::failure("IMG_Load_RW failed for " + path + ": " + IMG_GetError());

        SDL_Surface* rgba = SDL_ConvertSurfaceFormat(loaded, SDL_PIXELFORMAT_RGBA32, 0);
        SDL_FreeSurface(loaded);
        if (!rgba) return Result<Texture2DData>::failure(std::string("SDL_ConvertSurfaceFormat failed: ") + SDL_GetError());

        Texture2DData out{rgba->w, rgba->h, Color{0, 0, 0, 0}};
        out.source_path = path;

        auto* pixels = static_cast<uint8_t*>(rgba->pixels);
        const int pitch = rgba->pitch;
        for (int y = 0; y < out.h; ++y)
        {
            auto* row = reinterpret_cast<uint32_t*>(pixels + y * pitch);
            for (int x = 0; x < out.w; ++x)
            {
                uint8_t r = 0, g = 0, b = 0, a = 0;
                SDL_GetRGBA(row[x], rgba->format, &r, &g, &b, &a);
                out.at(x, y) = Color{r, g, b, a};
            }
        }

        SDL_FreeSurface(rgba);
        return Result<Texture2DData>::success(std::move(out));
    }
}
