#pragma once

/*
    EMBER UI САН

    ФАЙЛ: sdl_runtime.hpp
    МОДУЛЬ: platform
    ЗОРИЛГО: SDL2 цонх үүсгэж, software render interface-ийн RGBA8 гадаргууг дэлгэцэнд гаргана.
*/


#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>

#include <SDL2/SDL.h>
#include <SDL2/SDL_image.h>

#include "ember/platform/platform_runtime.hpp"

namespace ember
{
    // Owns SDL and SDL_image process state; create at most one.
    class SdlRuntime final : public IPlatformRuntime
    {
    public:
        SdlRuntime(const WindowDesc& win, const SurfaceDesc& surface)
            : surface_w_(surface.width), surface_h_(surface.height)
        {
            if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0)
            {
                fail("SDL_Init");
                return;
            }
            sdl_started_ = true;

            const int img_flags = IMG_INIT_PNG | IMG_INIT_JPG;
            if ((IMG_Init(img_flags) & img_flags) == 0)
            {
                error_ = std::string("IMG_Init: ") + IMG_GetError();
                return;
            }
            img_started_ = true;

            window_ = SDL_CreateWindow(
                win.title.c_str(),
                SDL_WINDOWPOS_CENTERED,
                SDL_WINDOWPOS_CENTERED,
                win.width,
                win.height,
                SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
            if (!window_)
            {
                fail("SDL_CreateWindow");
                return;
            }

            renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
            if (!renderer_)
            {
                fail("SDL_CreateRenderer");
                return;
            }
            // Window resizes letterbox the UI surface instead of stretching it.
            SDL_RenderSetLogicalSize(renderer_, surface_w_, surface_h_);

            texture_ = SDL_CreateTexture(renderer_, SDL_PIXELFORMAT_RGBA32, SDL_TEXTUREACCESS_STREAMING, surface_w_, surface_h_);
            if (!texture_)
            {
                fail("SDL_CreateTexture");
                return;
            }
            SDL_SetTextureBlendMode(texture_, SDL_BLENDMODE_NONE);
            valid_ = true;
        }

        SdlRuntime(const SdlRuntime&) = delete;
        SdlRuntime& operator=(const SdlRuntime&) = delete;

        ~SdlRuntime() override
        {
            if (texture_) SDL_DestroyTexture(texture_);
            if (renderer_) SDL_DestroyRenderer(renderer_);
            if (window_) SDL_DestroyWindow(window_);
            if (img_started_) IMG_Quit();
            if (sdl_started_) SDL_Quit();
        }

        bool valid() const override { return valid_; }
        const std::string& error() const { return error_; }

        bool pump_input(PlatformInputState& out) override
        {
            out = PlatformInputState{};

            SDL_Event e;
            while (SDL_PollEvent(&e))
            {
                if (e.type == SDL_QUIT)
                {
                    out.quit = true;
                    continue;
                }
                if (e.type != SDL_KEYDOWN || e.key.repeat) continue;
                switch (e.key.keysym.sym)
                {
                    case SDLK_ESCAPE: out.quit = true; break;
                    case SDLK_c: out.toggle_clip = true; break;
                    case SDLK_F5: out.reload_strings = true; break;
                    default: break;
                }
            }
            return !out.quit;
        }

        void set_title(const std::string& title) override
        {
            if (window_) SDL_SetWindowTitle(window_, title.c_str());
        }

        void upload_rgba8(const uint8_t* src, int width, int height, int src_pitch_bytes) override
        {
            if (!texture_ || !src) return;
            void* dst = nullptr;
            int dst_pitch = 0;
            if (SDL_LockTexture(texture_, nullptr, &dst, &dst_pitch) != 0) return;

            // Anything larger than the streaming texture is cropped.
            const int rows = std::min(height, surface_h_);
            const size_t row_bytes = (size_t)std::min(width, surface_w_) * 4u;
            auto* d = static_cast<uint8_t*>(dst);
            for (int y = 0; y < rows; ++y)
            {
                std::memcpy(d + (size_t)y * (size_t)dst_pitch, src + (size_t)y * (size_t)src_pitch_bytes, row_bytes);
            }
            SDL_UnlockTexture(texture_);
        }

        void present() override
        {
            if (!renderer_ || !texture_) return;
            SDL_SetRenderDrawColor(renderer_, 0, 0, 0, 255);
            SDL_RenderClear(renderer_);
            SDL_RenderCopy(renderer_, texture_, nullptr, nullptr);
            SDL_RenderPresent(renderer_);
        }

    private:
        void fail(const char* what)
        {
            error_ = std::string(what) + ": " + SDL_GetError();
        }

        int surface_w_ = 0;
        int surface_h_ = 0;
        bool valid_ = false;
        bool sdl_started_ = false;
        bool img_started_ = false;
        std::string error_{};
        SDL_Window* window_ = nullptr;
        SDL_Renderer* renderer_ = nullptr;
        SDL_Texture* texture_ = nullptr;
    };
}
