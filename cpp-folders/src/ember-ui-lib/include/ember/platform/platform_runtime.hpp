#pragma once

/*
    EMBER UI САН

    ФАЙЛ: platform_runtime.hpp
    МОДУЛЬ: platform
    ЗОРИЛГО: Sample-ийн цонх, оролт, RGBA8 гадаргуу дэлгэцэнд гаргах platform давхарга.
*/


#include <cstdint>
#include <string>

namespace ember
{
    struct WindowDesc
    {
        std::string title{};
        int width = 1280;
        int height = 720;
    };

    struct SurfaceDesc
    {
        int width = 800;
        int height = 600;
    };

    struct PlatformInputState
    {
        bool quit = false;
        bool toggle_clip = false;
        bool reload_strings = false;
    };

    // Presents a CPU-rendered RGBA8 surface and reports UI input.
    class IPlatformRuntime
    {
    public:
        virtual ~IPlatformRuntime() = default;

        virtual bool valid() const = 0;
        virtual bool pump_input(PlatformInputState& out) = 0;
        virtual void set_title(const std::string& title) = 0;
        virtual void upload_rgba8(const uint8_t* src, int width, int height, int src_pitch_bytes) = 0;
        virtual void present() = 0;
    };
}
