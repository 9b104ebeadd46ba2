#pragma once

/*
    EMBER UI САН

    ФАЙЛ: sdl_system_interface.hpp
    МОДУЛЬ: platform
    ЗОРИЛГО: SDL2-ийн high resolution counter болон SDL_Log-ийг ашигласан system interface.
*/


#include <cstdint>
#include <string>

#include <SDL2/SDL.h>

#include "ember/host/string_table.hpp"
#include "ember/interfaces/system_interface.hpp"

namespace ember
{
    inline SDL_LogPriority sdl_log_priority(LogType type)
    {
        switch (type)
        {
            case LogType::Always: return SDL_LOG_PRIORITY_INFO;
            case LogType::Error: return SDL_LOG_PRIORITY_ERROR;
            case LogType::Assert: return SDL_LOG_PRIORITY_CRITICAL;
            case LogType::Warning: return SDL_LOG_PRIORITY_WARN;
            case LogType::Info: return SDL_LOG_PRIORITY_INFO;
            case LogType::Debug: return SDL_LOG_PRIORITY_DEBUG;
        }
        return SDL_LOG_PRIORITY_INFO;
    }

    class SdlSystemInterface final : public ISystemInterface
    {
    public:
        // Requires SDL_Init to have run (SdlRuntime does it).
        SdlSystemInterface()
            : start_ticks_(SDL_GetPerformanceCounter()),
              tick_hz_((double)SDL_GetPerformanceFrequency())
        {}

        double elapsed_time() override
        {
            const uint64_t now = SDL_GetPerformanceCounter();
            return (double)(now - start_ticks_) / tick_hz_;
        }

        int translate_string(std::string& translated, const std::string& input) override
        {
            if (!strings_) return ISystemInterface::translate_string(translated, input);
            return strings_->translate(translated, input);
        }

        bool log_message(LogType type, const std::string& message) override
        {
            SDL_LogMessage(SDL_LOG_CATEGORY_APPLICATION, sdl_log_priority(type), "[ember] %s", message.c_str());
            // Asserts stop in the debugger when one is attached.
            return !(type == LogType::Assert && break_on_assert_);
        }

        void set_string_table(const StringTable* strings) { strings_ = strings; }
        void set_break_on_assert(bool enabled) { break_on_assert_ = enabled; }

    private:
        uint64_t start_ticks_ = 0;
        double tick_hz_ = 1.0;
        const StringTable* strings_ = nullptr;
        bool break_on_assert_ = false;
    };
}
