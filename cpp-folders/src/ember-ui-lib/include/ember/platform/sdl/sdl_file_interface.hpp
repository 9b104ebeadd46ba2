#pragma once

/*
    EMBER UI САН

    ФАЙЛ: sdl_file_interface.hpp
    МОДУЛЬ: platform
    ЗОРИЛГО: SDL_RWops дээр суурилсан file interface (Android asset зэрэг SDL-ийн
            файлын эх үүсвэрүүдийг core-д нээж өгнө).
*/


#include <cstdint>
#include <string>
#include <utility>

#include <SDL2/SDL.h>

#include "ember/interfaces/file_interface.hpp"
#include "ember/text/string_utils.hpp"

namespace ember
{
    // Handles are the SDL_RWops pointers themselves.
    class SdlFileInterface final : public IFileInterface
    {
    public:
        SdlFileInterface() = default;
        explicit SdlFileInterface(std::string root) : root_(std::move(root)) {}

        FileHandle open(const std::string& path) override
        {
            const std::string full = resolve_root_path(root_, path);
            SDL_RWops* rw = SDL_RWFromFile(full.c_str(), "rb");
            return reinterpret_cast<FileHandle>(rw);
        }

        void close(FileHandle file) override
        {
            if (file == kInvalidFileHandle) return;
            SDL_RWclose(as_rw(file));
        }

        size_t read(void* buffer, size_t size, FileHandle file) override
        {
            if (file == kInvalidFileHandle || !buffer || size == 0) return 0;
            return SDL_RWread(as_rw(file), buffer, 1, size);
        }

        bool seek(FileHandle file, long offset, SeekOrigin origin) override
        {
            if (file == kInvalidFileHandle) return false;
            int whence = RW_SEEK_SET;
            if (origin == SeekOrigin::Current) whence = RW_SEEK_CUR;
            if (origin == SeekOrigin::End) whence = RW_SEEK_END;
            return SDL_RWseek(as_rw(file), (Sint64)offset, whence) >= 0;
        }

        size_t tell(FileHandle file) override
        {
            if (file == kInvalidFileHandle) return 0;
            const Sint64 pos = SDL_RWtell(as_rw(file));
            return pos < 0 ? 0 : (size_t)pos;
        }

        size_t length(FileHandle file) override
        {
            if (file == kInvalidFileHandle) return 0;
            const Sint64 size = SDL_RWsize(as_rw(file));
            return size < 0 ? IFileInterface::length(file) : (size_t)size;
        }

    private:
        static SDL_RWops* as_rw(FileHandle file)
        {
            return reinterpret_cast<SDL_RWops*>(file);
        }

        std::string root_{};
    };
}
