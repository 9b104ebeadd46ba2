#pragma once

/*
    EMBER UI САН

    ФАЙЛ: default_file_interface.hpp
    МОДУЛЬ: host
    ЗОРИЛГО: <cstdio> дээр суурилсан анхдагч file interface.
*/


#include <string>

#include "ember/interfaces/file_interface.hpp"

namespace ember
{
    // Handles are the FILE* values themselves.
    class DefaultFileInterface final : public IFileInterface
    {
    public:
        DefaultFileInterface() = default;
        explicit DefaultFileInterface(std::string root) : root_(std::move(root)) {}

        FileHandle open(const std::string& path) override;
        void close(FileHandle file) override;
        size_t read(void* buffer, size_t size, FileHandle file) override;
        bool seek(FileHandle file, long offset, SeekOrigin origin) override;
        size_t tell(FileHandle file) override;

        const std::string& root() const { return root_; }

    private:
        std::string resolve(const std::string& path) const;

        std::string root_{};
    };
}
