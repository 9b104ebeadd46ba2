#pragma once

/*
    EMBER UI САН

    ФАЙЛ: file_interface.hpp
    МОДУЛЬ: interfaces
    ЗОРИЛГО: Core-ийн бүх файл уншилт энэ интерфэйсээр дамжина.
            Host нь open/read/seek/tell/close-ийг өөрийн платформ дээр хэрэгжүүлнэ.
*/


#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "ember/core/types.hpp"

namespace ember
{
    class IFileInterface
    {
    public:
        virtual ~IFileInterface() = default;

        // Returns kInvalidFileHandle when the file cannot be opened.
        virtual FileHandle open(const std::string& path) = 0;
        virtual void close(FileHandle file) = 0;
        // Returns the number of bytes actually read, never more than size.
        virtual size_t read(void* buffer, size_t size, FileHandle file) = 0;
        virtual bool seek(FileHandle file, long offset, SeekOrigin origin) = 0;
        virtual size_t tell(FileHandle file) = 0;

        virtual size_t length(FileHandle file)
        {
            const size_t current = tell(file);
            if (!seek(file, 0, SeekOrigin::End)) return 0;
            const size_t end = tell(file);
            (void)seek(file, (long)current, SeekOrigin::Start);
            return end;
        }
    };

    inline bool read_file_to_vector(IFileInterface& files, const std::string& path, std::vector<uint8_t>& output)
    {
        output.clear();
        const FileHandle file = files.open(path);
        if (file == kInvalidFileHandle) return false;

        const size_t size = files.length(file);
        // length() reports 0 both for empty files and for streams that cannot
        // seek; only the former is a complete read.
        if (size == 0 && !files.seek(file, 0, SeekOrigin::End))
        {
            files.close(file);
            return false;
        }
        output.resize(size);
        size_t total = 0;
        while (total < size)
        {
            const size_t n = files.read(output.data() + total, size - total, file);
            if (n == 0) break;
            total += n;
        }
        files.close(file);
        output.resize(total);
        return total == size;
    }
}
