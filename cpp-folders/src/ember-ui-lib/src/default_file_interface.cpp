/*
    EMBER UI САН

    ФАЙЛ: default_file_interface.cpp
    МОДУЛЬ: host
    ЗОРИЛГО: default_file_interface.hpp-ийн хэрэгжүүлэлт.
*/

#include "ember/host/default_file_interface.hpp"

#include <cstdio>

#include "ember/text/string_utils.hpp"

namespace ember
{
    namespace
    {
        std::FILE* as_file(FileHandle file)
        {
            return reinterpret_cast<std::FILE*>(file);
        }

        int to_whence(SeekOrigin origin)
        {
            switch (origin)
            {
                case SeekOrigin::Start: return SEEK_SET;
                case SeekOrigin::Current: return SEEK_CUR;
                case SeekOrigin::End: return SEEK_END;
            }
            return SEEK_SET;
        }
    }

    std::string DefaultFileInterface::resolve(const std::string& path) const
    {
        return resolve_root_path(root_, path);
    }

    FileHandle DefaultFileInterface::open(const std::string& path)
    {
        std::FILE* f = std::fopen(resolve(path).c_str(), "rb");
        return reinterpret_cast<FileHandle>(f);
    }

    void DefaultFileInterface::close(FileHandle file)
    {
        if (file == kInvalidFileHandle) return;
        std::fclose(as_file(file));
    }

    size_t DefaultFileInterface::read(void* buffer, size_t size, FileHandle file)
    {
        if (file == kInvalidFileHandle || !buffer || size == 0) return 0;
        return std::fread(buffer, 1, size, as_file(file));
    }

    bool DefaultFileInterface::seek(FileHandle file, long offset, SeekOrigin origin)
    {
        if (file == kInvalidFileHandle) return false;
        return std::fseek(as_file(file), offset, to_whence(origin)) == 0;
    }

    size_t DefaultFileInterface::tell(FileHandle file)
    {
        if (file == kInvalidFileHandle) return 0;
        const long pos = std::ftell(as_file(file));
        return pos < 0 ? 0 : (size_t)pos;
    }
}
