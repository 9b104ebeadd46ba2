#pragma once

/*
    EMBER UI САН

    ФАЙЛ: texture_database.hpp
    МОДУЛЬ: render
    ЗОРИЛГО: Texture-ийг эх нэрээр нь нэг удаа ачаалж, хэрэглэгчид дундаа хуваалцах сан.
            Сүүлийн хэрэглэгч суллахад render interface-ийн handle-ийг буцааж өгнө.
*/


#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>

#include "ember/core/types.hpp"

namespace ember
{
    class Core;
    class IRenderInterface;

    // Fills a tightly packed RGBA8 buffer. Returning false fails the texture.
    using TextureGenerator = std::function<bool(std::vector<uint8_t>& rgba, glm::ivec2& dimensions)>;

    class TextureResource
    {
    public:
        TextureResource(Core& core, std::string source);
        TextureResource(Core& core, std::string key, TextureGenerator generator);
        ~TextureResource();

        TextureResource(const TextureResource&) = delete;
        TextureResource& operator=(const TextureResource&) = delete;

        // Loads on first use. Returns kInvalidTextureHandle when loading failed.
        TextureHandle handle();
        glm::ivec2 dimensions();

        const std::string& source() const { return source_; }
        bool generated() const { return static_cast<bool>(generator_); }
        bool loaded() const { return handle_ != kInvalidTextureHandle; }
        bool load_failed() const { return load_failed_; }

        // Gives the handle back to the render interface. The next handle() call
        // loads again.
        void release();

    private:
        bool load();

        Core& core_;
        std::string source_{};
        TextureGenerator generator_{};
        IRenderInterface* owner_ = nullptr;
        TextureHandle handle_ = kInvalidTextureHandle;
        glm::ivec2 dimensions_{0};
        bool load_failed_ = false;
    };

    class TextureDatabase
    {
    public:
        explicit TextureDatabase(Core& core) : core_(core) {}

        // source is resolved against document_path through the system interface.
        std::shared_ptr<TextureResource> fetch(const std::string& source, const std::string& document_path = {});
        std::shared_ptr<TextureResource> generate(const std::string& key, TextureGenerator generator);

        void release_all();
        size_t size();

    private:
        void prune();

        Core& core_;
        std::unordered_map<std::string, std::weak_ptr<TextureResource>> cache_{};
    };
}
