/*
    EMBER UI САН

    ФАЙЛ: texture_database.cpp
    МОДУЛЬ: render
    ЗОРИЛГО: texture_database.hpp-ийн хэрэгжүүлэлт.
*/

#include "ember/render/texture_database.hpp"

#include <span>
#include <utility>

#include "ember/core/core.hpp"

namespace ember
{
    namespace
    {
        constexpr const char* kGeneratedPrefix = "?generated:";
    }

    TextureResource::TextureResource(Core& core, std::string source)
        : core_(core), source_(std::move(source))
    {}

    TextureResource::TextureResource(Core& core, std::string key, TextureGenerator generator)
        : core_(core), source_(std::move(key)), generator_(std::move(generator))
    {}

    TextureResource::~TextureResource()
    {
        release();
    }

    TextureHandle TextureResource::handle()
    {
        if (handle_ == kInvalidTextureHandle && !load_failed_) (void)load();
        return handle_;
    }

    glm::ivec2 TextureResource::dimensions()
    {
        (void)handle();
        return dimensions_;
    }

    void TextureResource::release()
    {
        if (handle_ != kInvalidTextureHandle && owner_)
        {
            owner_->release_texture(handle_);
        }
        handle_ = kInvalidTextureHandle;
        owner_ = nullptr;
        dimensions_ = glm::ivec2(0);
        load_failed_ = false;
    }

    bool TextureResource::load()
    {
        IRenderInterface* render = core_.render_interface();
        if (!render)
        {
            (void)core_.log(LogType::Error, "Cannot load texture '" + source_ + "': no render interface installed.");
            load_failed_ = true;
            return false;
        }

        TextureHandle h = kInvalidTextureHandle;
        glm::ivec2 dims{0};
        bool ok = false;
        if (generator_)
        {
            std::vector<uint8_t> rgba{};
            if (!generator_(rgba, dims))
            {
                (void)core_.log(LogType::Warning, "Texture generator for '" + source_ + "' produced no data.");
            }
            else if (dims.x <= 0 || dims.y <= 0 || rgba.size() != (size_t)dims.x * (size_t)dims.y * 4u)
            {
                (void)core_.log(LogType::Error, "Texture generator for '" + source_ + "' returned a buffer that does not match its dimensions.");
            }
            else
            {
                ok = render->generate_texture(h, std::span<const uint8_t>(rgba.data(), rgba.size()), dims);
            }
        }
        else
        {
            ok = render->load_texture(h, dims, source_);
        }

        if (!ok || h == kInvalidTextureHandle)
        {
            (void)core_.log(LogType::Warning, "Failed to load texture from '" + source_ + "'.");
            load_failed_ = true;
            return false;
        }

        handle_ = h;
        dimensions_ = dims;
        owner_ = render;
        return true;
    }

    std::shared_ptr<TextureResource> TextureDatabase::fetch(const std::string& source, const std::string& document_path)
    {
        std::string resolved = source;
        if (!document_path.empty())
        {
            if (ISystemInterface* system = core_.system_interface()) resolved = system->join_path(document_path, source);
            else resolved = join_document_path(document_path, source);
        }

        auto it = cache_.find(resolved);
        if (it != cache_.end())
        {
            if (auto live = it->second.lock()) return live;
        }

        auto created = std::make_shared<TextureResource>(core_, resolved);
        cache_[resolved] = created;
        return created;
    }

    std::shared_ptr<TextureResource> TextureDatabase::generate(const std::string& key, TextureGenerator generator)
    {
        const std::string cache_key = std::string(kGeneratedPrefix) + key;
        auto it = cache_.find(cache_key);
        if (it != cache_.end())
        {
            if (auto live = it->second.lock()) return live;
        }

        auto created = std::make_shared<TextureResource>(core_, key, std::move(generator));
        cache_[cache_key] = created;
        return created;
    }

    void TextureDatabase::release_all()
    {
        for (auto& [key, weak] : cache_)
        {
            (void)key;
            if (auto live = weak.lock()) live->release();
        }
        prune();
    }

    size_t TextureDatabase::size()
    {
        prune();
        return cache_.size();
    }

    void TextureDatabase::prune()
    {
        for (auto it = cache_.begin(); it != cache_.end();)
        {
            if (it->second.expired()) it = cache_.erase(it);
            else ++it;
        }
    }
}
