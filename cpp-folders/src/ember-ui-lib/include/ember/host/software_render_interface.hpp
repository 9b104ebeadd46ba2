#pragma once

/*
    EMBER UI САН

    ФАЙЛ: software_render_interface.hpp
    МОДУЛЬ: host
    ЗОРИЛГО: CPU дээр RT_ColorLDR руу гурвалжин растерчлах render interface.
            Scissor, texture, compiled geometry-г бүрэн дэмжинэ.
*/


#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>

#include "ember/core/result.hpp"
#include "ember/gfx/rt_types.hpp"
#include "ember/interfaces/file_interface.hpp"
#include "ember/interfaces/render_interface.hpp"
#include "ember/resources/texture.hpp"

namespace ember
{
    using TextureLoadFn = std::function<Result<Texture2DData>(const std::string& source)>;

    struct SoftwareRasterStats
    {
        uint64_t draw_calls = 0;
        uint64_t compiled_draw_calls = 0;
        uint64_t tri_input = 0;
        uint64_t tri_raster = 0;
        uint64_t pixels_written = 0;

        void reset()
        {
            draw_calls = 0;
            compiled_draw_calls = 0;
            tri_input = 0;
            tri_raster = 0;
            pixels_written = 0;
        }
    };

    class SoftwareRenderInterface : public IRenderInterface
    {
    public:
        // files is used by the built-in TGA loader and may be null.
        explicit SoftwareRenderInterface(RT_ColorLDR& target, IFileInterface* files = nullptr);

        void render_geometry(
            std::span<const Vertex> vertices,
            std::span<const int> indices,
            TextureHandle texture,
            const glm::vec2& translation) override;

        CompiledGeometryHandle compile_geometry(
            std::span<const Vertex> vertices,
            std::span<const int> indices,
            TextureHandle texture) override;
        void render_compiled_geometry(CompiledGeometryHandle geometry, const glm::vec2& translation) override;
        void release_compiled_geometry(CompiledGeometryHandle geometry) override;

        void enable_scissor_region(bool enable) override;
        void set_scissor_region(int x, int y, int width, int height) override;

        bool load_texture(TextureHandle& texture_handle, glm::ivec2& texture_dimensions, const std::string& source) override;
        bool generate_texture(TextureHandle& texture_handle, std::span<const uint8_t> source, const glm::ivec2& source_dimensions) override;
        void release_texture(TextureHandle texture) override;

        // Replaces the built-in TGA loader, e.g. with SDL2_image.
        void set_texture_loader(TextureLoadFn loader) { loader_ = std::move(loader); }
        void set_compilation_enabled(bool enabled) { compilation_enabled_ = enabled; }

        const Texture2DData* texture(TextureHandle handle) const;
        size_t texture_count() const { return textures_.size(); }
        size_t compiled_geometry_count() const { return compiled_.size(); }

        bool scissor_enabled() const { return scissor_enabled_; }
        const ScissorRect& scissor() const { return scissor_; }

        const SoftwareRasterStats& stats() const { return stats_; }
        void reset_stats() { stats_.reset(); }

    private:
        struct CompiledGeometry
        {
            std::vector<Vertex> vertices{};
            std::vector<int> indices{};
            TextureHandle texture = kInvalidTextureHandle;
        };

        void rasterize(
            std::span<const Vertex> vertices,
            std::span<const int> indices,
            const Texture2DData* texture,
            const glm::vec2& translation);

        RT_ColorLDR* target_ = nullptr;
        IFileInterface* files_ = nullptr;
        TextureLoadFn loader_{};
        bool compilation_enabled_ = true;

        std::unordered_map<TextureHandle, Texture2DData> textures_{};
        std::unordered_map<CompiledGeometryHandle, CompiledGeometry> compiled_{};
        // Monotonic so a released handle is never handed out again.
        uintptr_t next_texture_ = 1;
        uintptr_t next_geometry_ = 1;

        bool scissor_enabled_ = false;
        ScissorRect scissor_{};
        SoftwareRasterStats stats_{};
    };
}
