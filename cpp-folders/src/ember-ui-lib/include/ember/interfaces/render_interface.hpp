#pragma once

/*
    EMBER UI САН

    ФАЙЛ: render_interface.hpp
    МОДУЛЬ: interfaces
    ЗОРИЛГО: Core нь ямар нэг график API-г шууд дуудахгүй. Geometry илгээх, texture-ийн
            амьдралын мөчлөг, scissor төлөвийг host энэ интерфэйсээр хэрэгжүүлнэ.
*/


#include <cstdint>
#include <span>
#include <string>

#include <glm/glm.hpp>

#include "ember/core/types.hpp"

namespace ember
{
    class IRenderInterface
    {
    public:
        virtual ~IRenderInterface() = default;

        // Geometry must be rendered in call order. texture is kInvalidTextureHandle
        // for untextured geometry.
        virtual void render_geometry(
            std::span<const Vertex> vertices,
            std::span<const int> indices,
            TextureHandle texture,
            const glm::vec2& translation) = 0;

        // Returning kInvalidCompiledGeometryHandle keeps the geometry on the
        // immediate path.
        virtual CompiledGeometryHandle compile_geometry(
            std::span<const Vertex> vertices,
            std::span<const int> indices,
            TextureHandle texture)
        {
            (void)vertices;
            (void)indices;
            (void)texture;
            return kInvalidCompiledGeometryHandle;
        }

        virtual void render_compiled_geometry(CompiledGeometryHandle geometry, const glm::vec2& translation)
        {
            (void)geometry;
            (void)translation;
        }

        virtual void release_compiled_geometry(CompiledGeometryHandle geometry)
        {
            (void)geometry;
        }

        virtual void enable_scissor_region(bool enable) = 0;
        virtual void set_scissor_region(int x, int y, int width, int height) = 0;

        virtual bool load_texture(TextureHandle& texture_handle, glm::ivec2& texture_dimensions, const std::string& source)
        {
            (void)texture_handle;
            (void)texture_dimensions;
            (void)source;
            return false;
        }

        // source is tightly packed row-major RGBA8, dimensions.x * dimensions.y * 4 bytes.
        virtual bool generate_texture(TextureHandle& texture_handle, std::span<const uint8_t> source, const glm::ivec2& source_dimensions)
        {
            (void)texture_handle;
            (void)source;
            (void)source_dimensions;
            return false;
        }

        virtual void release_texture(TextureHandle texture)
        {
            (void)texture;
        }

        // 0 matches the OpenGL texel centre convention; Direct3D 9 style APIs return 0.5.
        virtual float horizontal_texel_offset() const { return 0.0f; }
        virtual float vertical_texel_offset() const { return 0.0f; }
    };
}
