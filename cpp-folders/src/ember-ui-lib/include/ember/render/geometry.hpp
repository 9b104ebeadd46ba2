#pragma once

/*
    EMBER UI САН

    ФАЙЛ: geometry.hpp
    МОДУЛЬ: render
    ЗОРИЛГО: Vertex/index өгөгдөл болон texture-ийг хадгалж, render interface руу илгээх.
            Geometry бүрийг compile_geometry-д зөвхөн нэг удаа санал болгоно.
*/


#include <memory>
#include <vector>

#include <glm/glm.hpp>

#include "ember/core/types.hpp"
#include "ember/render/texture_database.hpp"

namespace ember
{
    class Core;

    class Geometry
    {
    public:
        explicit Geometry(Core& core);
        ~Geometry();

        Geometry(const Geometry&) = delete;
        Geometry& operator=(const Geometry&) = delete;

        std::vector<Vertex>& vertices() { return vertices_; }
        const std::vector<Vertex>& vertices() const { return vertices_; }
        std::vector<int>& indices() { return indices_; }
        const std::vector<int>& indices() const { return indices_; }

        // Releases any compiled handle first; it was built against the old texture.
        void set_texture(std::shared_ptr<TextureResource> texture);
        const std::shared_ptr<TextureResource>& texture() const { return texture_; }

        // translation is in pixels from the render context's top-left corner.
        void render(const glm::vec2& translation);

        // Drops the compiled handle so modified buffers are offered for
        // compilation again on the next render.
        void release(bool clear_buffers = false);

        bool compile_attempted() const { return compile_attempted_; }
        CompiledGeometryHandle compiled_handle() const { return compiled_; }

    private:
        Core& core_;
        std::vector<Vertex> vertices_{};
        std::vector<int> indices_{};
        std::shared_ptr<TextureResource> texture_{};
        CompiledGeometryHandle compiled_ = kInvalidCompiledGeometryHandle;
        // Texture handle the compile offer was made with.
        TextureHandle compiled_texture_ = kInvalidTextureHandle;
        bool compile_attempted_ = false;
    };

    // Appends two triangles covering origin..origin+dimensions.
    void generate_quad(
        std::vector<Vertex>& vertices,
        std::vector<int>& indices,
        const glm::vec2& origin,
        const glm::vec2& dimensions,
        Color colour,
        const glm::vec2& tex_top_left = glm::vec2(0.0f),
        const glm::vec2& tex_bottom_right = glm::vec2(1.0f));
}
