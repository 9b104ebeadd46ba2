/*
    EMBER UI САН

    ФАЙЛ: geometry.cpp
    МОДУЛЬ: render
    ЗОРИЛГО: geometry.hpp-ийн хэрэгжүүлэлт.
*/

#include "ember/render/geometry.hpp"

#include <span>
#include <utility>

#include "ember/core/core.hpp"

namespace ember
{
    Geometry::Geometry(Core& core)
        : core_(core)
    {}

    Geometry::~Geometry()
    {
        release();
    }

    void Geometry::render(const glm::vec2& translation)
    {
        IRenderInterface* render = core_.render_interface();
        if (!render) return;
        if (vertices_.empty() || indices_.empty()) return;

        const glm::vec2 offset = translation + glm::vec2(
            render->horizontal_texel_offset(),
            render->vertical_texel_offset());

        const TextureHandle texture = texture_ ? texture_->handle() : kInvalidTextureHandle;
        const std::span<const Vertex> vs(vertices_.data(), vertices_.size());
        const std::span<const int> is(indices_.data(), indices_.size());

        // The texture was released and reloaded (e.g. across a core
        // shutdown), so the compiled batch refers to a dead handle.
        if (compile_attempted_ && texture != compiled_texture_) release();

        if (!compile_attempted_)
        {
            compile_attempted_ = true;
            compiled_texture_ = texture;
            compiled_ = render->compile_geometry(vs, is, texture);
        }

        if (compiled_ != kInvalidCompiledGeometryHandle)
        {
            render->render_compiled_geometry(compiled_, offset);
            return;
        }

        render->render_geometry(vs, is, texture, offset);
    }

    void Geometry::set_texture(std::shared_ptr<TextureResource> texture)
    {
        // Drop the compiled batch while the old texture is still alive.
        release();
        texture_ = std::move(texture);
    }

    void Geometry::release(bool clear_buffers)
    {
        if (compiled_ != kInvalidCompiledGeometryHandle)
        {
            if (IRenderInterface* render = core_.render_interface()) render->release_compiled_geometry(compiled_);
            compiled_ = kInvalidCompiledGeometryHandle;
        }
        compile_attempted_ = false;
        compiled_texture_ = kInvalidTextureHandle;

        if (clear_buffers)
        {
            vertices_.clear();
            indices_.clear();
        }
    }

    void generate_quad(
        std::vector<Vertex>& vertices,
        std::vector<int>& indices,
        const glm::vec2& origin,
        const glm::vec2& dimensions,
        Color colour,
        const glm::vec2& tex_top_left,
        const glm::vec2& tex_bottom_right)
    {
        const int base = (int)vertices.size();

        vertices.push_back(Vertex{origin, colour, tex_top_left});
        vertices.push_back(Vertex{origin + glm::vec2(dimensions.x, 0.0f), colour, glm::vec2(tex_bottom_right.x, tex_top_left.y)});
        vertices.push_back(Vertex{origin + dimensions, colour, tex_bottom_right});
        vertices.push_back(Vertex{origin + glm::vec2(0.0f, dimensions.y), colour, glm::vec2(tex_top_left.x, tex_bottom_right.y)});

        indices.push_back(base + 0);
        indices.push_back(base + 3);
        indices.push_back(base + 1);

        indices.push_back(base + 1);
        indices.push_back(base + 3);
        indices.push_back(base + 2);
    }
}
