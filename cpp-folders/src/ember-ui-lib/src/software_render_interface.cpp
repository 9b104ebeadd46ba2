/*
    EMBER UI САН

    ФАЙЛ: software_render_interface.cpp
    МОДУЛЬ: host
    ЗОРИЛГО: software_render_interface.hpp-ийн хэрэгжүүлэлт.
*/

#include "ember/host/software_render_interface.hpp"

#include <algorithm>
#include <cmath>

#include "ember/core/log.hpp"
#include "ember/resources/loaders/texture_loader_tga.hpp"

namespace ember
{
    namespace detail
    {
        inline float edge_fn(const glm::vec2& a, const glm::vec2& b, const glm::vec2& p)
        {
            return (b.x - a.x) * (p.y - a.y) - (b.y - a.y) * (p.x - a.x);
        }

        // Pixels exactly on an edge shared by two triangles belong to one of
        // them only. Reversing an edge flips the result.
        inline bool owns_edge(const glm::vec2& a, const glm::vec2& b)
        {
            return (b.y < a.y) || (a.y == b.y && b.x < a.x);
        }

        inline bool covers(float e, const glm::vec2& a, const glm::vec2& b)
        {
            return e > 0.0f || (e == 0.0f && owns_edge(a, b));
        }

        inline glm::vec4 to_vec4(Color c)
        {
            return glm::vec4(c.r, c.g, c.b, c.a) * (1.0f / 255.0f);
        }

        inline uint8_t to_u8(float v)
        {
            return (uint8_t)std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f);
        }

        inline glm::vec4 sample_nearest(const Texture2DData& tex, const glm::vec2& uv)
        {
            const int x = std::clamp((int)std::floor(uv.x * (float)tex.w), 0, tex.w - 1);
            const int y = std::clamp((int)std::floor(uv.y * (float)tex.h), 0, tex.h - 1);
            return to_vec4(tex.at(x, y));
        }

        inline Color blend_over(const glm::vec4& src, Color dst_c)
        {
            const glm::vec4 dst = to_vec4(dst_c);
            const float a = src.a;
            const glm::vec3 rgb = glm::vec3(src) * a + glm::vec3(dst) * (1.0f - a);
            const float out_a = a + dst.a * (1.0f - a);
            return Color{to_u8(rgb.r), to_u8(rgb.g), to_u8(rgb.b), to_u8(out_a)};
        }
    }

    SoftwareRenderInterface::SoftwareRenderInterface(RT_ColorLDR& target, IFileInterface* files)
        : target_(&target), files_(files)
    {}

    void SoftwareRenderInterface::render_geometry(
        std::span<const Vertex> vertices,
        std::span<const int> indices,
        TextureHandle texture,
        const glm::vec2& translation)
    {
        stats_.draw_calls++;
        rasterize(vertices, indices, this->texture(texture), translation);
    }

    CompiledGeometryHandle SoftwareRenderInterface::compile_geometry(
        std::span<const Vertex> vertices,
        std::span<const int> indices,
        TextureHandle texture)
    {
        if (!compilation_enabled_) return kInvalidCompiledGeometryHandle;

        CompiledGeometry g{};
        g.vertices.assign(vertices.begin(), vertices.end());
        g.indices.assign(indices.begin(), indices.end());
        g.texture = texture;

        const CompiledGeometryHandle h = next_geometry_++;
        compiled_.emplace(h, std::move(g));
        return h;
    }

    void SoftwareRenderInterface::render_compiled_geometry(CompiledGeometryHandle geometry, const glm::vec2& translation)
    {
        const auto it = compiled_.find(geometry);
        if (it == compiled_.end()) return;

        stats_.compiled_draw_calls++;
        const CompiledGeometry& g = it->second;
        rasterize(
            std::span<const Vertex>(g.vertices.data(), g.vertices.size()),
            std::span<const int>(g.indices.data(), g.indices.size()),
            texture(g.texture),
            translation);
    }

    void SoftwareRenderInterface::release_compiled_geometry(CompiledGeometryHandle geometry)
    {
        compiled_.erase(geometry);
    }

    void SoftwareRenderInterface::enable_scissor_region(bool enable)
    {
        scissor_enabled_ = enable;
    }

    void SoftwareRenderInterface::set_scissor_region(int x, int y, int width, int height)
    {
        scissor_ = ScissorRect{x, y, width, height};
    }

    bool SoftwareRenderInterface::load_texture(TextureHandle& texture_handle, glm::ivec2& texture_dimensions, const std::string& source)
    {
        Result<Texture2DData> loaded{};
        if (loader_) loaded = loader_(source);
        else if (files_) loaded = load_texture2d_tga(*files_, source);
        else loaded = Result<Texture2DData>::failure("No texture loader for: " + source);

        if (!loaded)
        {
            log_warn(loaded.with_context("SoftwareRenderInterface::load_texture").error);
            return false;
        }
        if (!loaded.value.valid()) return false;

        texture_dimensions = glm::ivec2(loaded.value.w, loaded.value.h);
        texture_handle = next_texture_++;
        textures_.emplace(texture_handle, std::move(loaded.value));
        return true;
    }

    bool SoftwareRenderInterface::generate_texture(TextureHandle& texture_handle, std::span<const uint8_t> source, const glm::ivec2& source_dimensions)
    {
        Texture2DData tex = texture_from_rgba8(source, source_dimensions.x, source_dimensions.y);
        if (!tex.valid()) return false;

        texture_handle = next_texture_++;
        textures_.emplace(texture_handle, std::move(tex));
        return true;
    }

    void SoftwareRenderInterface::release_texture(TextureHandle texture)
    {
        textures_.erase(texture);
    }

    const Texture2DData* SoftwareRenderInterface::texture(TextureHandle handle) const
    {
        if (handle == kInvalidTextureHandle) return nullptr;
        const auto it = textures_.find(handle);
        return it == textures_.end() ? nullptr : &it->second;
    }

    void SoftwareRenderInterface::rasterize(
        std::span<const Vertex> vertices,
        std::span<const int> indices,
        const Texture2DData* texture,
        const glm::vec2& translation)
    {
        if (!target_) return;
        RT_ColorLDR& rt = *target_;
        if (rt.w <= 0 || rt.h <= 0) return;

        int clip_x0 = 0;
        int clip_y0 = 0;
        int clip_x1 = rt.w - 1;
        int clip_y1 = rt.h - 1;
        if (scissor_enabled_)
        {
            clip_x0 = std::max(clip_x0, scissor_.x);
            clip_y0 = std::max(clip_y0, scissor_.y);
            clip_x1 = std::min(clip_x1, scissor_.x + scissor_.w - 1);
            clip_y1 = std::min(clip_y1, scissor_.y + scissor_.h - 1);
        }
        if (clip_x0 > clip_x1 || clip_y0 > clip_y1) return;

        const size_t tri_count = indices.size() / 3;
        for (size_t ti = 0; ti < tri_count; ++ti)
        {
            stats_.tri_input++;
            const int i0 = indices[ti * 3 + 0];
            const int i1 = indices[ti * 3 + 1];
            const int i2 = indices[ti * 3 + 2];
            if (i0 < 0 || i1 < 0 || i2 < 0) continue;
            if ((size_t)i0 >= vertices.size() || (size_t)i1 >= vertices.size() || (size_t)i2 >= vertices.size()) continue;

            const Vertex* v0 = &vertices[(size_t)i0];
            const Vertex* v1 = &vertices[(size_t)i1];
            const Vertex* v2 = &vertices[(size_t)i2];

            glm::vec2 p0 = v0->position + translation;
            glm::vec2 p1 = v1->position + translation;
            glm::vec2 p2 = v2->position + translation;

            float area = detail::edge_fn(p0, p1, p2);
            if (std::abs(area) < 1e-10f) continue;
            // Normalise winding so coverage is tested the same way for both orders.
            if (area < 0.0f)
            {
                std::swap(v1, v2);
                std::swap(p1, p2);
                area = -area;
            }
            const float inv_area = 1.0f / area;

            const int minx = std::max(clip_x0, (int)std::floor(std::min({p0.x, p1.x, p2.x})));
            const int maxx = std::min(clip_x1, (int)std::ceil(std::max({p0.x, p1.x, p2.x})));
            const int miny = std::max(clip_y0, (int)std::floor(std::min({p0.y, p1.y, p2.y})));
            const int maxy = std::min(clip_y1, (int)std::ceil(std::max({p0.y, p1.y, p2.y})));
            if (minx > maxx || miny > maxy) continue;
            stats_.tri_raster++;

            const glm::vec4 c0 = detail::to_vec4(v0->colour);
            const glm::vec4 c1 = detail::to_vec4(v1->colour);
            const glm::vec4 c2 = detail::to_vec4(v2->colour);

            for (int y = miny; y <= maxy; ++y)
            {
                for (int x = minx; x <= maxx; ++x)
                {
                    const glm::vec2 p((float)x + 0.5f, (float)y + 0.5f);
                    const float e0 = detail::edge_fn(p1, p2, p);
                    const float e1 = detail::edge_fn(p2, p0, p);
                    const float e2 = detail::edge_fn(p0, p1, p);
                    if (!detail::covers(e0, p1, p2) || !detail::covers(e1, p2, p0) || !detail::covers(e2, p0, p1)) continue;

                    const float w0 = e0 * inv_area;
                    const float w1 = e1 * inv_area;
                    const float w2 = e2 * inv_area;

                    glm::vec4 src = c0 * w0 + c1 * w1 + c2 * w2;
                    if (texture)
                    {
                        const glm::vec2 uv = v0->tex_coord * w0 + v1->tex_coord * w1 + v2->tex_coord * w2;
                        src *= detail::sample_nearest(*texture, uv);
                    }
                    if (src.a <= 0.0f) continue;

                    Color& dst = rt.color.at(x, y);
                    dst = detail::blend_over(src, dst);
                    stats_.pixels_written++;
                }
            }
        }
    }
}
