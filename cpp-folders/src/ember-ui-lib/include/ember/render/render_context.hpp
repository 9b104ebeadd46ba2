#pragma once

/*
    EMBER UI САН

    ФАЙЛ: render_context.hpp
    МОДУЛЬ: render
    ЗОРИЛГО: Хадгалагдсан (retained) panel-уудыг фрэйм бүр дарааллаар нь зурах контекст.
            Panel бүр өөрийн geometry, байрлал, clip тэгш өнцөгттэй.
*/


#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

#include "ember/core/types.hpp"
#include "ember/render/geometry.hpp"

namespace ember
{
    class Core;

    using PanelId = uint32_t;
    inline constexpr PanelId kInvalidPanelId = 0;

    struct Panel
    {
        std::unique_ptr<Geometry> geometry{};
        glm::vec2 offset{0.0f};
        // In context pixels. Always intersected with the context bounds.
        std::optional<ScissorRect> clip{};
        bool visible = true;
    };

    struct RenderContextStats
    {
        uint64_t frames = 0;
        uint64_t panels_drawn = 0;
        uint64_t panels_culled = 0;
    };

    class RenderContext
    {
    public:
        RenderContext(Core& core, glm::ivec2 dimensions);

        RenderContext(const RenderContext&) = delete;
        RenderContext& operator=(const RenderContext&) = delete;

        PanelId add_panel(const glm::vec2& offset, std::optional<ScissorRect> clip = std::nullopt);
        Panel* panel(PanelId id);
        const Panel* panel(PanelId id) const;
        bool remove_panel(PanelId id);
        size_t panel_count() const { return panels_.size(); }

        // Draws visible panels in insertion order and leaves scissoring
        // disabled. Returns false when no render interface is installed.
        bool render();

        const RenderContextStats& stats() const { return stats_; }
        double last_render_time() const { return last_render_time_; }

    private:
        Core& core_;
        glm::ivec2 dimensions_{0};
        std::vector<std::pair<PanelId, Panel>> panels_{};
        PanelId next_id_ = 1;
        RenderContextStats stats_{};
        double last_render_time_ = 0.0;
    };
}
