/*
    EMBER UI САН

    ФАЙЛ: render_context.cpp
    МОДУЛЬ: render
    ЗОРИЛГО: render_context.hpp-ийн хэрэгжүүлэлт.
*/

#include "ember/render/render_context.hpp"

#include <algorithm>

#include "ember/core/core.hpp"
#include "ember/render/scissor_state.hpp"

namespace ember
{
    RenderContext::RenderContext(Core& core, glm::ivec2 dimensions)
        : core_(core), dimensions_(dimensions)
    {}

    PanelId RenderContext::add_panel(const glm::vec2& offset, std::optional<ScissorRect> clip)
    {
        const PanelId id = next_id_++;
        Panel p{};
        p.geometry = std::make_unique<Geometry>(core_);
        p.offset = offset;
        p.clip = clip;
        panels_.emplace_back(id, std::move(p));
        return id;
    }

    Panel* RenderContext::panel(PanelId id)
    {
        for (auto& [pid, p] : panels_)
        {
            if (pid == id) return &p;
        }
        return nullptr;
    }

    const Panel* RenderContext::panel(PanelId id) const
    {
        for (const auto& [pid, p] : panels_)
        {
            if (pid == id) return &p;
        }
        return nullptr;
    }

    bool RenderContext::remove_panel(PanelId id)
    {
        const auto it = std::find_if(panels_.begin(), panels_.end(), [id](const auto& entry) { return entry.first == id; });
        if (it == panels_.end()) return false;
        panels_.erase(it);
        return true;
    }

    bool RenderContext::render()
    {
        IRenderInterface* render = core_.render_interface();
        if (!render)
        {
            (void)core_.log(LogType::Error, "RenderContext::render called without a render interface.");
            return false;
        }

        last_render_time_ = core_.elapsed_time();
        const ScissorRect bounds{0, 0, dimensions_.x, dimensions_.y};

        // Host state may have changed since the last frame, so the scissor
        // tracker starts unknown each frame.
        ScissorState scissor(*render);
        for (auto& [id, p] : panels_)
        {
            (void)id;
            if (!p.visible || !p.geometry) continue;

            if (p.clip)
            {
                const ScissorRect clip = intersect_rects(*p.clip, bounds);
                if (clip.empty())
                {
                    stats_.panels_culled++;
                    continue;
                }
                scissor.apply(clip);
            }
            else
            {
                scissor.apply(std::nullopt);
            }

            p.geometry->render(p.offset);
            stats_.panels_drawn++;
        }
        scissor.apply(std::nullopt);

        stats_.frames++;
        return true;
    }
}
