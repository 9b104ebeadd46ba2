/*
    EMBER UI САН

    ФАЙЛ: scissor_state.cpp
    МОДУЛЬ: render
    ЗОРИЛГО: scissor_state.hpp-ийн хэрэгжүүлэлт.
*/

#include "ember/render/scissor_state.hpp"

#include "ember/interfaces/render_interface.hpp"

namespace ember
{
    void ScissorState::apply(const std::optional<ScissorRect>& clip)
    {
        if (!clip)
        {
            if (sent_enabled_ != false)
            {
                render_.enable_scissor_region(false);
                sent_enabled_ = false;
            }
            return;
        }

        if (sent_enabled_ != true)
        {
            render_.enable_scissor_region(true);
            sent_enabled_ = true;
        }
        if (sent_rect_ != clip)
        {
            render_.set_scissor_region(clip->x, clip->y, clip->w, clip->h);
            sent_rect_ = clip;
        }
    }

    void ScissorState::push(const ScissorRect& clip)
    {
        const ScissorRect next = stack_.empty() ? clip : intersect_rects(stack_.back(), clip);
        stack_.push_back(next);
        apply(next);
    }

    void ScissorState::pop()
    {
        if (stack_.empty()) return;
        stack_.pop_back();
        if (stack_.empty()) apply(std::nullopt);
        else apply(stack_.back());
    }
}
