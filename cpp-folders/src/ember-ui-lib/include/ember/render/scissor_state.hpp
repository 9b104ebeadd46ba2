#pragma once

/*
    EMBER UI САН

    ФАЙЛ: scissor_state.hpp
    МОДУЛЬ: render
    ЗОРИЛГО: Render interface руу илгээсэн scissor төлөвийг хянаж, өөрчлөгдсөн үед л
            enable/set дуудлагыг дамжуулна. Давхар clip-ийг огтлолцлоор тооцно.
*/


#include <optional>
#include <vector>

#include "ember/core/types.hpp"

namespace ember
{
    class IRenderInterface;

    class ScissorState
    {
    public:
        explicit ScissorState(IRenderInterface& render) : render_(render) {}

        // std::nullopt disables clipping.
        void apply(const std::optional<ScissorRect>& clip);

        // Intersects with the current top of the stack and applies the result.
        void push(const ScissorRect& clip);
        void pop();

        bool enabled() const { return sent_enabled_.value_or(false); }
        const std::optional<ScissorRect>& current() const { return sent_rect_; }
        size_t depth() const { return stack_.size(); }

    private:
        IRenderInterface& render_;
        std::vector<ScissorRect> stack_{};
        std::optional<bool> sent_enabled_{};
        std::optional<ScissorRect> sent_rect_{};
    };
}
