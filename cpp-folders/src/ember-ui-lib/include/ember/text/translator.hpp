#pragma once

/*
    EMBER UI САН

    ФАЙЛ: translator.hpp
    МОДУЛЬ: text
    ЗОРИЛГО: Host-ийн translate_string-ийг давтан дуудаж, шинээр орж ирсэн token-уудыг
            задлах. Давталтын тоо хязгаартай, цикл илэрвэл зогсоно.
*/


#include <cstdint>
#include <string>
#include <string_view>

namespace ember
{
    class Core;
    class ISystemInterface;

    enum class TranslationStop : uint8_t
    {
        // The last pass reported no substitutions.
        Settled = 0,
        // A pass reproduced text already seen in this expansion.
        Cycle = 1,
        // max_depth passes ran and the text was still changing.
        DepthLimit = 2
    };

    struct TranslationResult
    {
        std::string text{};
        int passes = 0;
        int substitutions = 0;
        TranslationStop stop = TranslationStop::Settled;

        bool truncated() const { return stop != TranslationStop::Settled; }
    };

    TranslationResult translate_text(ISystemInterface& system, std::string_view input, int max_depth);

    // Same as translate_text, using the core's system interface and depth bound,
    // and reporting cycles and truncation through the core log. Returns the
    // internal 16-bit form.
    std::u16string translate_to_internal(Core& core, std::string_view input);
}
