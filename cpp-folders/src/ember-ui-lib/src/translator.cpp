/*
    EMBER UI САН

    ФАЙЛ: translator.cpp
    МОДУЛЬ: text
    ЗОРИЛГО: translator.hpp-ийн хэрэгжүүлэлт.
*/

#include "ember/text/translator.hpp"

#include <algorithm>
#include <unordered_set>

#include "ember/core/core.hpp"
#include "ember/text/string_utils.hpp"

namespace ember
{
    TranslationResult translate_text(ISystemInterface& system, std::string_view input, int max_depth)
    {
        TranslationResult out{};
        out.text.assign(input);
        max_depth = std::max(1, max_depth);

        std::unordered_set<std::string> seen{};
        seen.insert(out.text);

        while (out.passes < max_depth)
        {
            std::string translated{};
            const int n = system.translate_string(translated, out.text);
            ++out.passes;
            if (n <= 0)
            {
                out.stop = TranslationStop::Settled;
                return out;
            }

            out.substitutions += n;
            if (!seen.insert(translated).second)
            {
                out.stop = TranslationStop::Cycle;
                return out;
            }
            out.text = std::move(translated);
        }

        out.stop = TranslationStop::DepthLimit;
        return out;
    }

    std::u16string translate_to_internal(Core& core, std::string_view input)
    {
        ISystemInterface* system = core.system_interface();
        if (!system) return utf8_to_utf16(input);

        const TranslationResult r = translate_text(*system, input, core.config().translation_max_depth);
        if (r.stop == TranslationStop::Cycle)
        {
            (void)core.log(LogType::Warning,
                "Translation of '" + std::string(input) + "' cycles back to earlier text after " +
                std::to_string(r.passes) + " passes; using '" + r.text + "'.");
        }
        else if (r.stop == TranslationStop::DepthLimit)
        {
            (void)core.log(LogType::Warning,
                "Translation of '" + std::string(input) + "' still changing after " +
                std::to_string(r.passes) + " passes; stopped at '" + r.text + "'.");
        }
        return utf8_to_utf16(r.text);
    }
}
