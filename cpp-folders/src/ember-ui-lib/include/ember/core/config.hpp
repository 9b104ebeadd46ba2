#pragma once

/*
    EMBER UI САН

    ФАЙЛ: config.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Core-ийн тохиргоо. Анхдагч утгууд болон EMBER_* орчны хувьсагчаас унших.
*/


#include <cstdlib>
#include <string>

#include "ember/core/log.hpp"
#include "ember/text/string_utils.hpp"

namespace ember
{
    struct CoreConfig
    {
        // Upper bound on translate_string passes for a single piece of text.
        int translation_max_depth = 16;
        // Messages less severe than this are dropped before reaching the host.
        LogType log_threshold = LogType::Info;
        bool install_default_file_interface = true;
        // Prepended to relative paths by the default file interface.
        std::string file_root{};
    };

    inline bool parse_positive_int(const char* text, int& out)
    {
        if (!text || *text == '\0') return false;
        char* end = nullptr;
        const long v = std::strtol(text, &end, 10);
        if (end == text || *end != '\0' || v <= 0 || v > 1024) return false;
        out = (int)v;
        return true;
    }

    inline CoreConfig load_core_config_from_env(CoreConfig base = {})
    {
        CoreConfig out = base;

        int depth = 0;
        if (parse_positive_int(std::getenv("EMBER_TRANSLATION_MAX_DEPTH"), depth))
        {
            out.translation_max_depth = depth;
        }
        if (const char* level = std::getenv("EMBER_LOG_LEVEL"))
        {
            out.log_threshold = parse_log_type(to_lower_ascii(level), out.log_threshold);
        }
        if (const char* root = std::getenv("EMBER_FILE_ROOT"))
        {
            out.file_root = root;
        }
        return out;
    }
}
