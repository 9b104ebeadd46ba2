#pragma once

/*
    EMBER UI САН

    ФАЙЛ: string_utils.hpp
    МОДУЛЬ: text
    ЗОРИЛГО: UTF-8 оролт болон дотоод 16-бит (UTF-16) дүрслэлийн хоорондох хөрвүүлэлт,
            замын (path) нэгтгэл зэрэг текстийн туслах функцүүд.
*/


#include <string>
#include <string_view>

namespace ember
{
    // Invalid or truncated sequences decode to U+FFFD. Code points above U+FFFF
    // become surrogate pairs.
    std::u16string utf8_to_utf16(std::string_view utf8);
    std::string utf16_to_utf8(std::u16string_view utf16);

    std::string to_lower_ascii(std::string_view s);
    std::string trim_ascii(std::string_view s);

    // Collapses "." and ".." components and unifies separators to '/'.
    std::string normalise_path(std::string_view path);
    bool is_absolute_path(std::string_view path);

    // Resolves path against the directory containing document_path.
    std::string join_document_path(std::string_view document_path, std::string_view path);

    // Prefixes root to relative paths. Absolute paths and an empty root pass through.
    std::string resolve_root_path(std::string_view root, std::string_view path);
}
