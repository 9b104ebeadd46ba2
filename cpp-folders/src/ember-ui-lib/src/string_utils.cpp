/*
    EMBER UI САН

    ФАЙЛ: string_utils.cpp
    МОДУЛЬ: text
    ЗОРИЛГО: string_utils.hpp-ийн хэрэгжүүлэлт.
*/

#include "ember/text/string_utils.hpp"

#include <cctype>
#include <cstdint>
#include <vector>

namespace ember
{
    namespace
    {
        constexpr char32_t kReplacementChar = 0xFFFD;

        // Decodes one code point starting at i and advances i past it.
        char32_t decode_utf8(std::string_view s, size_t& i)
        {
            const uint8_t lead = (uint8_t)s[i];
            if (lead < 0x80)
            {
                ++i;
                return lead;
            }

            size_t extra = 0;
            char32_t cp = 0;
            char32_t min_cp = 0;
            if ((lead & 0xE0) == 0xC0) { extra = 1; cp = lead & 0x1F; min_cp = 0x80; }
            else if ((lead & 0xF0) == 0xE0) { extra = 2; cp = lead & 0x0F; min_cp = 0x800; }
            else if ((lead & 0xF8) == 0xF0) { extra = 3; cp = lead & 0x07; min_cp = 0x10000; }
            else
            {
                ++i;
                return kReplacementChar;
            }

            if (i + extra >= s.size())
            {
                ++i;
                return kReplacementChar;
            }

            for (size_t k = 1; k <= extra; ++k)
            {
                const uint8_t c = (uint8_t)s[i + k];
                if ((c & 0xC0) != 0x80)
                {
                    i += k;
                    return kReplacementChar;
                }
                cp = (cp << 6) | (c & 0x3F);
            }
            i += extra + 1;

            // Overlong forms, surrogates and out-of-range values are rejected.
            if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return kReplacementChar;
            return cp;
        }

        void append_utf8(std::string& out, char32_t cp)
        {
            if (cp < 0x80)
            {
                out.push_back((char)cp);
            }
            else if (cp < 0x800)
            {
                out.push_back((char)(0xC0 | (cp >> 6)));
                out.push_back((char)(0x80 | (cp & 0x3F)));
            }
            else if (cp < 0x10000)
            {
                out.push_back((char)(0xE0 | (cp >> 12)));
                out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back((char)(0x80 | (cp & 0x3F)));
            }
            else
            {
                out.push_back((char)(0xF0 | (cp >> 18)));
                out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back((char)(0x80 | (cp & 0x3F)));
            }
        }
    }

    std::u16string utf8_to_utf16(std::string_view utf8)
    {
        std::u16string out{};
        out.reserve(utf8.size());
        size_t i = 0;
        while (i < utf8.size())
        {
            const char32_t cp = decode_utf8(utf8, i);
            if (cp >= 0x10000)
            {
                const char32_t v = cp - 0x10000;
                out.push_back((char16_t)(0xD800 + (v >> 10)));
                out.push_back((char16_t)(0xDC00 + (v & 0x3FF)));
            }
            else
            {
                out.push_back((char16_t)cp);
            }
        }
        return out;
    }

    std::string utf16_to_utf8(std::u16string_view utf16)
    {
        std::string out{};
        out.reserve(utf16.size());
        for (size_t i = 0; i < utf16.size(); ++i)
        {
            const char16_t c = utf16[i];
            if (c >= 0xD800 && c <= 0xDBFF)
            {
                if (i + 1 < utf16.size() && utf16[i + 1] >= 0xDC00 && utf16[i + 1] <= 0xDFFF)
                {
                    const char32_t cp = 0x10000 + (((char32_t)c - 0xD800) << 10) + ((char32_t)utf16[i + 1] - 0xDC00);
                    append_utf8(out, cp);
                    ++i;
                    continue;
                }
                append_utf8(out, kReplacementChar);
                continue;
            }
            if (c >= 0xDC00 && c <= 0xDFFF)
            {
                append_utf8(out, kReplacementChar);
                continue;
            }
            append_utf8(out, c);
        }
        return out;
    }

    std::string to_lower_ascii(std::string_view s)
    {
        std::string out{};
        out.reserve(s.size());
        for (const char c : s)
        {
            out.push_back((char)std::tolower((unsigned char)c));
        }
        return out;
    }

    std::string trim_ascii(std::string_view s)
    {
        size_t b = 0;
        size_t e = s.size();
        while (b < e && std::isspace((unsigned char)s[b])) ++b;
        while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
        return std::string(s.substr(b, e - b));
    }

    bool is_absolute_path(std::string_view path)
    {
        if (path.empty()) return false;
        if (path[0] == '/' || path[0] == '\\') return true;
        // Drive letter, e.g. "C:/".
        return path.size() >= 2 && std::isalpha((unsigned char)path[0]) && path[1] == ':';
    }

    std::string normalise_path(std::string_view path)
    {
        std::string prefix{};
        size_t start = 0;
        if (path.size() >= 2 && std::isalpha((unsigned char)path[0]) && path[1] == ':')
        {
            prefix.assign(path.substr(0, 2));
            start = 2;
        }
        const bool rooted = start < path.size() && (path[start] == '/' || path[start] == '\\');
        if (rooted) prefix.push_back('/');

        std::vector<std::string> parts{};
        std::string cur{};
        auto flush = [&]()
        {
            if (cur.empty() || cur == ".")
            {
                cur.clear();
                return;
            }
            if (cur == "..")
            {
                if (!parts.empty() && parts.back() != "..") parts.pop_back();
                else if (!rooted) parts.push_back(cur);
                cur.clear();
                return;
            }
            parts.push_back(cur);
            cur.clear();
        };

        for (size_t i = start; i < path.size(); ++i)
        {
            const char c = path[i];
            if (c == '/' || c == '\\') flush();
            else cur.push_back(c);
        }
        flush();

        std::string out = prefix;
        for (size_t i = 0; i < parts.size(); ++i)
        {
            if (i > 0) out.push_back('/');
            out += parts[i];
        }
        return out;
    }

    std::string join_document_path(std::string_view document_path, std::string_view path)
    {
        if (is_absolute_path(path)) return normalise_path(path);

        const size_t slash = document_path.find_last_of("/\\");
        if (slash == std::string_view::npos) return normalise_path(path);

        std::string joined(document_path.substr(0, slash + 1));
        joined.append(path);
        return normalise_path(joined);
    }

    std::string resolve_root_path(std::string_view root, std::string_view path)
    {
        if (root.empty() || is_absolute_path(path)) return std::string(path);
        std::string joined(root);
        if (joined.back() != '/' && joined.back() != '\\') joined.push_back('/');
        joined.append(path);
        return joined;
    }
}
