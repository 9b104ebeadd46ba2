/*
    EMBER UI САН

    ФАЙЛ: string_table.cpp
    МОДУЛЬ: host
    ЗОРИЛГО: string_table.hpp-ийн хэрэгжүүлэлт.
*/

#include "ember/host/string_table.hpp"

#include <cstdint>
#include <vector>

#include "ember/text/string_utils.hpp"

namespace ember
{
    namespace
    {
        std::string unescape_value(std::string_view v)
        {
            std::string out{};
            out.reserve(v.size());
            for (size_t i = 0; i < v.size(); ++i)
            {
                if (v[i] == '\\' && i + 1 < v.size())
                {
                    const char n = v[i + 1];
                    if (n == 'n') { out.push_back('\n'); ++i; continue; }
                    if (n == 't') { out.push_back('\t'); ++i; continue; }
                    if (n == '\\') { out.push_back('\\'); ++i; continue; }
                }
                out.push_back(v[i]);
            }
            return out;
        }

        bool valid_key(std::string_view key)
        {
            if (key.empty()) return false;
            for (const char c : key)
            {
                if (c == '[' || c == ']' || c == ' ' || c == '\t') return false;
            }
            return true;
        }
    }

    Result<size_t> StringTable::load(IFileInterface& files, const std::string& path)
    {
        std::vector<uint8_t> bytes{};
        if (!read_file_to_vector(files, path, bytes))
        {
            return Result<size_t>::failure("Cannot read string table: " + path);
        }
        const std::string_view text(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        return parse(text, path);
    }

    Result<size_t> StringTable::parse(std::string_view text, const std::string& source_name)
    {
        // Skip a UTF-8 byte order mark.
        if (text.size() >= 3 && (uint8_t)text[0] == 0xEF && (uint8_t)text[1] == 0xBB && (uint8_t)text[2] == 0xBF)
        {
            text.remove_prefix(3);
        }

        size_t count = 0;
        int line_no = 0;
        size_t start = 0;
        while (start <= text.size())
        {
            size_t end = text.find('\n', start);
            if (end == std::string_view::npos) end = text.size();
            ++line_no;

            const std::string line = trim_ascii(text.substr(start, end - start));
            start = end + 1;

            if (line.empty() || line[0] == '#')
            {
                if (end == text.size()) break;
                continue;
            }

            const size_t eq = line.find('=');
            if (eq == std::string::npos)
            {
                return Result<size_t>::failure(source_name + ":" + std::to_string(line_no) + ": expected KEY = value");
            }

            const std::string key = trim_ascii(std::string_view(line).substr(0, eq));
            if (!valid_key(key))
            {
                return Result<size_t>::failure(source_name + ":" + std::to_string(line_no) + ": invalid key '" + key + "'");
            }
            entries_[key] = unescape_value(trim_ascii(std::string_view(line).substr(eq + 1)));
            ++count;

            if (end == text.size()) break;
        }
        return Result<size_t>::success(count);
    }

    const std::string* StringTable::find(const std::string& key) const
    {
        const auto it = entries_.find(key);
        return it == entries_.end() ? nullptr : &it->second;
    }

    int StringTable::translate(std::string& translated, const std::string& input) const
    {
        translated.clear();
        translated.reserve(input.size());

        int substitutions = 0;
        size_t pos = 0;
        while (pos < input.size())
        {
            const size_t open = input.find('[', pos);
            if (open == std::string::npos)
            {
                translated.append(input, pos, std::string::npos);
                break;
            }
            const size_t close = input.find(']', open + 1);
            if (close == std::string::npos)
            {
                translated.append(input, pos, std::string::npos);
                break;
            }

            translated.append(input, pos, open - pos);
            const std::string key = input.substr(open + 1, close - open - 1);
            const std::string* value = valid_key(key) ? find(key) : nullptr;
            if (value)
            {
                translated += *value;
                ++substitutions;
                pos = close + 1;
            }
            else
            {
                // Keep '[' and rescan after it so "[[KEY]" still finds KEY.
                translated.push_back('[');
                pos = open + 1;
            }
        }
        return substitutions;
    }
}
