#pragma once

/*
    EMBER UI САН

    ФАЙЛ: string_table.hpp
    МОДУЛЬ: host
    ЗОРИЛГО: "[KEY]" хэлбэрийн token-уудыг орчуулгын хүснэгтээс солих host талын орчуулагч.
*/


#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>

#include "ember/core/result.hpp"
#include "ember/interfaces/file_interface.hpp"

namespace ember
{
    // Table files hold "KEY = value" lines. Lines starting with '#' and blank
    // lines are skipped; "\n" in a value becomes a newline.
    class StringTable
    {
    public:
        // Returns the number of entries read, or the first parse error.
        Result<size_t> load(IFileInterface& files, const std::string& path);
        Result<size_t> parse(std::string_view text, const std::string& source_name = {});

        void set(const std::string& key, std::string value) { entries_[key] = std::move(value); }
        const std::string* find(const std::string& key) const;
        bool erase(const std::string& key) { return entries_.erase(key) > 0; }
        void clear() { entries_.clear(); }
        size_t size() const { return entries_.size(); }

        // Replaces every known [KEY] token in input. Unknown tokens are copied
        // as-is and not counted.
        int translate(std::string& translated, const std::string& input) const;

    private:
        std::unordered_map<std::string, std::string> entries_{};
    };
}
