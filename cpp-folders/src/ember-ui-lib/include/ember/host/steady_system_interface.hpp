#pragma once

/*
    EMBER UI САН

    ФАЙЛ: steady_system_interface.hpp
    МОДУЛЬ: host
    ЗОРИЛГО: std::chrono::steady_clock дээр суурилсан system interface.
            Орчуулгыг сонголтоор StringTable-д шилжүүлнэ.
*/


#include <chrono>
#include <string>

#include "ember/host/string_table.hpp"
#include "ember/interfaces/system_interface.hpp"

namespace ember
{
    class SteadySystemInterface : public ISystemInterface
    {
    public:
        SteadySystemInterface()
            : start_(std::chrono::steady_clock::now())
        {}

        double elapsed_time() override
        {
            const auto now = std::chrono::steady_clock::now();
            return std::chrono::duration<double>(now - start_).count();
        }

        int translate_string(std::string& translated, const std::string& input) override
        {
            if (!strings_) return ISystemInterface::translate_string(translated, input);
            return strings_->translate(translated, input);
        }

        // Not owned.
        void set_string_table(const StringTable* strings) { strings_ = strings; }

    private:
        std::chrono::steady_clock::time_point start_{};
        const StringTable* strings_ = nullptr;
    };
}
