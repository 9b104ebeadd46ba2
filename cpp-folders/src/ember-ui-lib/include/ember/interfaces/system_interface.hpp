#pragma once

/*
    EMBER UI САН

    ФАЙЛ: system_interface.hpp
    МОДУЛЬ: interfaces
    ЗОРИЛГО: Цаг хугацаа, текст орчуулга, лог бичих host интерфэйс.
*/


#include <string>

#include "ember/core/log.hpp"
#include "ember/text/string_utils.hpp"

namespace ember
{
    class ISystemInterface
    {
    public:
        virtual ~ISystemInterface() = default;

        // Seconds since the host application started.
        virtual double elapsed_time() = 0;

        // Returns the number of substitutions made. A positive count makes the
        // core translate the output again to resolve tokens it introduced.
        virtual int translate_string(std::string& translated, const std::string& input)
        {
            translated = input;
            return 0;
        }

        virtual std::string join_path(const std::string& document_path, const std::string& path)
        {
            return join_document_path(document_path, path);
        }

        // Returning false asks the core to interrupt execution (debugger break).
        virtual bool log_message(LogType type, const std::string& message)
        {
            log_write(type, message);
            return true;
        }
    };
}
