#pragma once

/*
    EMBER UI САН

    ФАЙЛ: log.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Энэ файл нь ember-ui-lib-ийн core модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>

namespace ember
{
    // Host-д дамжуулах логийн түвшин. Жагсаалтын дараалал нь ач холбогдлын дараалал.
    enum class LogType : uint8_t
    {
        Always = 0,
        Error = 1,
        Assert = 2,
        Warning = 3,
        Info = 4,
        Debug = 5
    };

    inline const char* log_type_name(LogType type)
    {
        switch (type)
        {
            case LogType::Always: return "always";
            case LogType::Error: return "error";
            case LogType::Assert: return "assert";
            case LogType::Warning: return "warning";
            case LogType::Info: return "info";
            case LogType::Debug: return "debug";
        }
        return "unknown";
    }

    inline LogType parse_log_type(std::string_view text, LogType fallback = LogType::Info)
    {
        if (text == "always") return LogType::Always;
        if (text == "error") return LogType::Error;
        if (text == "assert") return LogType::Assert;
        if (text == "warning" || text == "warn") return LogType::Warning;
        if (text == "info") return LogType::Info;
        if (text == "debug") return LogType::Debug;
        return fallback;
    }

    inline void log_info(const std::string& msg)
    {
        std::cout << "[INFO] " << msg << std::endl;
    }

    inline void log_warn(const std::string& msg)
    {
        std::cout << "[WARN] " << msg << std::endl;
    }

    inline void log_error(const std::string& msg)
    {
        std::cerr << "[ERROR] " << msg << std::endl;
    }

    inline void log_debug(const std::string& msg)
    {
        std::cout << "[DEBUG] " << msg << std::endl;
    }

    inline void log_write(LogType type, const std::string& msg)
    {
        switch (type)
        {
            case LogType::Error:
            case LogType::Assert:
                log_error(msg);
                return;
            case LogType::Warning:
                log_warn(msg);
                return;
            case LogType::Debug:
                log_debug(msg);
                return;
            case LogType::Always:
            case LogType::Info:
                log_info(msg);
                return;
        }
    }
}
