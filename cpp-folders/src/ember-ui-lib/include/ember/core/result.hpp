#pragma once

/*
    EMBER UI САН

    ФАЙЛ: result.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Loader, string table зэрэг дотоод алхмуудын амжилт/алдааны үр дүн.
            Host interface-ийн хил дээр bool эсвэл 0 handle болж хувирна.
*/


#include <string>
#include <utility>

namespace ember
{
    template<typename T>
    struct Result
    {
        bool ok = false;
        T value{};
        std::string error{};

        static Result<T> success(T v)
        {
            return Result<T>{true, std::move(v), {}};
        }

        static Result<T> failure(std::string e)
        {
            return Result<T>{false, T{}, std::move(e)};
        }

        explicit operator bool() const { return ok; }

        // Prefixes the error, e.g. with the operation that triggered the load.
        Result<T>& with_context(const std::string& context)
        {
            if (!ok) error = context + ": " + error;
            return *this;
        }
    };
}
