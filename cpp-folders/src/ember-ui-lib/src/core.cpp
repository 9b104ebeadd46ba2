/*
    EMBER UI САН

    ФАЙЛ: core.cpp
    МОДУЛЬ: core
    ЗОРИЛГО: core.hpp-ийн хэрэгжүүлэлт.
*/

#include "ember/core/core.hpp"

#include <utility>

#if defined(EMBER_ENABLE_DEBUG_BREAK)
#if defined(_MSC_VER)
#include <intrin.h>
#else
#include <csignal>
#endif
#endif

#include "ember/host/default_file_interface.hpp"
#include "ember/render/texture_database.hpp"

namespace ember
{
    void debug_break(LogType type, const std::string& message)
    {
        log_error(std::string("interrupt requested on ") + log_type_name(type) + " message: " + message);
#if defined(EMBER_ENABLE_DEBUG_BREAK)
#if defined(_MSC_VER)
        __debugbreak();
#else
        std::raise(SIGTRAP);
#endif
#endif
    }

    Core::Core(CoreConfig config)
        : config_(std::move(config)),
          textures_(std::make_unique<TextureDatabase>(*this)),
          break_handler_(debug_break)
    {
        if (config_.translation_max_depth < 1) config_.translation_max_depth = 1;
        if (config_.install_default_file_interface)
        {
            default_files_ = std::make_unique<DefaultFileInterface>(config_.file_root);
        }
    }

    Core::~Core()
    {
        shutdown();
    }

    bool Core::set_file_interface(IFileInterface* files)
    {
        if (initialised_)
        {
            (void)log(LogType::Error, "File interface cannot be changed while the core is initialised.");
            return false;
        }
        files_ = files;
        return true;
    }

    bool Core::set_system_interface(ISystemInterface* system)
    {
        if (initialised_)
        {
            (void)log(LogType::Error, "System interface cannot be changed while the core is initialised.");
            return false;
        }
        system_ = system;
        return true;
    }

    bool Core::set_render_interface(IRenderInterface* render)
    {
        if (initialised_)
        {
            (void)log(LogType::Error, "Render interface cannot be changed while the core is initialised.");
            return false;
        }
        render_ = render;
        return true;
    }

    IFileInterface* Core::file_interface() const
    {
        if (files_) return files_;
        return default_files_.get();
    }

    bool Core::initialise()
    {
        if (initialised_) return true;

        if (!system_)
        {
            (void)log(LogType::Error, "No system interface set!");
            return false;
        }
        if (!render_)
        {
            (void)log(LogType::Error, "No render interface set!");
            return false;
        }
        if (!file_interface())
        {
            (void)log(LogType::Error, "No file interface set and the default file interface is disabled!");
            return false;
        }

        initialised_ = true;
        (void)log(LogType::Debug, "Core initialised.");
        return true;
    }

    void Core::shutdown()
    {
        if (!initialised_) return;
        textures_->release_all();
        (void)log(LogType::Debug, "Core shut down.");
        initialised_ = false;
    }

    double Core::elapsed_time() const
    {
        return system_ ? system_->elapsed_time() : 0.0;
    }

    bool Core::log(LogType type, const std::string& message)
    {
        if ((uint8_t)type > (uint8_t)config_.log_threshold) return true;

        if (!system_)
        {
            log_write(type, message);
            return true;
        }

        if (system_->log_message(type, message)) return true;

        if (break_handler_) break_handler_(type, message);
        return false;
    }
}
