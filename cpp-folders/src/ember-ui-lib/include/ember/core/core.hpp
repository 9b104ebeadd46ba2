#pragma once

/*
    EMBER UI САН

    ФАЙЛ: core.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Host-оос суулгасан file/system/render интерфэйсүүдийг хадгалж,
            лог болон texture санг удирдах core объект.
*/


#include <functional>
#include <memory>
#include <string>

#include "ember/core/config.hpp"
#include "ember/core/log.hpp"
#include "ember/interfaces/file_interface.hpp"
#include "ember/interfaces/render_interface.hpp"
#include "ember/interfaces/system_interface.hpp"

namespace ember
{
    class TextureDatabase;

    // Core never owns host interfaces. The host keeps them alive until after
    // shutdown() and the Core destructor have run.
    class Core
    {
    public:
        using BreakHandler = std::function<void(LogType, const std::string&)>;

        explicit Core(CoreConfig config = {});
        ~Core();

        Core(const Core&) = delete;
        Core& operator=(const Core&) = delete;

        bool set_file_interface(IFileInterface* files);
        bool set_system_interface(ISystemInterface* system);
        bool set_render_interface(IRenderInterface* render);

        // Falls back to the built-in cstdio interface when the host set none.
        IFileInterface* file_interface() const;
        ISystemInterface* system_interface() const { return system_; }
        IRenderInterface* render_interface() const { return render_; }

        bool initialise();
        void shutdown();
        bool initialised() const { return initialised_; }

        const CoreConfig& config() const { return config_; }
        TextureDatabase& textures() { return *textures_; }

        double elapsed_time() const;

        // Returns false when the host asked for an interrupt; the break handler
        // has already run by then.
        bool log(LogType type, const std::string& message);

        void set_break_handler(BreakHandler handler) { break_handler_ = std::move(handler); }

    private:
        CoreConfig config_{};
        IFileInterface* files_ = nullptr;
        ISystemInterface* system_ = nullptr;
        IRenderInterface* render_ = nullptr;
        std::unique_ptr<IFileInterface> default_files_{};
        std::unique_ptr<TextureDatabase> textures_{};
        BreakHandler break_handler_{};
        bool initialised_ = false;
    };

    // Default break handler. Traps into an attached debugger when the library is
    // built with EMBER_ENABLE_DEBUG_BREAK, otherwise only reports.
    void debug_break(LogType type, const std::string& message);
}
