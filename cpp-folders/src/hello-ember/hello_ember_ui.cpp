#define SDL_MAIN_HANDLED

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

#include <ember/core/config.hpp>
#include <ember/core/core.hpp>
#include <ember/gfx/rt_types.hpp>
#include <ember/host/software_render_interface.hpp>
#include <ember/host/string_table.hpp>
#include <ember/platform/platform_runtime.hpp>
#include <ember/platform/sdl/sdl_file_interface.hpp>
#include <ember/platform/sdl/sdl_runtime.hpp>
#include <ember/platform/sdl/sdl_system_interface.hpp>
#include <ember/render/geometry.hpp>
#include <ember/render/render_context.hpp>
#include <ember/render/texture_database.hpp>
#include <ember/resources/loaders/texture_loader_sdl.hpp>
#include <ember/text/string_utils.hpp>
#include <ember/text/translator.hpp>

namespace
{
struct AppOptions
{
    int width = 960;
    int height = 640;
    int max_frames = 0;
    std::string strings_path = "assets/strings_en.txt";
    std::string image_path{};
    bool break_on_assert = false;
};

bool generate_checker(std::vector<uint8_t>& rgba, glm::ivec2& dims)
{
    dims = glm::ivec2(64, 64);
    rgba.resize((size_t)dims.x * (size_t)dims.y * 4u);
    for (int y = 0; y < dims.y; ++y)
    {
        for (int x = 0; x < dims.x; ++x)
        {
            const bool dark = ((x / 8) + (y / 8)) % 2 == 0;
            uint8_t* p = rgba.data() + ((size_t)y * (size_t)dims.x + (size_t)x) * 4u;
            p[0] = dark ? 40 : 220;
            p[1] = dark ? 44 : 210;
            p[2] = dark ? 60 : 180;
            p[3] = 255;
        }
    }
    return true;
}

class HelloEmberUiApp
{
public:
    explicit HelloEmberUiApp(AppOptions opt)
        : opt_(std::move(opt)),
          surface_(opt_.width, opt_.height)
    {}

    void run()
    {
        init_runtime();
        init_core();
        init_strings();
        init_panels();
        main_loop();
        core_->shutdown();
    }

private:
    void init_runtime()
    {
        ember::WindowDesc win{};
        win.title = "HelloEmberUi";
        win.width = opt_.width;
        win.height = opt_.height;

        ember::SurfaceDesc surface{};
        surface.width = opt_.width;
        surface.height = opt_.height;

        auto sdl = std::make_unique<ember::SdlRuntime>(win, surface);
        if (!sdl->valid())
        {
            throw std::runtime_error("SdlRuntime init failed: " + sdl->error());
        }
        runtime_ = std::move(sdl);
    }

    void init_core()
    {
        system_ = std::make_unique<ember::SdlSystemInterface>();
        system_->set_break_on_assert(opt_.break_on_assert);
        render_ = std::make_unique<ember::SoftwareRenderInterface>(surface_, &files_);
        render_->set_texture_loader([this](const std::string& source)
        {
            return ember::load_texture2d_sdl_image(files_, source);
        });

        core_ = std::make_unique<ember::Core>(ember::load_core_config_from_env());
        (void)core_->set_file_interface(&files_);
        (void)core_->set_system_interface(system_.get());
        (void)core_->set_render_interface(render_.get());
        if (!core_->initialise())
        {
            throw std::runtime_error("ember core failed to initialise");
        }
        context_ = std::make_unique<ember::RenderContext>(*core_, glm::ivec2(opt_.width, opt_.height));
    }

    void init_strings()
    {
        strings_.clear();
        ember::Result<size_t> loaded = strings_.load(files_, opt_.strings_path);
        if (!loaded)
        {
            (void)core_->log(ember::LogType::Warning, loaded.with_context("init_strings").error + " (untranslated tokens will be shown)");
        }
        else
        {
            (void)core_->log(ember::LogType::Info, "Loaded " + std::to_string(loaded.value) + " strings from " + opt_.strings_path);
        }
        system_->set_string_table(&strings_);

        const std::u16string title = ember::translate_to_internal(*core_, "[APP_TITLE] - [APP_SUBTITLE]");
        runtime_->set_title(ember::utf16_to_utf8(title));
    }

    void init_panels()
    {
        const glm::vec2 size((float)opt_.width, (float)opt_.height);

        // Background gradient.
        {
            const ember::PanelId id = context_->add_panel(glm::vec2(0.0f));
            ember::Geometry& g = *context_->panel(id)->geometry;
            g.vertices() = {
                ember::Vertex{glm::vec2(0.0f, 0.0f), ember::Color{24, 28, 44, 255}, glm::vec2(0.0f)},
                ember::Vertex{glm::vec2(size.x, 0.0f), ember::Color{24, 28, 44, 255}, glm::vec2(0.0f)},
                ember::Vertex{size, ember::Color{60, 30, 70, 255}, glm::vec2(0.0f)},
                ember::Vertex{glm::vec2(0.0f, size.y), ember::Color{60, 30, 70, 255}, glm::vec2(0.0f)}
            };
            g.indices() = {0, 3, 1, 1, 3, 2};
        }

        // Checker panel uses a generated texture.
        {
            const ember::PanelId id = context_->add_panel(glm::vec2(60.0f, 60.0f));
            ember::Geometry& g = *context_->panel(id)->geometry;
            ember::generate_quad(g.vertices(), g.indices(), glm::vec2(0.0f), glm::vec2(256.0f, 256.0f), ember::Color{255, 255, 255, 255});
            g.set_texture(core_->textures().generate("checker", generate_checker));
        }

        // Optional image from disk.
        if (!opt_.image_path.empty())
        {
            const ember::PanelId id = context_->add_panel(glm::vec2(360.0f, 60.0f));
            ember::Geometry& g = *context_->panel(id)->geometry;
            auto tex = core_->textures().fetch(opt_.image_path);
            const glm::ivec2 dims = tex->dimensions();
            const glm::vec2 fit = dims.x > 0 ? glm::vec2(256.0f, 256.0f * (float)dims.y / (float)dims.x) : glm::vec2(256.0f);
            ember::generate_quad(g.vertices(), g.indices(), glm::vec2(0.0f), fit, ember::Color{255, 255, 255, 255});
            g.set_texture(tex);
        }

        // Translucent bar clipped to a window; 'c' toggles the clip.
        clip_ = ember::ScissorRect{80, 380, opt_.width / 2, 120};
        clipped_panel_ = context_->add_panel(glm::vec2(0.0f, 360.0f), clip_);
        ember::Geometry& bar = *context_->panel(clipped_panel_)->geometry;
        ember::generate_quad(bar.vertices(), bar.indices(), glm::vec2(0.0f), glm::vec2(size.x, 160.0f), ember::Color{240, 140, 40, 180});
    }

    void main_loop()
    {
        int frame = 0;
        bool running = true;
        while (running)
        {
            ember::PlatformInputState input{};
            running = runtime_->pump_input(input);
            if (!running || input.quit) break;

            if (input.toggle_clip)
            {
                ember::Panel* p = context_->panel(clipped_panel_);
                if (p) p->clip = p->clip ? std::nullopt : std::optional<ember::ScissorRect>(clip_);
            }
            if (input.reload_strings) init_strings();

            // Bar slides with time; offset changes never recompile geometry.
            if (ember::Panel* p = context_->panel(clipped_panel_))
            {
                const float t = (float)core_->elapsed_time();
                p->offset.x = std::sin(t) * 120.0f;
            }

            draw_frame();
            ++frame;
            if (opt_.max_frames > 0 && frame >= opt_.max_frames) break;
        }

        const ember::SoftwareRasterStats& s = render_->stats();
        std::fprintf(stderr, "[ember] frames=%d draws=%llu compiled_draws=%llu tris=%llu compiled_geometries=%zu\n",
            frame,
            (unsigned long long)s.draw_calls,
            (unsigned long long)s.compiled_draw_calls,
            (unsigned long long)s.tri_raster,
            render_->compiled_geometry_count());
    }

    void draw_frame()
    {
        surface_.clear({0, 0, 0, 255});
        (void)context_->render();
        runtime_->upload_rgba8(surface_.rgba8(), surface_.w, surface_.h, surface_.w * 4);
        runtime_->present();
    }

private:
    AppOptions opt_{};
    ember::RT_ColorLDR surface_{};
    std::unique_ptr<ember::IPlatformRuntime> runtime_{};

    // Host-owned interfaces outlive the core and the context.
    ember::SdlFileInterface files_{};
    std::unique_ptr<ember::SdlSystemInterface> system_{};
    std::unique_ptr<ember::SoftwareRenderInterface> render_{};
    ember::StringTable strings_{};

    std::unique_ptr<ember::Core> core_{};
    std::unique_ptr<ember::RenderContext> context_{};

    ember::ScissorRect clip_{};
    ember::PanelId clipped_panel_ = ember::kInvalidPanelId;
};
}

int main(int argc, char* argv[])
{
    AppOptions opt{};
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i] ? argv[i] : "";
        if (arg == "--strings" && i + 1 < argc)
        {
            opt.strings_path = argv[++i];
        }
        else if (arg == "--image" && i + 1 < argc)
        {
            opt.image_path = argv[++i];
        }
        else if (arg == "--frames" && i + 1 < argc)
        {
            opt.max_frames = std::max(0, std::atoi(argv[++i]));
        }
        else if (arg == "--width" && i + 1 < argc)
        {
            opt.width = std::clamp(std::atoi(argv[++i]), 160, 4096);
        }
        else if (arg == "--height" && i + 1 < argc)
        {
            opt.height = std::clamp(std::atoi(argv[++i]), 120, 4096);
        }
        else if (arg == "--break-on-assert")
        {
            opt.break_on_assert = true;
        }
        else
        {
            std::fprintf(stderr, "usage: %s [--strings file] [--image file] [--frames n] [--width w] [--height h] [--break-on-assert]\n", argv[0]);
            return 2;
        }
    }

    try
    {
        HelloEmberUiApp app{opt};
        app.run();
        return 0;
    }
    catch (const std::exception& e)
    {
        std::fprintf(stderr, "Fatal: %s\n", e.what());
        return 1;
    }
}
