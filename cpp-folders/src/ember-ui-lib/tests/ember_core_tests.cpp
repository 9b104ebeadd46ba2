#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ember/core/config.hpp"
#include "ember/core/core.hpp"
#include "ember/host/string_table.hpp"
#include "ember/render/geometry.hpp"
#include "ember/render/render_context.hpp"
#include "ember/render/scissor_state.hpp"
#include "ember/render/texture_database.hpp"
#include "ember/text/string_utils.hpp"
#include "ember/text/translator.hpp"

namespace
{
    bool approx_eq(float a, float b, float eps = 1e-4f)
    {
        return std::abs(a - b) <= eps;
    }

    struct DrawRecord
    {
        bool compiled = false;
        ember::CompiledGeometryHandle geometry = 0;
        ember::TextureHandle texture = 0;
        glm::vec2 translation{0.0f};
        bool scissor_enabled = false;
        ember::ScissorRect scissor{};
    };

    struct RecordingRenderInterface final : ember::IRenderInterface
    {
        void render_geometry(
            std::span<const ember::Vertex> vertices,
            std::span<const int> indices,
            ember::TextureHandle texture,
            const glm::vec2& translation) override
        {
            (void)vertices;
            (void)indices;
            draws.push_back(DrawRecord{false, 0, texture, translation, scissor_enabled, scissor});
        }

        ember::CompiledGeometryHandle compile_geometry(
            std::span<const ember::Vertex> vertices,
            std::span<const int> indices,
            ember::TextureHandle texture) override
        {
            (void)vertices;
            (void)indices;
            ++compile_calls;
            if (!accept_compile) return ember::kInvalidCompiledGeometryHandle;
            const ember::CompiledGeometryHandle h = next_geometry++;
            compiled_textures.push_back(texture);
            return h;
        }

        void render_compiled_geometry(ember::CompiledGeometryHandle geometry, const glm::vec2& translation) override
        {
            draws.push_back(DrawRecord{true, geometry, 0, translation, scissor_enabled, scissor});
        }

        void release_compiled_geometry(ember::CompiledGeometryHandle geometry) override
        {
            released_geometry.push_back(geometry);
        }

        void enable_scissor_region(bool enable) override
        {
            scissor_enabled = enable;
            ++enable_calls;
        }

        void set_scissor_region(int x, int y, int width, int height) override
        {
            scissor = ember::ScissorRect{x, y, width, height};
            ++set_calls;
        }

        bool load_texture(ember::TextureHandle& texture_handle, glm::ivec2& texture_dimensions, const std::string& source) override
        {
            ++load_calls;
            last_source = source;
            if (source.find("missing") != std::string::npos) return false;
            texture_handle = next_texture++;
            texture_dimensions = glm::ivec2(32, 16);
            return true;
        }

        bool generate_texture(ember::TextureHandle& texture_handle, std::span<const uint8_t> source, const glm::ivec2& source_dimensions) override
        {
            ++generate_calls;
            if (source.size() != (size_t)source_dimensions.x * (size_t)source_dimensions.y * 4u) return false;
            texture_handle = next_texture++;
            return true;
        }

        void release_texture(ember::TextureHandle texture) override
        {
            released_textures.push_back(texture);
        }

        float horizontal_texel_offset() const override { return texel_offset; }
        float vertical_texel_offset() const override { return texel_offset; }

        bool accept_compile = true;
        float texel_offset = 0.0f;
        std::vector<DrawRecord> draws{};
        int compile_calls = 0;
        int enable_calls = 0;
        int set_calls = 0;
        int load_calls = 0;
        int generate_calls = 0;
        std::string last_source{};
        bool scissor_enabled = false;
        ember::ScissorRect scissor{};
        ember::CompiledGeometryHandle next_geometry = 1;
        ember::TextureHandle next_texture = 1;
        // Indexed by compiled handle - 1.
        std::vector<ember::TextureHandle> compiled_textures{};
        std::vector<ember::CompiledGeometryHandle> released_geometry{};
        std::vector<ember::TextureHandle> released_textures{};
    };

    struct RecordingSystemInterface final : ember::ISystemInterface
    {
        double elapsed_time() override { return now; }

        int translate_string(std::string& translated, const std::string& input) override
        {
            ++translate_calls;
            if (translator) return translator(translated, input);
            return ember::ISystemInterface::translate_string(translated, input);
        }

        bool log_message(ember::LogType type, const std::string& message) override
        {
            logs.push_back({type, message});
            return continue_after_log;
        }

        bool logged(ember::LogType type) const
        {
            for (const auto& [t, m] : logs)
            {
                (void)m;
                if (t == type) return true;
            }
            return false;
        }

        double now = 1.5;
        bool continue_after_log = true;
        int translate_calls = 0;
        std::function<int(std::string&, const std::string&)> translator{};
        std::vector<std::pair<ember::LogType, std::string>> logs{};
    };

    struct CoreFixture
    {
        RecordingSystemInterface system{};
        RecordingRenderInterface render{};
        std::unique_ptr<ember::Core> core{};

        explicit CoreFixture(ember::CoreConfig config = {})
        {
            core = std::make_unique<ember::Core>(config);
            (void)core->set_system_interface(&system);
            (void)core->set_render_interface(&render);
        }

        ~CoreFixture()
        {
            core.reset();
        }
    };

    void add_quad_panel(ember::RenderContext& ctx, const glm::vec2& offset, std::optional<ember::ScissorRect> clip = std::nullopt)
    {
        const ember::PanelId id = ctx.add_panel(offset, clip);
        ember::Geometry& g = *ctx.panel(id)->geometry;
        ember::generate_quad(g.vertices(), g.indices(), glm::vec2(0.0f), glm::vec2(10.0f, 10.0f), ember::Color{255, 255, 255, 255});
    }

    bool test_core_initialise_requires_interfaces()
    {
        RecordingSystemInterface system{};
        RecordingRenderInterface render{};

        ember::Core core{};
        if (core.initialise()) return false;
        (void)core.set_system_interface(&system);
        if (core.initialise()) return false;
        if (!system.logged(ember::LogType::Error)) return false;
        (void)core.set_render_interface(&render);
        if (!core.initialise()) return false;

        // Built-in file interface stands in when the host supplied none.
        if (!core.file_interface()) return false;

        // Interfaces are fixed while initialised.
        RecordingRenderInterface other{};
        if (core.set_render_interface(&other)) return false;
        if (core.render_interface() != &render) return false;

        core.shutdown();
        if (core.initialised()) return false;
        if (!core.set_render_interface(&other)) return false;
        return true;
    }

    bool test_static_content_compiled_once_over_frames()
    {
        CoreFixture f{};
        if (!f.core->initialise()) return false;

        ember::RenderContext ctx(*f.core, glm::ivec2(100, 100));
        add_quad_panel(ctx, glm::vec2(0.0f));
        add_quad_panel(ctx, glm::vec2(20.0f, 0.0f));

        for (int frame = 0; frame < 10; ++frame)
        {
            if (!ctx.render()) return false;
        }

        if (f.render.compile_calls != 2) return false;
        if (f.render.draws.size() != 20) return false;
        for (const DrawRecord& d : f.render.draws)
        {
            if (!d.compiled) return false;
            if (d.geometry == ember::kInvalidCompiledGeometryHandle) return false;
        }
        if (ctx.stats().frames != 10) return false;
        return true;
    }

    bool test_declined_compile_falls_back_to_immediate()
    {
        CoreFixture f{};
        f.render.accept_compile = false;
        if (!f.core->initialise()) return false;

        ember::RenderContext ctx(*f.core, glm::ivec2(100, 100));
        add_quad_panel(ctx, glm::vec2(5.0f, 6.0f));

        for (int frame = 0; frame < 5; ++frame) (void)ctx.render();

        if (f.render.compile_calls != 1) return false;
        if (f.render.draws.size() != 5) return false;
        for (const DrawRecord& d : f.render.draws)
        {
            if (d.compiled) return false;
            if (!approx_eq(d.translation.x, 5.0f) || !approx_eq(d.translation.y, 6.0f)) return false;
        }
        return true;
    }

    bool test_geometry_release_reoffers_compilation()
    {
        CoreFixture f{};
        if (!f.core->initialise()) return false;

        auto g = std::make_unique<ember::Geometry>(*f.core);
        g->render(glm::vec2(0.0f));
        if (f.render.compile_calls != 0) return false;

        ember::generate_quad(g->vertices(), g->indices(), glm::vec2(0.0f), glm::vec2(4.0f), ember::Color{255, 0, 0, 255});
        g->render(glm::vec2(0.0f));
        g->render(glm::vec2(0.0f));
        if (f.render.compile_calls != 1) return false;
        const ember::CompiledGeometryHandle first = g->compiled_handle();
        if (first == ember::kInvalidCompiledGeometryHandle) return false;

        g->vertices()[0].colour = ember::Color{0, 255, 0, 255};
        g->release();
        if (f.render.released_geometry.size() != 1 || f.render.released_geometry[0] != first) return false;

        g->render(glm::vec2(0.0f));
        if (f.render.compile_calls != 2) return false;
        const ember::CompiledGeometryHandle second = g->compiled_handle();
        if (second == first || second == ember::kInvalidCompiledGeometryHandle) return false;

        g.reset();
        if (f.render.released_geometry.size() != 2 || f.render.released_geometry[1] != second) return false;
        return true;
    }

    bool test_compiled_geometry_follows_texture_changes()
    {
        CoreFixture f{};
        if (!f.core->initialise()) return false;

        ember::Geometry g(*f.core);
        ember::generate_quad(g.vertices(), g.indices(), glm::vec2(0.0f), glm::vec2(8.0f), ember::Color{255, 255, 255, 255});
        g.set_texture(f.core->textures().fetch("red.tga"));
        g.render(glm::vec2(0.0f));

        const ember::CompiledGeometryHandle first = g.compiled_handle();
        const ember::TextureHandle red = g.texture()->handle();
        if (first == ember::kInvalidCompiledGeometryHandle) return false;
        if (f.render.compiled_textures[first - 1] != red) return false;

        // Swapping the texture drops the compiled batch before the old
        // texture goes back to the host.
        g.set_texture(f.core->textures().fetch("blue.tga"));
        if (f.render.released_geometry != std::vector<ember::CompiledGeometryHandle>{first}) return false;
        if (f.render.released_textures != std::vector<ember::TextureHandle>{red}) return false;

        g.render(glm::vec2(0.0f));
        const ember::CompiledGeometryHandle second = g.compiled_handle();
        const ember::TextureHandle blue = g.texture()->handle();
        if (second == first || second == ember::kInvalidCompiledGeometryHandle) return false;
        if (f.render.compiled_textures[second - 1] != blue) return false;
        if (f.render.draws.back().geometry != second) return false;

        // Shutdown releases blue; after re-initialising it loads under a new
        // handle and the batch is compiled again against that one.
        f.core->shutdown();
        if (f.render.released_textures.back() != blue) return false;
        if (!f.core->initialise()) return false;
        g.render(glm::vec2(0.0f));

        const ember::CompiledGeometryHandle third = g.compiled_handle();
        const ember::TextureHandle reloaded = g.texture()->handle();
        if (reloaded == blue || reloaded == ember::kInvalidTextureHandle) return false;
        if (third == second || third == ember::kInvalidCompiledGeometryHandle) return false;
        if (f.render.released_geometry.back() != second) return false;
        if (f.render.compiled_textures[third - 1] != reloaded) return false;
        if (f.render.draws.back().geometry != third) return false;
        return f.render.compile_calls == 3;
    }

    bool test_removed_panel_releases_compiled_geometry()
    {
        CoreFixture f{};
        if (!f.core->initialise()) return false;

        ember::RenderContext ctx(*f.core, glm::ivec2(64, 64));
        add_quad_panel(ctx, glm::vec2(0.0f));
        add_quad_panel(ctx, glm::vec2(20.0f, 0.0f));
        (void)ctx.render();

        const ember::PanelId first = 1;
        const ember::CompiledGeometryHandle h = ctx.panel(first)->geometry->compiled_handle();
        if (!ctx.remove_panel(first)) return false;
        if (ctx.remove_panel(first)) return false;
        if (ctx.panel(first) != nullptr || ctx.panel_count() != 1) return false;
        if (f.render.released_geometry != std::vector<ember::CompiledGeometryHandle>{h}) return false;

        f.render.draws.clear();
        (void)ctx.render();
        if (f.render.draws.size() != 1) return false;
        return f.render.draws[0].geometry != h;
    }

    bool test_scissor_active_for_every_draw()
    {
        CoreFixture f{};
        if (!f.core->initialise()) return false;

        const ember::ScissorRect a{10, 10, 30, 30};
        const ember::ScissorRect b{50, 0, 200, 40};

        ember::RenderContext ctx(*f.core, glm::ivec2(100, 100));
        add_quad_panel(ctx, glm::vec2(0.0f), a);
        add_quad_panel(ctx, glm::vec2(1.0f), a);
        add_quad_panel(ctx, glm::vec2(2.0f));
        add_quad_panel(ctx, glm::vec2(3.0f), b);

        if (!ctx.render()) return false;
        if (f.render.draws.size() != 4) return false;

        const auto& d = f.render.draws;
        if (!d[0].scissor_enabled || d[0].scissor != a) return false;
        if (!d[1].scissor_enabled || d[1].scissor != a) return false;
        if (d[2].scissor_enabled) return false;
        // b is clamped to the 100x100 context.
        const ember::ScissorRect b_clamped{50, 0, 50, 40};
        if (!d[3].scissor_enabled || d[3].scissor != b_clamped) return false;

        // Same rectangle twice is sent once; the frame ends with scissoring off.
        if (f.render.set_calls != 2) return false;
        if (f.render.enable_calls != 4) return false;
        if (f.render.scissor_enabled) return false;
        return true;
    }

    bool test_scissor_state_nested_push_pop()
    {
        RecordingRenderInterface render{};
        ember::ScissorState s(render);

        s.push(ember::ScissorRect{0, 0, 100, 100});
        s.push(ember::ScissorRect{50, 50, 100, 100});
        if (!render.scissor_enabled) return false;
        if (render.scissor != (ember::ScissorRect{50, 50, 50, 50})) return false;
        if (!s.enabled() || !s.current() || *s.current() != (ember::ScissorRect{50, 50, 50, 50})) return false;

        s.pop();
        if (render.scissor != (ember::ScissorRect{0, 0, 100, 100})) return false;
        s.pop();
        if (render.scissor_enabled || s.enabled()) return false;
        if (s.depth() != 0) return false;

        // Popping an empty stack is harmless.
        s.pop();
        return render.enable_calls == 2;
    }

    bool test_fully_clipped_panel_skipped()
    {
        CoreFixture f{};
        if (!f.core->initialise()) return false;

        ember::RenderContext ctx(*f.core, glm::ivec2(64, 64));
        add_quad_panel(ctx, glm::vec2(0.0f), ember::ScissorRect{100, 100, 10, 10});
        add_quad_panel(ctx, glm::vec2(0.0f));
        (void)ctx.render();

        if (f.render.draws.size() != 1) return false;
        if (ctx.stats().panels_culled != 1) return false;
        return true;
    }

    bool test_texel_offset_added_to_translation()
    {
        CoreFixture f{};
        f.render.texel_offset = 0.5f;
        f.render.accept_compile = false;
        if (!f.core->initialise()) return false;

        ember::RenderContext ctx(*f.core, glm::ivec2(64, 64));
        add_quad_panel(ctx, glm::vec2(3.0f, 4.0f));
        (void)ctx.render();

        if (f.render.draws.size() != 1) return false;
        return approx_eq(f.render.draws[0].translation.x, 3.5f) && approx_eq(f.render.draws[0].translation.y, 4.5f);
    }

    bool test_passthrough_translation_leaves_text_identical()
    {
        RecordingSystemInterface system{};
        const std::string input = "Hello [NOT_A_TOKEN] <b>world</b>";
        const ember::TranslationResult r = ember::translate_text(system, input, 16);
        if (r.text != input) return false;
        if (r.passes != 1) return false;
        if (r.substitutions != 0) return false;
        return r.stop == ember::TranslationStop::Settled;
    }

    bool test_recursive_translation_expands_nested_tokens()
    {
        ember::StringTable table{};
        table.set("TITLE", "[PRODUCT] [VERSION]");
        table.set("PRODUCT", "Ember");
        table.set("VERSION", "v[MAJOR]");
        table.set("MAJOR", "2");

        RecordingSystemInterface system{};
        system.translator = [&table](std::string& out, const std::string& in) { return table.translate(out, in); };

        const ember::TranslationResult r = ember::translate_text(system, "<h1>[TITLE]</h1>", 16);
        if (r.text != "<h1>Ember v2</h1>") return false;
        if (r.stop != ember::TranslationStop::Settled) return false;
        // TITLE, then PRODUCT+VERSION, then MAJOR, then a pass that finds nothing.
        if (r.passes != 4) return false;
        if (r.substitutions != 4) return false;
        return true;
    }

    bool test_self_referential_translation_stops_on_cycle()
    {
        ember::StringTable table{};
        table.set("A", "[B]");
        table.set("B", "[A]");

        RecordingSystemInterface system{};
        system.translator = [&table](std::string& out, const std::string& in) { return table.translate(out, in); };

        const ember::TranslationResult r = ember::translate_text(system, "[A]", 64);
        if (r.stop != ember::TranslationStop::Cycle) return false;
        if (r.text != "[B]") return false;
        if (r.passes != 2) return false;
        return system.translate_calls == 2;
    }

    bool test_growing_translation_stops_at_depth_limit()
    {
        RecordingSystemInterface system{};
        system.translator = [](std::string& out, const std::string& in)
        {
            out = in + "x";
            return 1;
        };

        const ember::TranslationResult r = ember::translate_text(system, "a", 5);
        if (r.stop != ember::TranslationStop::DepthLimit) return false;
        if (!r.truncated()) return false;
        if (r.passes != 5) return false;
        return r.text == "axxxxx";
    }

    bool test_translate_to_internal_reports_truncation()
    {
        ember::CoreConfig cfg{};
        cfg.translation_max_depth = 3;
        CoreFixture f{cfg};
        f.system.translator = [](std::string& out, const std::string& in)
        {
            out = in + "!";
            return 1;
        };

        const std::u16string text = ember::translate_to_internal(*f.core, "hi");
        if (text != u"hi!!!") return false;
        if (f.system.translate_calls != 3) return false;
        return f.system.logged(ember::LogType::Warning);
    }

    bool test_log_interrupt_invokes_break_handler()
    {
        CoreFixture f{};
        int breaks = 0;
        ember::LogType break_type = ember::LogType::Info;
        f.core->set_break_handler([&](ember::LogType type, const std::string&)
        {
            ++breaks;
            break_type = type;
        });

        if (!f.core->log(ember::LogType::Warning, "keep going")) return false;
        if (breaks != 0) return false;

        f.system.continue_after_log = false;
        if (f.core->log(ember::LogType::Assert, "stop here")) return false;
        if (breaks != 1 || break_type != ember::LogType::Assert) return false;

        // Below the threshold nothing reaches the host.
        const size_t before = f.system.logs.size();
        if (!f.core->log(ember::LogType::Debug, "noise")) return false;
        if (f.system.logs.size() != before) return false;
        return breaks == 1;
    }

    bool test_texture_database_shares_and_releases()
    {
        CoreFixture f{};
        if (!f.core->initialise()) return false;

        ember::TextureDatabase& db = f.core->textures();
        auto a = db.fetch("../images/icon.tga", "ui/docs/main.rml");
        auto b = db.fetch("ui/images/icon.tga");
        if (a != b) return false;
        if (a->source() != "ui/images/icon.tga") return false;

        const ember::TextureHandle h = a->handle();
        if (h == ember::kInvalidTextureHandle) return false;
        if (a->dimensions() != glm::ivec2(32, 16)) return false;
        (void)b->handle();
        if (f.render.load_calls != 1) return false;
        if (f.render.last_source != "ui/images/icon.tga") return false;

        a.reset();
        if (!f.render.released_textures.empty()) return false;
        b.reset();
        if (f.render.released_textures.size() != 1 || f.render.released_textures[0] != h) return false;
        return db.size() == 0;
    }

    bool test_failed_texture_load_yields_invalid_handle_once()
    {
        CoreFixture f{};
        if (!f.core->initialise()) return false;

        auto t = f.core->textures().fetch("missing.tga");
        if (t->handle() != ember::kInvalidTextureHandle) return false;
        if (t->handle() != ember::kInvalidTextureHandle) return false;
        if (!t->load_failed()) return false;
        if (f.render.load_calls != 1) return false;
        return f.system.logged(ember::LogType::Warning);
    }

    bool test_generated_texture_checks_buffer()
    {
        CoreFixture f{};
        if (!f.core->initialise()) return false;

        auto bad = f.core->textures().generate("bad", [](std::vector<uint8_t>& rgba, glm::ivec2& dims)
        {
            dims = glm::ivec2(4, 4);
            rgba.assign(10, 0);
            return true;
        });
        if (bad->handle() != ember::kInvalidTextureHandle) return false;
        if (f.render.generate_calls != 0) return false;

        auto good = f.core->textures().generate("glyphs", [](std::vector<uint8_t>& rgba, glm::ivec2& dims)
        {
            dims = glm::ivec2(2, 2);
            rgba.assign(16, 255);
            return true;
        });
        if (!good->generated()) return false;
        if (good->handle() == ember::kInvalidTextureHandle) return false;
        if (good->dimensions() != glm::ivec2(2, 2)) return false;
        return f.render.generate_calls == 1;
    }

    bool test_shutdown_releases_textures()
    {
        CoreFixture f{};
        if (!f.core->initialise()) return false;

        auto t = f.core->textures().fetch("a.tga");
        const ember::TextureHandle h = t->handle();
        f.core->shutdown();
        if (f.render.released_textures.size() != 1 || f.render.released_textures[0] != h) return false;
        if (t->loaded()) return false;

        // Released resources load again on demand.
        if (!f.core->initialise()) return false;
        const ember::TextureHandle again = t->handle();
        return again != ember::kInvalidTextureHandle && again != h;
    }

    bool test_textured_geometry_passes_texture_handle()
    {
        CoreFixture f{};
        f.render.accept_compile = false;
        if (!f.core->initialise()) return false;

        ember::Geometry g(*f.core);
        ember::generate_quad(g.vertices(), g.indices(), glm::vec2(0.0f), glm::vec2(8.0f), ember::Color{255, 255, 255, 255});
        g.set_texture(f.core->textures().fetch("panel.tga"));
        g.render(glm::vec2(0.0f));

        if (f.render.draws.size() != 1) return false;
        return f.render.draws[0].texture != ember::kInvalidTextureHandle && f.render.draws[0].texture == g.texture()->handle();
    }

    bool test_utf8_to_internal_utf16()
    {
        if (ember::utf8_to_utf16("abc") != u"abc") return false;
        if (ember::utf8_to_utf16("h\xC3\xA9llo") != u"h\u00E9llo") return false;
        if (ember::utf8_to_utf16("\xE2\x82\xAC") != u"\u20AC") return false;

        // U+1F600 needs a surrogate pair.
        const std::u16string emoji = ember::utf8_to_utf16("\xF0\x9F\x98\x80");
        if (emoji.size() != 2 || emoji[0] != 0xD83D || emoji[1] != 0xDE00) return false;
        if (ember::utf16_to_utf8(emoji) != "\xF0\x9F\x98\x80") return false;

        // Stray continuation byte, truncated sequence and overlong form.
        if (ember::utf8_to_utf16("a\x80" "b") != u"a\uFFFDb") return false;
        if (ember::utf8_to_utf16("a\xE2\x82") != u"a\uFFFD\uFFFD") return false;
        if (ember::utf8_to_utf16("\xC0\xAF") != u"\uFFFD") return false;
        return true;
    }

    bool test_join_document_path()
    {
        if (ember::join_document_path("ui/docs/main.rml", "../img/a.tga") != "ui/img/a.tga") return false;
        if (ember::join_document_path("ui/docs/main.rml", "./b.tga") != "ui/docs/b.tga") return false;
        if (ember::join_document_path("main.rml", "c.tga") != "c.tga") return false;
        if (ember::join_document_path("ui/main.rml", "/abs/d.tga") != "/abs/d.tga") return false;
        if (ember::join_document_path("ui\\win\\main.rml", "e.tga") != "ui/win/e.tga") return false;
        return true;
    }

    void set_env(const char* name, const char* value)
    {
#if defined(_WIN32)
        _putenv_s(name, value);
#else
        setenv(name, value, 1);
#endif
    }

    bool test_core_config_from_env()
    {
        set_env("EMBER_TRANSLATION_MAX_DEPTH", "4");
        set_env("EMBER_LOG_LEVEL", "Debug");
        set_env("EMBER_FILE_ROOT", "assets");
        ember::CoreConfig cfg = ember::load_core_config_from_env();
        if (cfg.translation_max_depth != 4) return false;
        if (cfg.log_threshold != ember::LogType::Debug) return false;
        if (cfg.file_root != "assets") return false;

        set_env("EMBER_TRANSLATION_MAX_DEPTH", "lots");
        set_env("EMBER_LOG_LEVEL", "chatty");
        cfg = ember::load_core_config_from_env();
        if (cfg.translation_max_depth != 16) return false;
        if (cfg.log_threshold != ember::LogType::Info) return false;

        set_env("EMBER_TRANSLATION_MAX_DEPTH", "");
        set_env("EMBER_LOG_LEVEL", "");
        set_env("EMBER_FILE_ROOT", "");
        return true;
    }
}

int main()
{
    struct Case
    {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"core initialise requires interfaces", test_core_initialise_requires_interfaces},
        {"static content compiled once over frames", test_static_content_compiled_once_over_frames},
        {"declined compile falls back to immediate path", test_declined_compile_falls_back_to_immediate},
        {"geometry release re-offers compilation", test_geometry_release_reoffers_compilation},
        {"compiled geometry follows texture changes", test_compiled_geometry_follows_texture_changes},
        {"removed panel releases compiled geometry", test_removed_panel_releases_compiled_geometry},
        {"scissor active for every draw", test_scissor_active_for_every_draw},
        {"scissor state nested push/pop", test_scissor_state_nested_push_pop},
        {"fully clipped panel skipped", test_fully_clipped_panel_skipped},
        {"texel offset added to translation", test_texel_offset_added_to_translation},
        {"pass-through translation leaves text identical", test_passthrough_translation_leaves_text_identical},
        {"recursive translation expands nested tokens", test_recursive_translation_expands_nested_tokens},
        {"self-referential translation stops on cycle", test_self_referential_translation_stops_on_cycle},
        {"growing translation stops at depth limit", test_growing_translation_stops_at_depth_limit},
        {"translate_to_internal reports truncation", test_translate_to_internal_reports_truncation},
        {"log interrupt invokes break handler", test_log_interrupt_invokes_break_handler},
        {"texture database shares and releases", test_texture_database_shares_and_releases},
        {"failed texture load yields invalid handle once", test_failed_texture_load_yields_invalid_handle_once},
        {"generated texture checks buffer", test_generated_texture_checks_buffer},
        {"shutdown releases textures", test_shutdown_releases_textures},
        {"textured geometry passes texture handle", test_textured_geometry_passes_texture_handle},
        {"utf8 to internal utf16", test_utf8_to_internal_utf16},
        {"join document path", test_join_document_path},
        {"core config from env", test_core_config_from_env},
    };

    bool all_ok = true;
    for (const Case& c : cases)
    {
        if (!c.fn())
        {
            std::fprintf(stderr, "[ember-core-tests] %s failed\n", c.name);
            all_ok = false;
        }
    }

    if (!all_ok) return 1;
    std::fprintf(stderr, "[ember-core-tests] all tests passed\n");
    return 0;
}
