// common/utils/template_renderer.cpp
#include "common/utils/template_renderer.h"
#include <filesystem>
#include <mutex>
#include <stdexcept>

namespace abstractchain {

InjaTemplateRenderer::InjaTemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_line_statement("##");
    // Plans and prompts are plain text, keep newlines exactly as written
    env_.set_trim_blocks(false);
    env_.set_lstrip_blocks(false);

    configure_security();
}

void InjaTemplateRenderer::configure_security() {
    // Inja v3: set_include_callback expects a function returning inja::Template
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled for security.", inja::SourceLocation{});
    });
}

std::string InjaTemplateRenderer::render(std::string_view template_str, const Context& context) {
    static InjaTemplateRenderer renderer;
    static std::mutex render_mutex; // inja::Environment is not safe for concurrent use
    std::lock_guard<std::mutex> lock(render_mutex);
    try {
        return renderer.env_.render(template_str, context);
    } catch (const inja::InjaError& e) {
        throw std::runtime_error("Template render error: " + std::string(e.message));
    }
}

} // namespace abstractchain
