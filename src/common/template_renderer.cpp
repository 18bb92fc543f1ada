// common/template_renderer.cpp
#include "graphflow/common/template_renderer.h"
#include <filesystem>
#include <stdexcept>

namespace graphflow {

InjaTemplateRenderer::InjaTemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_trim_blocks(true);
    env_.set_lstrip_blocks(true);
    configure_security();
}

void InjaTemplateRenderer::configure_security() {
    env_.set_search_included_templates_in_files(false);
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled in prompt templates.", inja::SourceLocation{});
    });
}

std::string InjaTemplateRenderer::render(std::string_view template_str, const Context& context) {
    static InjaTemplateRenderer renderer;
    return renderer.render_with_env(template_str, context);
}

std::string InjaTemplateRenderer::render_with_env(std::string_view template_str, const Context& context) {
    // inja::Environment 不是线程安全的
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        return env_.render(template_str, context);
    } catch (const inja::InjaError& e) {
        throw std::runtime_error("Template render error: " + std::string(e.message));
    }
}

} // namespace graphflow
