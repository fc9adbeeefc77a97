// common/utils/template_renderer.cpp
#include "common/utils/template_renderer.h"
#include <mutex>
#include <stdexcept>

namespace agentgraph {

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
        throw inja::InjaError("render_error", "Include is disabled for security.", inja::SourceLocation{});
    });
}

std::string InjaTemplateRenderer::render(std::string_view template_str, const nlohmann::json& data) {
    // inja::Environment caches templates and callbacks; guard the shared instance
    static InjaTemplateRenderer renderer;
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    return renderer.render_with_env(template_str, data);
}

bool InjaTemplateRenderer::evaluate(std::string_view expression, const nlohmann::json& data) {
    const std::string rendered = render("{{ " + std::string(expression) + " }}", data);
    if (rendered == "true" || rendered == "1") return true;
    if (rendered == "false" || rendered == "0" || rendered.empty()) return false;
    throw std::runtime_error("Condition '" + std::string(expression) + "' did not render a boolean: '" +
                             rendered + "'");
}

std::string InjaTemplateRenderer::render_with_env(std::string_view template_str, const nlohmann::json& data) {
    try {
        return env_.render(template_str, data);
    } catch (const inja::InjaError& e) {
        throw std::runtime_error("Template render error: " + std::string(e.message));
    }
}

} // namespace agentgraph
