#ifndef AGENTGRAPH_COMMON_UTILS_TEMPLATE_RENDERER_H
#define AGENTGRAPH_COMMON_UTILS_TEMPLATE_RENDERER_H

#include <inja/inja.hpp>
#include <nlohmann/json.hpp>
#include <filesystem> // Required by Inja for set_include_callback
#include <string>
#include <string_view>

namespace agentgraph {

// Inja renderer used for expression conditions. Includes are disabled.
class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    // 静态方法：使用默认环境渲染模板
    static std::string render(std::string_view template_str, const nlohmann::json& data);

    // Renders "{{ expression }}" and interprets the text: "true"/"1" -> true,
    // "false"/"0"/"" -> false. Anything else is an error.
    static bool evaluate(std::string_view expression, const nlohmann::json& data);

    std::string render_with_env(std::string_view template_str, const nlohmann::json& data);

private:
    inja::Environment env_;
    void configure_security();
};

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_UTILS_TEMPLATE_RENDERER_H
