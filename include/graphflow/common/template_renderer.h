// graphflow/common/template_renderer.h
#ifndef GRAPHFLOW_COMMON_TEMPLATE_RENDERER_H
#define GRAPHFLOW_COMMON_TEMPLATE_RENDERER_H

#include "graphflow/common/types.h"
#include <inja/inja.hpp>
#include <mutex>
#include <string>
#include <string_view>

namespace graphflow {

// Inja rendering for agent prompts. Include is disabled.
class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    // 静态方法：使用共享环境渲染模板
    static std::string render(std::string_view template_str, const Context& context);

    std::string render_with_env(std::string_view template_str, const Context& context);

private:
    inja::Environment env_;
    std::mutex mutex_;

    void configure_security();
};

} // namespace graphflow

#endif // GRAPHFLOW_COMMON_TEMPLATE_RENDERER_H
