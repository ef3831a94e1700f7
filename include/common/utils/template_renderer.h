#ifndef ABSTRACTCHAIN_COMMON_UTILS_TEMPLATE_RENDERER_H
#define ABSTRACTCHAIN_COMMON_UTILS_TEMPLATE_RENDERER_H

#include "common/types.h"
#include <inja/inja.hpp>
#include <string>
#include <string_view>

namespace abstractchain {

// Process-wide inja environment for prompt templates. Renders are serialised.
// Throws std::runtime_error on a template syntax or render error.
class InjaTemplateRenderer {
public:
    static std::string render(std::string_view template_str, const Context& context);

private:
    InjaTemplateRenderer();

    inja::Environment env_;
    void configure_security(); // include 被禁用
};

} // namespace abstractchain

#endif // ABSTRACTCHAIN_COMMON_UTILS_TEMPLATE_RENDERER_H
