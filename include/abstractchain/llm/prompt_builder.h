// abstractchain/llm/prompt_builder.h
#ifndef ABSTRACTCHAIN_LLM_PROMPT_BUILDER_H
#define ABSTRACTCHAIN_LLM_PROMPT_BUILDER_H

#include "abstractchain/tools/registry.h"
#include "common/types.h"
#include <string>

namespace abstractchain {

// Renders the two prompts of a run with inja.
// Reasoning template context: {"tools": [{name, signature, description}], "question"}
// Refine template context:    {"question", "filled_plan"}
class PromptBuilder {
public:
    static const std::string& default_reasoning_template();
    static const std::string& default_refine_template();

    // Empty templates fall back to the defaults
    explicit PromptBuilder(std::string reasoning_template = {}, std::string refine_template = {});

    std::string build_reasoning_prompt(const ToolRegistry& tools, const std::string& question) const;
    std::string build_refine_prompt(const std::string& question, const std::string& filled_plan) const;

    // Strip the "Abstract plan:" / "Response:" style labels models tend to echo
    static std::string clean_plan(const std::string& model_output);
    static std::string clean_answer(const std::string& model_output);

private:
    std::string reasoning_template_;
    std::string refine_template_;
};

} // namespace abstractchain

#endif // ABSTRACTCHAIN_LLM_PROMPT_BUILDER_H
