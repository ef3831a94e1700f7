// src/llm/prompt_builder.cpp
#include "abstractchain/llm/prompt_builder.h"
#include "common/utils.h"
#include "common/utils/template_renderer.h"
#include <initializer_list>

namespace abstractchain {

namespace {

std::string strip_label(const std::string& output, std::initializer_list<const char*> labels) {
    std::string text = trim(output);
    for (const char* label : labels) {
        std::string prefix(label);
        if (text.compare(0, prefix.size(), prefix) == 0) {
            return trim(std::string_view(text).substr(prefix.size()));
        }
    }
    return text;
}

} // namespace

const std::string& PromptBuilder::default_reasoning_template() {
    static const std::string tmpl = R"(Generate an abstract plan of reasoning using placeholders for the specific values and function calls needed.
The placeholders should be labeled y1, y2, etc.
Function calls should be written inline as [FUNC function_name(arg1, arg2, ...) = placeholder].
String arguments must be quoted. A placeholder defined earlier may be passed as an argument.
Assume someone will read the plan after the functions have been executed in order to write a final response.
Not every question needs function calls. Only use the available functions, never invent new ones.

Example:
-----------
Available functions:
- add(a: number, b: number) -> number: Add two numbers.
- multiply(a: number, b: number) -> number: Multiply two numbers.

Question:
Sally has 3 apples and buys 2 more. Then magically, a wizard casts a spell that multiplies the number of apples by 3. How many apples does Sally have?

Abstract plan of reasoning:
After buying the apples, Sally has [FUNC add(3, 2) = y1] apples. Then, the wizard casts a spell to multiply the number of apples by 3, resulting in [FUNC multiply(y1, 3) = y2] apples.

Your Turn:
-----------
Available functions:
{% for tool in tools %}- {{ tool.signature }}{% if tool.description != "" %}: {{ tool.description }}{% endif %}
{% endfor %}
Question:
{{ question }}

Abstract plan of reasoning:
)";
    return tmpl;
}

const std::string& PromptBuilder::default_refine_template() {
    static const std::string tmpl = R"(Generate a response to a question by using a previous abstract plan of reasoning. Use the previous reasoning as context to write a response to the question.

Example:
-----------
Question:
Sally has 3 apples and buys 2 more. Then magically, a wizard casts a spell that multiplies the number of apples by 3. How many apples does Sally have?

Previous reasoning:
After buying the apples, Sally has 5 apples. Then, the wizard casts a spell to multiply the number of apples by 3, resulting in 15 apples.

Response:
After the wizard casts the spell, Sally has 15 apples.

Your Turn:
-----------
Question:
{{ question }}

Previous reasoning:
{{ filled_plan }}

Response:
)";
    return tmpl;
}

PromptBuilder::PromptBuilder(std::string reasoning_template, std::string refine_template)
    : reasoning_template_(reasoning_template.empty() ? default_reasoning_template() : std::move(reasoning_template)),
      refine_template_(refine_template.empty() ? default_refine_template() : std::move(refine_template)) {}

std::string PromptBuilder::build_reasoning_prompt(const ToolRegistry& tools, const std::string& question) const {
    Context ctx;
    ctx["tools"] = tools.specs_context();
    ctx["question"] = question;
    return InjaTemplateRenderer::render(reasoning_template_, ctx);
}

std::string PromptBuilder::build_refine_prompt(const std::string& question, const std::string& filled_plan) const {
    Context ctx;
    ctx["question"] = question;
    ctx["filled_plan"] = filled_plan;
    return InjaTemplateRenderer::render(refine_template_, ctx);
}

std::string PromptBuilder::clean_plan(const std::string& model_output) {
    return strip_label(model_output, {"Abstract plan of reasoning:", "Abstract plan:"});
}

std::string PromptBuilder::clean_answer(const std::string& model_output) {
    return strip_label(model_output, {"Final Answer:", "Response:", "Answer:"});
}

} // namespace abstractchain
