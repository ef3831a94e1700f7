// main.cpp
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "abstractchain/core/engine.h"
#include "common/utils.h"

// Stands in for a language model: answers every prompt from a fixed script
class ScriptedModel : public abstractchain::LanguageModel {
public:
    explicit ScriptedModel(std::vector<std::string> replies) : replies_(std::move(replies)) {}

    std::string generate(const std::string& prompt) override {
        std::cout << "----- prompt -----\n" << prompt << "\n";
        if (next_ >= replies_.size()) {
            throw std::runtime_error("script exhausted");
        }
        return replies_[next_++];
    }

private:
    std::vector<std::string> replies_;
    size_t next_ = 0;
};

int main() {
    try {
        // 1. 注册工具
        abstractchain::ToolRegistry tools;
        abstractchain::register_math_tools(tools);

        // 2. 脚本化模型
        ScriptedModel model({
            "Abstract plan of reasoning:\n"
            "After buying the apples, Sally has [FUNC add(3, 2) = y1] apples. Then, the wizard casts a spell "
            "to multiply the number of apples by 3, resulting in [FUNC multiply(y1, 3) = y2] apples.",
            "Response: After the wizard casts the spell, Sally has 15 apples."
        });

        abstractchain::EngineConfig config;
        config.verbose = true;
        abstractchain::AbstractChainEngine engine(tools, &model, nullptr, config);

        // 3. 执行
        auto result = engine.run("Sally has 3 apples and buys 2 more. Then magically, a wizard casts a spell "
                                 "that multiplies the number of apples by 3. How many apples does Sally have?");

        // 4. 输出结果
        if (!result.success) {
            std::cerr << "[ERROR] (" << abstractchain::to_string(result.failure) << ") " << result.message << "\n";
            return 1;
        }
        std::cout << "Filled plan:\n" << result.filled_plan << "\n\n";
        std::cout << "Answer: " << result.final_answer << "\n";
        std::cout << "Trace:\n" << abstractchain::dump_lossy(abstractchain::TraceExporter::to_json(result.traces), 2) << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
