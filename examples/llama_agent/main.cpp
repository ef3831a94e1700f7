// main.cpp
#include <fstream>
#include <iostream>
#include <string>
#include "abstractchain/core/config.h"
#include "abstractchain/core/engine.h"
#include "abstractchain/llm/llama_adapter.h"
#include "common/utils.h"

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <config.yaml> <question> [trace.json]\n";
        return 1;
    }

    try {
        // 1. 加载配置
        auto config = abstractchain::load_engine_config(argv[1]);
        auto llm_config = abstractchain::LlamaAdapter::config_from_json(config.llm, config.base_dir);

        // 2. 创建模型与工具
        abstractchain::LlamaAdapter model(llm_config);
        abstractchain::ToolRegistry tools;
        abstractchain::register_math_tools(tools);

        // 3. 执行
        abstractchain::AbstractChainEngine engine(tools, &model, nullptr, config);
        auto result = engine.run(argv[2]);

        if (result.success) {
            std::cout << "[SUCCESS]\n" << result.final_answer << "\n";
        } else {
            std::cerr << "[ERROR] (" << abstractchain::to_string(result.failure) << ") " << result.message << "\n";
        }

        // 4. 导出 Trace
        if (argc > 3) {
            std::ofstream trace_file(argv[3]);
            trace_file << abstractchain::dump_lossy(abstractchain::TraceExporter::to_json(result.traces), 2) << std::endl;
            std::cout << "Trace exported to " << argv[3] << " (" << result.traces.size() << " records)\n";
        }
        return result.success ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
}
