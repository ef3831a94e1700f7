// abstractchain/llm/llama_adapter.h
#ifndef ABSTRACTCHAIN_LLM_LLAMA_ADAPTER_H
#define ABSTRACTCHAIN_LLM_LLAMA_ADAPTER_H

#include "abstractchain/llm/language_model.h"
#include <nlohmann/json.hpp>
#include <llama.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace abstractchain {

class LlamaAdapter : public LanguageModel {
public:
    struct Config {
        std::string model_path;
        int n_ctx = 2048;
        int n_threads = 4;
        float temperature = 0.7f;
        float min_p = 0.05f;
        int n_predict = 512;
    };

    // Reads the `llm` section of the engine configuration. A relative
    // model_path is resolved against `base_dir`.
    static Config config_from_json(const nlohmann::json& j, const std::string& base_dir = ".");

    // Throws std::runtime_error if the model or its context cannot be created
    explicit LlamaAdapter(const Config& config);
    ~LlamaAdapter() override;

    // Serialised; each call starts from an empty KV memory
    std::string generate(const std::string& prompt) override;

    // Sticky. Aborts a running decode and rejects later calls.
    void cancel() override;

private:
    Config config_;
    std::unique_ptr<llama_model, decltype(&llama_model_free)> model_;
    std::unique_ptr<llama_context, decltype(&llama_free)> ctx_;
    std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)> sampler_;
    const llama_vocab* vocab_ = nullptr;
    std::mutex generate_mutex_; // a llama context is not re-entrant
    std::atomic<bool> cancelled_{false};

    static bool should_abort(void* data);
    std::vector<llama_token> tokenize(const std::string& text) const;
    std::string piece(llama_token token) const;
    void decode(llama_token* tokens, int32_t count);
};

} // namespace abstractchain

#endif // ABSTRACTCHAIN_LLM_LLAMA_ADAPTER_H
