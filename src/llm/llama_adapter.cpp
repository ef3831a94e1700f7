// src/llm/llama_adapter.cpp
#include "abstractchain/llm/llama_adapter.h"
#include <filesystem>
#include <stdexcept>
#include <thread>
#include <vector>

namespace abstractchain {

namespace {

int default_threads() {
    unsigned int n = std::thread::hardware_concurrency();
    return n > 0 ? static_cast<int>(n) : 4;
}

llama_model* load_model(const std::string& path) {
    llama_model_params params = llama_model_default_params();
    params.n_gpu_layers = 99; // offload everything the backend accepts
    llama_model* model = llama_model_load_from_file(path.c_str(), params);
    if (model == nullptr) {
        throw std::runtime_error("Cannot load model '" + path + "'");
    }
    return model;
}

llama_sampler* make_sampler(float min_p, float temperature) {
    llama_sampler* chain = llama_sampler_chain_init(llama_sampler_chain_default_params());
    llama_sampler_chain_add(chain, llama_sampler_init_min_p(min_p, 1));
    llama_sampler_chain_add(chain, llama_sampler_init_temp(temperature));
    llama_sampler_chain_add(chain, llama_sampler_init_dist(LLAMA_DEFAULT_SEED));
    return chain;
}

} // namespace

LlamaAdapter::Config LlamaAdapter::config_from_json(const nlohmann::json& j, const std::string& base_dir) {
    namespace fs = std::filesystem;

    Config config;
    config.n_threads = default_threads();
    if (j.is_null()) {
        return config;
    }
    if (!j.is_object()) {
        throw std::runtime_error("'llm' must be a mapping");
    }

    if (j.contains("model_path")) {
        if (!j["model_path"].is_string()) {
            throw std::runtime_error("'llm.model_path' must be a string");
        }
        fs::path model_path = j["model_path"].get<std::string>();
        if (model_path.is_relative()) {
            fs::path dir = base_dir.empty() ? fs::path(".") : fs::path(base_dir);
            model_path = fs::absolute(dir / model_path);
        }
        config.model_path = model_path.string();
    }

    auto read_int = [&j](const char* key, int& out) {
        if (!j.contains(key)) return;
        if (!j[key].is_number_integer()) {
            throw std::runtime_error(std::string("'llm.") + key + "' must be an integer");
        }
        out = j[key].get<int>();
    };
    auto read_float = [&j](const char* key, float& out) {
        if (!j.contains(key)) return;
        if (!j[key].is_number()) {
            throw std::runtime_error(std::string("'llm.") + key + "' must be a number");
        }
        out = static_cast<float>(j[key].get<double>());
    };

    read_int("n_ctx", config.n_ctx);
    read_int("n_threads", config.n_threads);
    read_int("n_predict", config.n_predict);
    read_float("temperature", config.temperature);
    read_float("min_p", config.min_p);

    if (config.n_threads <= 0) {
        config.n_threads = default_threads();
    }
    return config;
}

LlamaAdapter::LlamaAdapter(const Config& config)
    : config_(config),
      model_(load_model(config.model_path), llama_model_free),
      ctx_(nullptr, llama_free),
      sampler_(make_sampler(config.min_p, config.temperature), llama_sampler_free) {
    llama_context_params params = llama_context_default_params();
    params.n_ctx = static_cast<uint32_t>(config_.n_ctx);
    params.n_threads = config_.n_threads;
    params.n_threads_batch = config_.n_threads;
    params.abort_callback = &LlamaAdapter::should_abort;
    params.abort_callback_data = this;

    ctx_.reset(llama_init_from_model(model_.get(), params));
    if (ctx_ == nullptr) {
        throw std::runtime_error("Cannot create a " + std::to_string(config_.n_ctx) +
                                 "-token context for '" + config_.model_path + "'");
    }
    vocab_ = llama_model_get_vocab(model_.get());
}

LlamaAdapter::~LlamaAdapter() = default;

bool LlamaAdapter::should_abort(void* data) {
    return static_cast<LlamaAdapter*>(data)->cancelled_.load();
}

void LlamaAdapter::cancel() {
    cancelled_.store(true);
}

std::vector<llama_token> LlamaAdapter::tokenize(const std::string& text) const {
    const auto length = static_cast<int32_t>(text.size());
    // a first pass with no buffer reports the required size as a negative count
    std::vector<llama_token> tokens(text.size() + 2);
    int32_t n = llama_tokenize(vocab_, text.data(), length, tokens.data(),
                               static_cast<int32_t>(tokens.size()), true, true);
    if (n < 0) {
        tokens.resize(static_cast<size_t>(-n));
        n = llama_tokenize(vocab_, text.data(), length, tokens.data(),
                           static_cast<int32_t>(tokens.size()), true, true);
    }
    if (n <= 0) {
        throw std::runtime_error("Cannot tokenize prompt");
    }
    tokens.resize(static_cast<size_t>(n));
    return tokens;
}

std::string LlamaAdapter::piece(llama_token token) const {
    std::string out(32, '\0');
    int32_t n = llama_token_to_piece(vocab_, token, out.data(), static_cast<int32_t>(out.size()), 0, true);
    if (n < 0) {
        out.resize(static_cast<size_t>(-n));
        n = llama_token_to_piece(vocab_, token, out.data(), static_cast<int32_t>(out.size()), 0, true);
    }
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return out;
}

void LlamaAdapter::decode(llama_token* tokens, int32_t count) {
    int32_t status = llama_decode(ctx_.get(), llama_batch_get_one(tokens, count));
    if (status == 2 || cancelled_.load()) {
        throw std::runtime_error("Generation cancelled");
    }
    if (status != 0) {
        throw std::runtime_error("llama_decode failed with status " + std::to_string(status));
    }
}

std::string LlamaAdapter::generate(const std::string& prompt) {
    std::lock_guard<std::mutex> lock(generate_mutex_);
    if (cancelled_.load()) {
        throw std::runtime_error("Generation cancelled");
    }

    // Plan and refine prompts are independent; start each from an empty memory
    llama_memory_clear(llama_get_memory(ctx_.get()), true);
    llama_sampler_reset(sampler_.get());

    std::vector<llama_token> tokens = tokenize(prompt);
    if (static_cast<int64_t>(tokens.size()) + config_.n_predict > config_.n_ctx) {
        throw std::runtime_error("Prompt of " + std::to_string(tokens.size()) + " tokens leaves no room for " +
                                 std::to_string(config_.n_predict) + " new tokens in a " +
                                 std::to_string(config_.n_ctx) + "-token context");
    }
    decode(tokens.data(), static_cast<int32_t>(tokens.size()));

    std::string response;
    for (int produced = 0; produced < config_.n_predict; ++produced) {
        llama_token next = llama_sampler_sample(sampler_.get(), ctx_.get(), -1);
        if (llama_vocab_is_eog(vocab_, next)) {
            break;
        }
        response += piece(next);
        decode(&next, 1);
    }
    return response;
}

} // namespace abstractchain
