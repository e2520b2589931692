#pragma once

#include "completion_service.hpp"
#include "../types.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Forward declarations for llama.cpp types
struct llama_model;
struct llama_context;
struct llama_sampler;
struct llama_vocab;
struct llama_chat_message;

namespace maestro {
namespace completion {

struct SamplingParams {
    float temperature = 0.7f;
    float top_p = 0.9f;
    int top_k = 40;
    float repeat_penalty = 1.1f;
    int repeat_last_n = 64;
    int seed = -1;   ///< -1 for a time-based seed
};

struct LlamaConfig {
    std::string model_path;
    int context_size = 8192;
    int n_gpu_layers = -1;   ///< -1 offloads every layer
    bool use_mmap = true;
    SamplingParams sampling;

    Expected<void> validate() const {
        if (model_path.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidModelPath, "Model path cannot be empty"});
        }
        if (context_size <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Context size must be positive"});
        }
        return {};
    }
};

/**
 * @brief Completion service running a local GGUF model through llama.cpp.
 *
 * Each complete() call is independent: the KV cache is cleared, the
 * messages are rendered with the model's chat template and generation runs
 * until end-of-generation or `max_tokens`. Calls are serialized internally.
 *
 * Json requests are constrained by a GBNF grammar accepting one JSON object
 * and sampled greedily. Text requests use the configured sampling chain.
 */
class LlamaCompletionService : public ICompletionService {
public:
    static Expected<std::shared_ptr<LlamaCompletionService>> create(const LlamaConfig& config);

    ~LlamaCompletionService() override;

    LlamaCompletionService(const LlamaCompletionService&) = delete;
    LlamaCompletionService& operator=(const LlamaCompletionService&) = delete;

    Expected<CompletionResult> complete(const CompletionRequest& request) override;

    int context_size() const {
        return context_size_;
    }

private:
    LlamaCompletionService() = default;

    Expected<void> initialize(const LlamaConfig& config);
    Expected<std::string> format_prompt(const std::vector<Message>& messages);
    Expected<std::vector<int>> tokenize(const std::string& text);
    Expected<std::string> generate(const std::vector<int>& prompt_tokens, int max_tokens, llama_sampler* sampler);

    llama_sampler* create_sampling_chain() const;
    llama_sampler* create_json_sampler() const;

    LlamaConfig config_;
    llama_model* model_ = nullptr;
    llama_context* ctx_ = nullptr;
    llama_sampler* text_sampler_ = nullptr;
    const llama_vocab* vocab_ = nullptr;   // owned by model_
    const char* tmpl_ = nullptr;           // owned by model_, may be null

    int context_size_ = 0;
    std::vector<char> formatted_;
    std::mutex mutex_;
};

} // namespace completion
} // namespace maestro
