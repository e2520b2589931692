#include "maestro/completion/llama_completion_service.hpp"

#include <llama.h>

#include <climits>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace maestro {
namespace completion {

namespace {

std::once_flag g_init_flag;

// Accepts exactly one JSON object, optionally surrounded by whitespace.
constexpr const char* kJsonObjectGrammar = R"GBNF(
root   ::= ws object ws
value  ::= object | array | string | number | ("true" | "false" | "null")
object ::= "{" ws ( string ws ":" ws value ws ( "," ws string ws ":" ws value ws )* )? "}"
array  ::= "[" ws ( value ws ( "," ws value ws )* )? "]"
string ::= "\"" ( [^"\\\x7F\x00-\x1F] | "\\" ( ["\\/bfnrt] | "u" [0-9a-fA-F]{4} ) )* "\""
number ::= ("-"? ([0-9] | [1-9] [0-9]*)) ("." [0-9]+)? ([eE] [-+]? [0-9]+)?
ws     ::= [ \t\n]*
)GBNF";

void initialize_global() {
    std::call_once(g_init_flag, []() {
        llama_log_set([](enum ggml_log_level level, const char* text, void*) {
            if (level >= GGML_LOG_LEVEL_WARN) {
                fprintf(stderr, "%s", text);
            }
        }, nullptr);
        llama_backend_init();
        ggml_backend_load_all();
    });
}

} // namespace

Expected<std::shared_ptr<LlamaCompletionService>> LlamaCompletionService::create(const LlamaConfig& config) {
    std::shared_ptr<LlamaCompletionService> service(new LlamaCompletionService());
    auto initialized = service->initialize(config);
    if (!initialized) {
        return tl::unexpected(initialized.error());
    }
    return service;
}

LlamaCompletionService::~LlamaCompletionService() {
    if (text_sampler_ != nullptr) {
        llama_sampler_free(text_sampler_);
    }
    if (ctx_ != nullptr) {
        llama_free(ctx_);
    }
    if (model_ != nullptr) {
        llama_model_free(model_);
    }
}

Expected<void> LlamaCompletionService::initialize(const LlamaConfig& config) {
    auto validation = config.validate();
    if (!validation) {
        return tl::unexpected(validation.error());
    }
    config_ = config;
    initialize_global();

    auto model_params = llama_model_default_params();
    model_params.n_gpu_layers = config.n_gpu_layers;
    model_params.use_mmap = config.use_mmap;

    model_ = llama_model_load_from_file(config.model_path.c_str(), model_params);
    if (model_ == nullptr) {
        return tl::unexpected(Error{ErrorCode::ModelLoadFailed, "Failed to load model from path: " + config.model_path});
    }

    auto ctx_params = llama_context_default_params();
    ctx_params.n_ctx = static_cast<uint32_t>(config.context_size);
    ctx_params.n_batch = 512;
    ctx_params.n_threads = -1;
    ctx_params.n_threads_batch = -1;

    ctx_ = llama_init_from_model(model_, ctx_params);
    if (ctx_ == nullptr) {
        return tl::unexpected(Error{ErrorCode::ContextCreationFailed, "Failed to create llama context"});
    }
    context_size_ = static_cast<int>(llama_n_ctx(ctx_));

    vocab_ = llama_model_get_vocab(model_);
    if (vocab_ == nullptr) {
        return tl::unexpected(Error{ErrorCode::BackendInitFailed, "Failed to get model vocabulary"});
    }

    text_sampler_ = create_sampling_chain();
    if (text_sampler_ == nullptr) {
        return tl::unexpected(Error{ErrorCode::BackendInitFailed, "Failed to create sampler chain"});
    }

    // Null when the model has no embedded template; llama.cpp then uses ChatML.
    tmpl_ = llama_model_chat_template(model_, nullptr);
    formatted_.resize(static_cast<size_t>(context_size_) * 4);
    return {};
}

Expected<CompletionResult> LlamaCompletionService::complete(const CompletionRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);

    llama_memory_clear(llama_get_memory(ctx_), false);

    auto prompt = format_prompt(request.messages);
    if (!prompt) {
        return tl::unexpected(prompt.error());
    }
    auto tokens = tokenize(*prompt);
    if (!tokens) {
        return tl::unexpected(tokens.error());
    }

    llama_sampler* sampler = text_sampler_;
    llama_sampler* json_sampler = nullptr;
    if (request.format == ResponseFormat::Json) {
        json_sampler = create_json_sampler();
        if (json_sampler == nullptr) {
            return tl::unexpected(Error{ErrorCode::CompletionFailed, "Failed to create JSON grammar sampler"});
        }
        sampler = json_sampler;
    } else {
        llama_sampler_reset(text_sampler_);
    }

    auto text = generate(*tokens, request.max_tokens, sampler);
    if (json_sampler != nullptr) {
        llama_sampler_free(json_sampler);
    }
    if (!text) {
        return tl::unexpected(text.error());
    }

    CompletionResult result;
    result.content = std::move(*text);
    result.prompt_tokens = static_cast<int>(tokens->size());
    result.completion_tokens = llama_memory_seq_pos_max(llama_get_memory(ctx_), 0) + 1 - result.prompt_tokens;
    return result;
}

Expected<std::string> LlamaCompletionService::format_prompt(const std::vector<Message>& messages) {
    std::vector<llama_chat_message> llama_msgs;
    llama_msgs.reserve(messages.size());
    for (const auto& msg : messages) {
        llama_msgs.push_back({role_to_string(msg.role), msg.content.c_str()});
    }

    int len = llama_chat_apply_template(tmpl_, llama_msgs.data(), llama_msgs.size(),
                                        true, formatted_.data(), static_cast<int32_t>(formatted_.size()));
    if (len > static_cast<int>(formatted_.size())) {
        formatted_.resize(static_cast<size_t>(len));
        len = llama_chat_apply_template(tmpl_, llama_msgs.data(), llama_msgs.size(),
                                        true, formatted_.data(), static_cast<int32_t>(formatted_.size()));
    }
    if (len < 0) {
        return tl::unexpected(Error{ErrorCode::InvalidTemplate, "llama_chat_apply_template failed"});
    }
    return std::string(formatted_.begin(), formatted_.begin() + len);
}

Expected<std::vector<int>> LlamaCompletionService::tokenize(const std::string& text) {
    static_assert(sizeof(int) == sizeof(llama_token), "int must match llama_token size");

    const int32_t raw = llama_tokenize(vocab_, text.c_str(), static_cast<int32_t>(text.length()), nullptr, 0, true, true);
    if (raw == INT32_MIN) {
        return tl::unexpected(Error{ErrorCode::TokenizationFailed, "Tokenization overflow (input too large)"});
    }
    const int count = raw < 0 ? -raw : raw;
    if (count > context_size_) {
        return tl::unexpected(Error{ErrorCode::ContextWindowExceeded, "Prompt exceeds context size",
                                    "tokens=" + std::to_string(count) + " context_size=" + std::to_string(context_size_)});
    }

    std::vector<int> tokens(static_cast<size_t>(count));
    if (count > 0 && llama_tokenize(vocab_, text.c_str(), static_cast<int32_t>(text.length()),
                                    reinterpret_cast<llama_token*>(tokens.data()),
                                    static_cast<int32_t>(tokens.size()), true, true) < 0) {
        return tl::unexpected(Error{ErrorCode::TokenizationFailed, "Tokenization failed"});
    }
    return tokens;
}

Expected<std::string> LlamaCompletionService::generate(const std::vector<int>& prompt_tokens,
                                                       int max_tokens,
                                                       llama_sampler* sampler) {
    std::string generated;
    generated.reserve(max_tokens > 0 ? static_cast<size_t>(max_tokens) * 8 : 4096);

    // llama_decode only reads the token buffer.
    llama_batch batch = llama_batch_get_one(
        const_cast<llama_token*>(reinterpret_cast<const llama_token*>(prompt_tokens.data())),
        static_cast<int32_t>(prompt_tokens.size()));
    llama_token token;
    int count = 0;

    while (true) {
        const int used = llama_memory_seq_pos_max(llama_get_memory(ctx_), 0) + 1;
        if (used + batch.n_tokens > context_size_) {
            return tl::unexpected(Error{ErrorCode::ContextWindowExceeded, "Generation exceeded context size"});
        }
        if (llama_decode(ctx_, batch) != 0) {
            return tl::unexpected(Error{ErrorCode::CompletionFailed, "Failed to decode batch"});
        }

        token = llama_sampler_sample(sampler, ctx_, -1);
        if (llama_vocab_is_eog(vocab_, token)) {
            break;
        }

        char piece[256];
        const int n = llama_token_to_piece(vocab_, token, piece, sizeof(piece), 0, true);
        if (n < 0) {
            return tl::unexpected(Error{ErrorCode::CompletionFailed, "Failed to convert token to piece"});
        }
        generated.append(piece, static_cast<size_t>(n));

        if (max_tokens > 0 && ++count >= max_tokens) {
            break;
        }
        batch = llama_batch_get_one(&token, 1);
    }
    return generated;
}

llama_sampler* LlamaCompletionService::create_sampling_chain() const {
    llama_sampler* chain = llama_sampler_chain_init(llama_sampler_chain_default_params());
    if (chain == nullptr) {
        return nullptr;
    }

    const auto& sp = config_.sampling;
    if (sp.repeat_penalty != 1.0f) {
        llama_sampler_chain_add(chain, llama_sampler_init_penalties(sp.repeat_last_n, sp.repeat_penalty, 0.0f, 0.0f));
    }
    if (sp.top_k > 0) {
        llama_sampler_chain_add(chain, llama_sampler_init_top_k(sp.top_k));
    }
    if (sp.top_p < 1.0f) {
        llama_sampler_chain_add(chain, llama_sampler_init_top_p(sp.top_p, 1));
    }
    if (sp.temperature > 0.0f) {
        llama_sampler_chain_add(chain, llama_sampler_init_temp(sp.temperature));
        const uint32_t seed = sp.seed < 0 ? static_cast<uint32_t>(time(nullptr)) : static_cast<uint32_t>(sp.seed);
        llama_sampler_chain_add(chain, llama_sampler_init_dist(seed));
    } else {
        llama_sampler_chain_add(chain, llama_sampler_init_greedy());
    }
    return chain;
}

llama_sampler* LlamaCompletionService::create_json_sampler() const {
    llama_sampler* grammar = llama_sampler_init_grammar(vocab_, kJsonObjectGrammar, "root");
    if (grammar == nullptr) {
        return nullptr;
    }
    llama_sampler* chain = llama_sampler_chain_init(llama_sampler_chain_default_params());
    if (chain == nullptr) {
        llama_sampler_free(grammar);
        return nullptr;
    }
    llama_sampler_chain_add(chain, grammar);
    llama_sampler_chain_add(chain, llama_sampler_init_greedy());
    return chain;
}

} // namespace completion
} // namespace maestro
