/**
 * @file llama_backend.cpp
 * @brief llama.cpp backend implementation
 */

#include "dailyd/llm/llama_backend.h"
#include "dailyd/common.h"
#include "dailyd/logger.h"
#include <llama.h>
#include <algorithm>
#include <chrono>
#include <fstream>

namespace dailyd {

namespace {

void batch_add_token(llama_batch& batch, llama_token token, int pos, bool logits) {
    batch.token[batch.n_tokens] = token;
    batch.pos[batch.n_tokens] = pos;
    batch.n_seq_id[batch.n_tokens] = 1;
    batch.seq_id[batch.n_tokens][0] = 0;
    batch.logits[batch.n_tokens] = logits ? 1 : 0;
    batch.n_tokens++;
}

// Owns a llama_batch for the duration of one generation
class BatchGuard {
public:
    explicit BatchGuard(int capacity) : batch_(llama_batch_init(capacity, 0, 1)) {}
    ~BatchGuard() { llama_batch_free(batch_); }
    BatchGuard(const BatchGuard&) = delete;
    BatchGuard& operator=(const BatchGuard&) = delete;
    llama_batch& get() { return batch_; }
private:
    llama_batch batch_;
};

// Owns a sampler chain
class SamplerGuard {
public:
    SamplerGuard(float temperature, float top_p)
        : chain_(llama_sampler_chain_init(llama_sampler_chain_default_params())) {
        if (temperature <= 0.0f) {
            llama_sampler_chain_add(chain_, llama_sampler_init_greedy());
        } else {
            llama_sampler_chain_add(chain_, llama_sampler_init_top_p(top_p, 1));
            llama_sampler_chain_add(chain_, llama_sampler_init_temp(temperature));
            llama_sampler_chain_add(chain_, llama_sampler_init_dist(LLAMA_DEFAULT_SEED));
        }
    }
    ~SamplerGuard() { llama_sampler_free(chain_); }
    SamplerGuard(const SamplerGuard&) = delete;
    SamplerGuard& operator=(const SamplerGuard&) = delete;
    llama_sampler* get() { return chain_; }
private:
    llama_sampler* chain_;
};

bool is_cancelled(const GeneratorOptions& options) {
    return options.cancelled && options.cancelled->load();
}

} // namespace

LlamaBackend::LlamaBackend() {
    llama_backend_init();
    LOG_DEBUG("LlamaBackend", "llama.cpp backend initialized");
}

LlamaBackend::~LlamaBackend() {
    unload();
    llama_backend_free();
}

bool LlamaBackend::load(const std::string& path, int n_ctx, int n_threads) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (model_) {
        unload_internal();
    }

    LOG_INFO("LlamaBackend", "Loading model: " + path);

    llama_model_params model_params = llama_model_default_params();
    model_params.use_mmap = true;

    model_ = llama_model_load_from_file(path.c_str(), model_params);
    if (!model_) {
        LOG_ERROR("LlamaBackend", "Failed to load model from " + path);
        return false;
    }

    vocab_ = llama_model_get_vocab(model_);

    llama_context_params ctx_params = llama_context_default_params();
    ctx_params.n_ctx = n_ctx;
    ctx_params.n_threads = n_threads;
    ctx_params.n_threads_batch = n_threads;

    ctx_ = llama_init_from_model(model_, ctx_params);
    if (!ctx_) {
        LOG_ERROR("LlamaBackend", "Failed to create context from model");
        llama_model_free(model_);
        model_ = nullptr;
        vocab_ = nullptr;
        return false;
    }

    model_path_ = path;
    n_ctx_ = n_ctx;

    LOG_INFO("LlamaBackend", "Model loaded (n_ctx=" + std::to_string(n_ctx) + ")");
    return true;
}

void LlamaBackend::unload() {
    std::lock_guard<std::mutex> lock(mutex_);
    unload_internal();
}

void LlamaBackend::unload_internal() {
    if (ctx_) {
        llama_free(ctx_);
        ctx_ = nullptr;
    }
    if (model_) {
        llama_model_free(model_);
        model_ = nullptr;
    }
    vocab_ = nullptr;
    model_path_.clear();
}

bool LlamaBackend::is_loaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return model_ != nullptr && ctx_ != nullptr;
}

GeneratorReply LlamaBackend::generate(const std::string& prompt, const GeneratorOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!model_ || !ctx_ || !vocab_) {
        return GeneratorReply::failure(GeneratorStatus::UNREACHABLE, "model not loaded");
    }
    if (prompt.empty()) {
        return GeneratorReply::failure(GeneratorStatus::REJECTED, "prompt cannot be empty");
    }
    if (prompt.size() > MAX_PROMPT_SIZE) {
        return GeneratorReply::failure(GeneratorStatus::REJECTED, "prompt exceeds maximum size");
    }
    // Another request held the model past its caller's timeout
    if (is_cancelled(options)) {
        return GeneratorReply::failure(GeneratorStatus::TIMEOUT, "cancelled before start");
    }

    auto start_time = std::chrono::steady_clock::now();

    std::vector<llama_token> tokens = tokenize(prompt, true);
    if (tokens.empty()) {
        return GeneratorReply::failure(GeneratorStatus::REJECTED, "tokenization failed");
    }
    if (static_cast<int>(tokens.size()) >= n_ctx_) {
        return GeneratorReply::failure(GeneratorStatus::REJECTED, "prompt too long for context");
    }

    llama_memory_clear(llama_get_memory(ctx_), true);

    BatchGuard batch(std::max(static_cast<int>(tokens.size()), 32));
    for (size_t i = 0; i < tokens.size(); i++) {
        batch_add_token(batch.get(), tokens[i], static_cast<int>(i), i == tokens.size() - 1);
    }

    if (llama_decode(ctx_, batch.get()) != 0) {
        return GeneratorReply::failure(GeneratorStatus::TRANSIENT, "failed to process prompt");
    }

    SamplerGuard sampler(options.temperature, options.top_p);

    std::string output;
    int n_cur = static_cast<int>(tokens.size());
    int max_tokens = std::min(options.max_tokens, n_ctx_ - n_cur);
    int generated = 0;

    for (int i = 0; i < max_tokens; i++) {
        if (is_cancelled(options)) {
            LOG_DEBUG("LlamaBackend", "Generation cancelled after " + std::to_string(generated) + " tokens");
            return GeneratorReply::failure(GeneratorStatus::TIMEOUT, "cancelled");
        }

        llama_token new_token = llama_sampler_sample(sampler.get(), ctx_, -1);
        if (llama_vocab_is_eog(vocab_, new_token)) {
            break;
        }

        output += token_to_piece(new_token);
        generated++;

        batch.get().n_tokens = 0;
        batch_add_token(batch.get(), new_token, n_cur, true);
        n_cur++;

        if (llama_decode(ctx_, batch.get()) != 0) {
            LOG_WARN("LlamaBackend", "Decode failed at token " + std::to_string(i));
            return GeneratorReply::failure(GeneratorStatus::TRANSIENT, "decode failed");
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    LOG_DEBUG("LlamaBackend", "Generated " + std::to_string(generated) + " tokens in " +
              std::to_string(elapsed.count()) + "ms");

    return GeneratorReply::success(std::move(output));
}

std::vector<llama_token> LlamaBackend::tokenize(const std::string& text, bool add_bos) {
    std::vector<llama_token> tokens(text.size() + 16);
    int n = llama_tokenize(vocab_, text.c_str(), static_cast<int32_t>(text.size()),
                           tokens.data(), static_cast<int32_t>(tokens.size()), add_bos, false);
    if (n < 0) {
        tokens.resize(-n);
        n = llama_tokenize(vocab_, text.c_str(), static_cast<int32_t>(text.size()),
                           tokens.data(), static_cast<int32_t>(tokens.size()), add_bos, false);
    }

    if (n >= 0) {
        tokens.resize(n);
    } else {
        tokens.clear();
    }
    return tokens;
}

std::string LlamaBackend::token_to_piece(llama_token token) const {
    char buf[256];
    int n = llama_token_to_piece(vocab_, token, buf, sizeof(buf), 0, false);
    if (n < 0) {
        return "";
    }
    return std::string(buf, n);
}

// ---------------------------------------------------------------------------

LlamaGenerator::LlamaGenerator(std::string model_path, int context_length, int threads, bool lazy_load)
    : model_path_(expand_path(model_path)),
      context_length_(context_length),
      threads_(threads) {
    if (!lazy_load && !model_path_.empty()) {
        ensure_loaded();
    }
}

bool LlamaGenerator::ensure_loaded() {
    std::lock_guard<std::mutex> lock(load_mutex_);
    if (backend_.is_loaded()) {
        return true;
    }
    if (model_path_.empty()) {
        return false;
    }
    std::ifstream file(model_path_);
    if (!file.good()) {
        LOG_WARN("LlamaGenerator", "Model file not found: " + model_path_);
        return false;
    }
    return backend_.load(model_path_, context_length_, threads_);
}

bool LlamaGenerator::is_available() const {
    if (backend_.is_loaded()) {
        return true;
    }
    if (model_path_.empty()) {
        return false;
    }
    std::ifstream file(model_path_);
    return file.good();
}

GeneratorReply LlamaGenerator::generate(const std::string& prompt,
                                        const GenerationConstraints& /*constraints*/,
                                        const GeneratorOptions& options) {
    if (!ensure_loaded()) {
        return GeneratorReply::failure(GeneratorStatus::UNREACHABLE,
                                       model_path_.empty() ? "no model configured"
                                                           : "model could not be loaded");
    }
    return backend_.generate(prompt, options);
}

} // namespace dailyd
