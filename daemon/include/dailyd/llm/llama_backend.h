/**
 * @file llama_backend.h
 * @brief llama.cpp backend and the generator built on it
 */

#pragma once

#include "dailyd/llm/generator.h"
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

// Forward declarations for llama.cpp types
struct llama_model;
struct llama_context;
struct llama_vocab;
typedef int32_t llama_token;

namespace dailyd {

/**
 * @brief Single loaded GGUF model with one context
 */
class LlamaBackend {
public:
    LlamaBackend();
    ~LlamaBackend();

    LlamaBackend(const LlamaBackend&) = delete;
    LlamaBackend& operator=(const LlamaBackend&) = delete;

    /**
     * @brief Load model from GGUF file
     * @param path Path to model file
     * @param n_ctx Context length
     * @param n_threads Number of threads
     * @return true if successful
     */
    bool load(const std::string& path, int n_ctx, int n_threads);

    void unload();

    bool is_loaded() const;

    /**
     * @brief Run one completion, stopping early when options.cancelled is set
     */
    GeneratorReply generate(const std::string& prompt, const GeneratorOptions& options);

    int context_length() const { return n_ctx_; }

private:
    llama_model* model_ = nullptr;
    llama_context* ctx_ = nullptr;
    const llama_vocab* vocab_ = nullptr;  // owned by model
    mutable std::mutex mutex_;

    std::string model_path_;
    int n_ctx_ = 0;

    std::vector<llama_token> tokenize(const std::string& text, bool add_bos);
    std::string token_to_piece(llama_token token) const;

    // Caller must hold mutex_
    void unload_internal();
};

/**
 * @brief IdeaGenerator backed by a local llama.cpp model
 *
 * With lazy loading the model is opened on the first call; a missing or
 * broken model file reports UNREACHABLE so callers fall back.
 */
class LlamaGenerator : public IdeaGenerator {
public:
    LlamaGenerator(std::string model_path, int context_length, int threads, bool lazy_load);

    GeneratorReply generate(const std::string& prompt,
                            const GenerationConstraints& constraints,
                            const GeneratorOptions& options) override;
    const char* name() const override { return "llama"; }
    bool is_available() const override;

    /**
     * @brief Load the model now
     * @return true if the model is ready
     */
    bool ensure_loaded();

private:
    std::string model_path_;
    int context_length_;
    int threads_;
    LlamaBackend backend_;
    std::mutex load_mutex_;
};

} // namespace dailyd
