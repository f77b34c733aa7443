#include "translator_llama.hpp"

#include "block_json.hpp"

#include <llama.h>

#include <algorithm>
#include <cstdio>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace comic_mt {
namespace {

std::once_flag g_backend_once;

void llama_log_quiet(enum ggml_log_level level, const char* text, void* /*user_data*/) {
    if (level == GGML_LOG_LEVEL_ERROR && text != nullptr) {
        std::fputs(text, stderr);
    }
}

void initialize_backend_once() {
    std::call_once(g_backend_once, []() {
        llama_log_set(llama_log_quiet, nullptr);
        ggml_backend_load_all();
        llama_backend_init();
    });
}

}  // namespace

std::string build_translation_prompt(
    const std::string& blocks_json,
    const LanguagePair& languages,
    const std::string& extra_context
) {
    std::string prompt;
    prompt += "You are an expert translator who translates " + languages.source + " to " + languages.target + ".\n";
    prompt += "The text comes from comic speech bubbles and captions, in reading order.\n";
    prompt += "Translate every value of the JSON object below. Keep every key exactly as given.\n";
    prompt += "Output the JSON object only. Do not explain.\n";
    if (!extra_context.empty()) {
        prompt += "\nContext: " + extra_context + "\n";
    }
    prompt += "\n" + blocks_json + "\n\n" + languages.target + " JSON:\n";
    return prompt;
}

struct LlamaTranslator::SharedModel {
    explicit SharedModel(const TranslatorSettings& config) {
        initialize_backend_once();

        llama_model_params params = llama_model_default_params();
        params.n_gpu_layers = config.n_gpu_layers;
        params.main_gpu = 0;
        params.use_mmap = true;

        model = llama_model_load_from_file(config.model_path.c_str(), params);
        if (model == nullptr) {
            throw std::runtime_error("llama_model_load_from_file failed for: " + config.model_path);
        }

        vocab = llama_model_get_vocab(model);
        if (vocab == nullptr) {
            llama_model_free(model);
            throw std::runtime_error("llama_model_get_vocab returned null");
        }
    }

    ~SharedModel() {
        if (model != nullptr) {
            llama_model_free(model);
        }
    }

    llama_model* model = nullptr;
    const llama_vocab* vocab = nullptr;
};

LlamaTranslator::LlamaTranslator(TranslatorSettings config)
    : config_(std::move(config)) {
    if (config_.model_path.empty()) {
        throw std::invalid_argument("llama translator needs --model");
    }
    shared_model_ = std::make_shared<SharedModel>(config_);
}

LlamaTranslator::~LlamaTranslator() {
    if (sampler_ != nullptr) {
        llama_sampler_free(sampler_);
        sampler_ = nullptr;
    }

    if (ctx_ != nullptr) {
        llama_free(ctx_);
        ctx_ = nullptr;
    }
}

void LlamaTranslator::ensure_context_ready() {
    if (ctx_ != nullptr && sampler_ != nullptr) {
        return;
    }

    llama_context_params params = llama_context_default_params();
    params.n_ctx = static_cast<uint32_t>(std::max(512, config_.n_ctx));
    params.n_batch = params.n_ctx;
    params.n_ubatch = params.n_ctx;
    params.n_threads = std::max(1, config_.n_threads);
    params.n_threads_batch = std::max(1, config_.n_threads);
    params.offload_kqv = true;
    params.flash_attn_type = LLAMA_FLASH_ATTN_TYPE_AUTO;
    params.no_perf = true;

    ctx_ = llama_init_from_model(shared_model_->model, params);
    if (ctx_ == nullptr) {
        throw std::runtime_error("llama_init_from_model failed");
    }

    auto sparams = llama_sampler_chain_default_params();
    sparams.no_perf = true;
    sampler_ = llama_sampler_chain_init(sparams);
    if (sampler_ == nullptr) {
        throw std::runtime_error("llama_sampler_chain_init failed");
    }

    llama_sampler_chain_add(sampler_, llama_sampler_init_greedy());
}

std::vector<int32_t> LlamaTranslator::tokenize(const std::string& text, bool add_special, bool parse_special) const {
    const int32_t required = -llama_tokenize(
        shared_model_->vocab,
        text.c_str(),
        static_cast<int32_t>(text.size()),
        nullptr,
        0,
        add_special,
        parse_special
    );

    if (required <= 0) {
        throw std::runtime_error("llama_tokenize failed while querying required token count");
    }

    std::vector<llama_token> tokens(static_cast<std::size_t>(required));
    const int32_t written = llama_tokenize(
        shared_model_->vocab,
        text.c_str(),
        static_cast<int32_t>(text.size()),
        tokens.data(),
        static_cast<int32_t>(tokens.size()),
        add_special,
        parse_special
    );

    if (written < 0) {
        throw std::runtime_error("llama_tokenize failed while writing tokens");
    }

    tokens.resize(static_cast<std::size_t>(written));
    return std::vector<int32_t>(tokens.begin(), tokens.end());
}

std::string LlamaTranslator::token_to_piece(int32_t token) const {
    char local[256];
    const int first = llama_token_to_piece(
        shared_model_->vocab,
        static_cast<llama_token>(token),
        local,
        static_cast<int32_t>(sizeof(local)),
        0,
        true
    );

    if (first >= 0) {
        return std::string(local, static_cast<std::size_t>(first));
    }

    std::vector<char> dynamic(static_cast<std::size_t>(-first));
    const int second = llama_token_to_piece(
        shared_model_->vocab,
        static_cast<llama_token>(token),
        dynamic.data(),
        static_cast<int32_t>(dynamic.size()),
        0,
        true
    );

    if (second < 0) {
        throw std::runtime_error("llama_token_to_piece failed");
    }

    return std::string(dynamic.data(), static_cast<std::size_t>(second));
}

// Stops once the first JSON object in the output is closed.
bool LlamaTranslator::has_early_stop_marker(const std::string& generated) const {
    int depth = 0;
    bool in_string = false;
    bool escaped = false;
    bool opened = false;

    for (const char c : generated) {
        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }

        if (c == '"') {
            in_string = true;
        } else if (c == '{') {
            ++depth;
            opened = true;
        } else if (c == '}' && depth > 0) {
            --depth;
            if (opened && depth == 0) {
                return true;
            }
        }
    }
    return false;
}

std::string LlamaTranslator::generate(const std::string& prompt) {
    ensure_context_ready();

    llama_memory_clear(llama_get_memory(ctx_), true);
    llama_sampler_reset(sampler_);

    const std::vector<int32_t> prompt_tokens_i32 = tokenize(prompt, true, true);
    if (prompt_tokens_i32.empty()) {
        throw std::runtime_error("Prompt tokenization produced no tokens");
    }

    std::vector<llama_token> prompt_tokens(prompt_tokens_i32.begin(), prompt_tokens_i32.end());
    const int max_tokens = std::max(1, config_.max_tokens);

    const uint32_t n_ctx_actual = llama_n_ctx(ctx_);
    if (prompt_tokens.size() + static_cast<std::size_t>(max_tokens) >= n_ctx_actual) {
        throw std::runtime_error(
            "Prompt too long for context window (prompt_tokens=" + std::to_string(prompt_tokens.size()) +
            ", n_ctx=" + std::to_string(n_ctx_actual) + ")"
        );
    }

    std::string generated;

    if (llama_model_has_encoder(shared_model_->model)) {
        llama_batch enc_batch = llama_batch_get_one(prompt_tokens.data(), static_cast<int32_t>(prompt_tokens.size()));
        if (llama_encode(ctx_, enc_batch) != 0) {
            throw std::runtime_error("llama_encode failed");
        }

        llama_token decoder_start = llama_model_decoder_start_token(shared_model_->model);
        if (decoder_start == LLAMA_TOKEN_NULL) {
            decoder_start = llama_vocab_bos(shared_model_->vocab);
        }

        llama_batch dec_batch = llama_batch_get_one(&decoder_start, 1);
        llama_token tok = decoder_start;

        for (int i = 0; i < max_tokens; ++i) {
            if (llama_decode(ctx_, dec_batch) != 0) {
                throw std::runtime_error("llama_decode failed during encoder-decoder generation");
            }

            tok = llama_sampler_sample(sampler_, ctx_, -1);
            if (llama_vocab_is_eog(shared_model_->vocab, tok)) {
                break;
            }

            generated += token_to_piece(tok);
            if (has_early_stop_marker(generated)) {
                break;
            }
            dec_batch = llama_batch_get_one(&tok, 1);
        }

        return generated;
    }

    llama_batch batch = llama_batch_get_one(prompt_tokens.data(), static_cast<int32_t>(prompt_tokens.size()));
    if (llama_decode(ctx_, batch) != 0) {
        throw std::runtime_error("llama_decode failed for prompt");
    }

    for (int i = 0; i < max_tokens; ++i) {
        llama_token tok = llama_sampler_sample(sampler_, ctx_, -1);
        if (llama_vocab_is_eog(shared_model_->vocab, tok)) {
            break;
        }

        generated += token_to_piece(tok);
        if (has_early_stop_marker(generated)) {
            break;
        }

        if (i + 1 >= max_tokens) {
            break;
        }

        batch = llama_batch_get_one(&tok, 1);
        if (llama_decode(ctx_, batch) != 0) {
            throw std::runtime_error("llama_decode failed for continuation token");
        }
    }

    return generated;
}

std::vector<TextBlock> LlamaTranslator::translate(
    std::vector<TextBlock> blocks,
    const LanguagePair& languages,
    const cv::Mat& /*context_image*/,
    const std::string& extra_context
) {
    if (blocks.empty()) {
        return blocks;
    }

    const std::string prompt = build_translation_prompt(
        dump_block_texts(blocks, BlockField::Text),
        languages,
        extra_context
    );

    const std::string output = generate(prompt);
    set_translations_from_json(blocks, extract_json_object(output));
    return blocks;
}

}  // namespace comic_mt
