#pragma once

#include "settings.hpp"
#include "translator.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct llama_model;
struct llama_context;
struct llama_sampler;
struct llama_vocab;

namespace comic_mt {

// Local GGUF model through llama.cpp. The whole batch goes out as one JSON
// object and comes back as one JSON object keyed the same way.
class LlamaTranslator final : public Translator {
public:
    explicit LlamaTranslator(TranslatorSettings config);
    ~LlamaTranslator() override;

    LlamaTranslator(const LlamaTranslator&) = delete;
    LlamaTranslator& operator=(const LlamaTranslator&) = delete;

    std::vector<TextBlock> translate(
        std::vector<TextBlock> blocks,
        const LanguagePair& languages,
        const cv::Mat& context_image,
        const std::string& extra_context
    ) override;

private:
    struct SharedModel;

    std::string generate(const std::string& prompt);
    bool has_early_stop_marker(const std::string& generated) const;

    std::vector<int32_t> tokenize(const std::string& text, bool add_special, bool parse_special) const;
    std::string token_to_piece(int32_t token) const;

    void ensure_context_ready();

    TranslatorSettings config_;
    std::shared_ptr<SharedModel> shared_model_;

    llama_context* ctx_ = nullptr;
    llama_sampler* sampler_ = nullptr;
};

// Prompt sent for one batch; exposed for tests.
std::string build_translation_prompt(
    const std::string& blocks_json,
    const LanguagePair& languages,
    const std::string& extra_context
);

}  // namespace comic_mt
