#include "batch_translator.hpp"

#include <stdexcept>
#include <utility>

namespace comic_mt {

std::vector<BatchTranslationUnit> plan_batch(
    const std::vector<ImageProcessingRecord>& records,
    std::vector<TextBlock>& combined
) {
    combined.clear();

    std::vector<BatchTranslationUnit> units;
    units.reserve(records.size());

    for (std::size_t i = 0; i < records.size(); ++i) {
        const auto& blocks = records[i].blk_list;
        BatchTranslationUnit unit;
        unit.start = combined.size();
        combined.insert(combined.end(), blocks.begin(), blocks.end());
        unit.end = combined.size();
        unit.record = i;
        units.push_back(unit);
    }

    return units;
}

BatchTranslator::BatchTranslator(Translator& translator, std::size_t batch_size, std::string extra_context)
    : translator_(translator),
      batch_size_(batch_size == 0 ? 1 : batch_size),
      extra_context_(std::move(extra_context)) {}

bool BatchTranslator::accepts(const ImageProcessingRecord& record) const {
    return pending_.empty() || pending_.front().languages == record.languages;
}

void BatchTranslator::add(ImageProcessingRecord record) {
    if (!accepts(record)) {
        throw std::logic_error("language pair differs from the pending batch; flush first");
    }
    pending_.push_back(std::move(record));
}

std::vector<ImageProcessingRecord> BatchTranslator::flush(RunContext& ctx) {
    std::vector<ImageProcessingRecord> records;
    records.swap(pending_);

    std::vector<TextBlock> combined;
    last_units_ = plan_batch(records, combined);

    if (records.empty() || combined.empty()) {
        return records;
    }

    const ImageProcessingRecord& first = records.front();
    const std::size_t expected = combined.size();

    ++ctx.stats().translation_calls;
    auto translated = run_stage(kStageTranslator, [&] {
        auto out = translator_.translate(std::move(combined), first.languages, first.image, extra_context_);
        if (out.size() != expected) {
            throw std::runtime_error(
                "translator returned " + std::to_string(out.size()) + " blocks for " + std::to_string(expected)
            );
        }
        return out;
    });

    if (!translated) {
        for (auto& record : records) {
            mark_skipped(record, translated.error());
        }
        ctx.log("[error] batch translation failed: " + translated.error().message);
        return records;
    }

    const auto& blocks = translated.value();
    for (const auto& unit : last_units_) {
        auto& target = records[unit.record].blk_list;
        target.assign(
            blocks.begin() + static_cast<std::ptrdiff_t>(unit.start),
            blocks.begin() + static_cast<std::ptrdiff_t>(unit.end)
        );
    }

    return records;
}

}  // namespace comic_mt
