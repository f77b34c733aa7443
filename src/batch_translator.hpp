#pragma once

#include "record.hpp"
#include "run_context.hpp"
#include "translator.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace comic_mt {

// [start, end) slice of a batch's combined block list that belongs to records[record].
struct BatchTranslationUnit {
    std::size_t start = 0;
    std::size_t end = 0;
    std::size_t record = 0;
};

// Lays the records' block lists end to end; units come back in record order.
std::vector<BatchTranslationUnit> plan_batch(
    const std::vector<ImageProcessingRecord>& records,
    std::vector<TextBlock>& combined
);

// Merges several pages' blocks into one translation request to amortize per-call cost.
// A failed call skips every page of that batch and nothing else.
class BatchTranslator {
public:
    BatchTranslator(Translator& translator, std::size_t batch_size, std::string extra_context);

    // False when the record's language pair differs from the pending batch's.
    bool accepts(const ImageProcessingRecord& record) const;

    void add(ImageProcessingRecord record);

    bool empty() const { return pending_.empty(); }
    bool full() const { return pending_.size() >= batch_size_; }
    std::size_t size() const { return pending_.size(); }

    // Translates and hands back the pending records (skipped on failure); the batch is
    // empty afterwards whatever the outcome.
    std::vector<ImageProcessingRecord> flush(RunContext& ctx);

    // Units of the most recent flush.
    const std::vector<BatchTranslationUnit>& last_units() const { return last_units_; }

private:
    Translator& translator_;
    std::size_t batch_size_ = 10;
    std::string extra_context_;
    std::vector<ImageProcessingRecord> pending_;
    std::vector<BatchTranslationUnit> last_units_;
};

}  // namespace comic_mt
