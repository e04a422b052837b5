#pragma once

#include "author_scorer.hpp"
#include "axis_scorer.hpp"
#include "cache.hpp"
#include "reference_data.hpp"
#include "scoring.hpp"
#include <memory>
#include <optional>
#include <string>

// Engine entry point: axis scoring, reputation blend, truth and confidence,
// plus the author classification attached to the result
class ContentClassifier {
public:
    ContentClassifier(std::shared_ptr<ReferenceDataProvider> reference,
                      std::shared_ptr<ResultCache> cache = nullptr,
                      const ClassifierTuning& tuning = ClassifierTuning(),
                      const AxisTuning& axis_tuning = AxisTuning(),
                      const AuthorTuning& author_tuning = AuthorTuning());

    // source may be null; no author is attached
    ClassificationResult classify_content(const std::string& text, const SourceEntry* source);

    // Source and known-actor lookups, author attach, cache consult
    ClassificationResult classify(const std::string& text, const std::string& url,
                                  const std::optional<ExtractedAuthor>& author = std::nullopt);

    AuthorClassification classify_author(const ExtractedAuthor& author, const std::string& text);

    AxisScore score_axis(const std::string& text, Axis axis);

private:
    std::shared_ptr<ReferenceDataProvider> reference_;
    std::shared_ptr<ResultCache> cache_;
    ContentScorer scorer_;
    AxisScorer axis_scorer_;
    AuthorScorer author_scorer_;

    ReferenceDataProvider::TablesPtr tables();
};
