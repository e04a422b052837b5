#include "classifier.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

ContentClassifier::ContentClassifier(std::shared_ptr<ReferenceDataProvider> reference,
                                     std::shared_ptr<ResultCache> cache,
                                     const ClassifierTuning& tuning,
                                     const AxisTuning& axis_tuning,
                                     const AuthorTuning& author_tuning)
    : reference_(std::move(reference)),
      cache_(std::move(cache)),
      scorer_(tuning),
      axis_scorer_(axis_tuning),
      author_scorer_(author_tuning) {}

ReferenceDataProvider::TablesPtr ContentClassifier::tables() {
    try {
        return reference_->get();
    } catch (const std::exception& e) {
        spdlog::warn("Reference data unavailable, classifying without it: {}", e.what());
        return std::make_shared<const ReferenceTables>();
    }
}

AxisScore ContentClassifier::score_axis(const std::string& text, Axis axis) {
    return axis_scorer_.score_axis(util::normalize_text(text), tables()->keywords, axis);
}

ClassificationResult ContentClassifier::classify_content(const std::string& text,
                                                         const SourceEntry* source) {
    auto reference = tables();
    std::string normalized = util::normalize_text(text);

    ClassificationResult result;
    int total_matches = 0;

    for (auto axis : kAllAxes) {
        auto axis_score = axis_scorer_.score_axis(normalized, reference->keywords, axis);
        total_matches += axis_score.matches;

        int blended = scorer_.blend_axis(axis_score.score, source, axis);
        switch (axis) {
            case Axis::Economic:  result.economic = blended; break;
            case Axis::Social:    result.social = blended; break;
            case Axis::Authority: result.authority = blended; break;
            case Axis::Globalism: result.globalism = blended; break;
        }
    }

    result.truth_score = scorer_.estimate_truth(text, source);
    result.confidence = scorer_.estimate_confidence(total_matches, source != nullptr, text.size());
    result.source = ResultSource::Local;
    result.timestamp_ms = util::current_timestamp_ms();

    spdlog::debug("Classified {} chars: {} keyword matches, source {}", text.size(),
                  total_matches, source ? source->domain : "unknown");
    return result;
}

ClassificationResult ContentClassifier::classify(const std::string& text, const std::string& url,
                                                 const std::optional<ExtractedAuthor>& author) {
    std::optional<ClassificationResult> cached;
    if (cache_) {
        cached = cache_->get_classification(url);
    }

    if (cached && (!author || cached->author)) {
        spdlog::debug("Cache hit for {}", url);
        return *cached;
    }

    ClassificationResult result;
    if (cached) {
        result = *cached;
    } else {
        auto reference = tables();
        result = classify_content(text, reference->find_source_for_url(url));
    }

    if (author) {
        result.author = classify_author(*author, text);
    }

    if (cache_) {
        cache_->put_classification(url, result);
    }
    return result;
}

AuthorClassification ContentClassifier::classify_author(const ExtractedAuthor& author,
                                                        const std::string& text) {
    if (cache_) {
        if (auto cached = cache_->get_author(author)) {
            return *cached;
        }
    }

    auto reference = tables();
    const KnownActorEntry* known = reference->find_known_actor(author.platform, author.identifier);

    auto classification = author_scorer_.classify_author(author, text, known);

    if (cache_) {
        cache_->put_author(author, classification);
    }
    return classification;
}
