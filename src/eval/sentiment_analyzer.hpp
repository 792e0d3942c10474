#pragma once

#include "core/config.hpp"
#include "eval/condition_evaluator.hpp"
#include "market/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace vigil {

/// Lower-case ASCII and Cyrillic letters in a UTF-8 string; other bytes pass through
[[nodiscard]] std::string to_lower_utf8(std::string_view text);

/// Keyword-polarity sentiment scorer for news articles
class SentimentAnalyzer {
public:
    /// Analyzer with the built-in English and Russian keyword lists
    SentimentAnalyzer();

    /// @param negative_keywords Terms that subtract `weight` each
    /// @param positive_keywords Terms that add `weight` each
    /// @param weight Per-keyword contribution
    SentimentAnalyzer(
        std::vector<std::string> negative_keywords,
        std::vector<std::string> positive_keywords,
        double weight = kKeywordWeight
    );

    /// Build from config, falling back to built-in lists where the config has none
    [[nodiscard]] static SentimentAnalyzer from_config(const Config::Sentiment& config);

    /// Score one article in [-1, 1]
    /// Case-insensitive substring match over title + summary; each keyword counts once
    [[nodiscard]] double score_article(const NewsItem& article) const;

    /// Average of per-article scores, 0 for no articles
    [[nodiscard]] double average_sentiment(const std::vector<NewsItem>& articles) const;

    [[nodiscard]] static const std::vector<std::string>& default_negative_keywords();
    [[nodiscard]] static const std::vector<std::string>& default_positive_keywords();

private:
    std::vector<std::string> negative_;
    std::vector<std::string> positive_;
    double weight_;
};

/// Evaluate a NEWS_TRIGGERED alert: fires when at least one article exists and
/// the averaged sentiment is below the threshold
[[nodiscard]] EvaluationResult evaluate_news_trigger(
    const NewsContext* news,
    double threshold = kNewsTriggerThreshold
);

}  // namespace vigil
