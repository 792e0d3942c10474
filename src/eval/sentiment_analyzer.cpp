#include "eval/sentiment_analyzer.hpp"
#include <algorithm>
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace vigil {

namespace {

std::vector<std::string> lowered(std::vector<std::string> keywords) {
    for (auto& keyword : keywords) {
        keyword = to_lower_utf8(keyword);
    }
    keywords.erase(std::remove(keywords.begin(), keywords.end(), std::string{}), keywords.end());
    return keywords;
}

}  // namespace

std::string to_lower_utf8(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);

        if (c >= 'A' && c <= 'Z') {
            out.push_back(static_cast<char>(c - 'A' + 'a'));
            continue;
        }

        // Cyrillic capitals live in U+0400..U+042F (lead byte 0xD0)
        if (c == 0xD0 && i + 1 < text.size()) {
            const auto next = static_cast<unsigned char>(text[i + 1]);
            if (next >= 0x80 && next <= 0x8F) {         // Ѐ..Џ -> ѐ..џ
                out.push_back(static_cast<char>(0xD1));
                out.push_back(static_cast<char>(next + 0x10));
                ++i;
                continue;
            }
            if (next >= 0x90 && next <= 0x9F) {         // А..П -> а..п
                out.push_back(static_cast<char>(0xD0));
                out.push_back(static_cast<char>(next + 0x20));
                ++i;
                continue;
            }
            if (next >= 0xA0 && next <= 0xAF) {         // Р..Я -> р..я
                out.push_back(static_cast<char>(0xD1));
                out.push_back(static_cast<char>(next - 0x20));
                ++i;
                continue;
            }
        }

        out.push_back(static_cast<char>(c));
    }

    return out;
}

SentimentAnalyzer::SentimentAnalyzer()
    : SentimentAnalyzer(default_negative_keywords(), default_positive_keywords())
{}

SentimentAnalyzer::SentimentAnalyzer(
    std::vector<std::string> negative_keywords,
    std::vector<std::string> positive_keywords,
    double weight
)
    : negative_(lowered(std::move(negative_keywords)))
    , positive_(lowered(std::move(positive_keywords)))
    , weight_(weight)
{}

SentimentAnalyzer SentimentAnalyzer::from_config(const Config::Sentiment& config) {
    return SentimentAnalyzer(
        config.negative_keywords.empty() ? default_negative_keywords() : config.negative_keywords,
        config.positive_keywords.empty() ? default_positive_keywords() : config.positive_keywords,
        config.keyword_weight
    );
}

double SentimentAnalyzer::score_article(const NewsItem& article) const {
    const std::string text = to_lower_utf8(article.title + " " + article.summary);

    double score = 0.0;
    for (const auto& keyword : negative_) {
        if (text.find(keyword) != std::string::npos) {
            score -= weight_;
        }
    }
    for (const auto& keyword : positive_) {
        if (text.find(keyword) != std::string::npos) {
            score += weight_;
        }
    }

    return std::clamp(score, -1.0, 1.0);
}

double SentimentAnalyzer::average_sentiment(const std::vector<NewsItem>& articles) const {
    if (articles.empty()) {
        return 0.0;
    }

    double sum = 0.0;
    for (const auto& article : articles) {
        sum += score_article(article);
    }
    return sum / static_cast<double>(articles.size());
}

const std::vector<std::string>& SentimentAnalyzer::default_negative_keywords() {
    static const std::vector<std::string> keywords{
        // Russian
        "падение", "снижение", "убыток", "кризис", "банкротство", "риск", "потери",
        "долг", "падают", "снижаются", "обвал", "дефолт", "санкции",
        // English
        "decline", "plunge", "loss", "crisis", "bankruptcy", "risk", "debt",
        "default", "sanction", "downgrade", "lawsuit", "selloff",
    };
    return keywords;
}

const std::vector<std::string>& SentimentAnalyzer::default_positive_keywords() {
    static const std::vector<std::string> keywords{
        // Russian
        "рост", "прибыль", "успех", "достижение", "увеличение", "дивиденд", "растут",
        "повышение", "расширение", "инновация", "лидер", "прорыв",
        // English
        "growth", "profit", "success", "record high", "dividend", "upgrade",
        "expansion", "innovation", "breakthrough", "outperform",
    };
    return keywords;
}

EvaluationResult evaluate_news_trigger(const NewsContext* news, double threshold) {
    EvaluationResult result;

    if (news == nullptr || news->article_count == 0) {
        result.reason = "No news data available";
        return result;
    }

    if (news->average_sentiment && *news->average_sentiment < threshold) {
        result.triggered = true;
        result.reason = fmt::format("Negative news sentiment detected: {:.2f}",
                                    *news->average_sentiment);
        result.conditions_met.push_back(
            fmt::format("{} news articles with negative sentiment", news->article_count));
        return result;
    }

    result.reason = "No negative news sentiment";
    return result;
}

}  // namespace vigil
