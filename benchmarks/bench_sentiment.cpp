#include <benchmark/benchmark.h>
#include "eval/sentiment_analyzer.hpp"
#include <iterator>

using namespace vigil;

namespace {

std::vector<NewsItem> make_articles(std::size_t count) {
    static const NewsItem kSamples[] = {
        {.title = "Record dividend announced", .summary = "Profit growth beats expectations"},
        {.title = "Regulator opens lawsuit", .summary = "Debt concerns and default risk grow"},
        {.title = "Сбербанк увеличил прибыль", .summary = "Рост выручки и дивиденды"},
        {.title = "Quarterly update", .summary = "The company held its annual meeting"},
    };

    std::vector<NewsItem> articles;
    articles.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        articles.push_back(kSamples[i % std::size(kSamples)]);
    }
    return articles;
}

}  // namespace

// Benchmark keyword scoring of one article (English)
static void BM_SentimentScoreArticle(benchmark::State& state) {
    SentimentAnalyzer analyzer;
    NewsItem article{.title = "Regulator opens lawsuit", .summary = "Debt concerns and default risk grow"};

    for (auto _ : state) {
        benchmark::DoNotOptimize(analyzer.score_article(article));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SentimentScoreArticle);

// Benchmark keyword scoring of one article (Cyrillic, case folding)
static void BM_SentimentScoreCyrillic(benchmark::State& state) {
    SentimentAnalyzer analyzer;
    NewsItem article{.title = "СБЕРБАНК УВЕЛИЧИЛ ПРИБЫЛЬ", .summary = "Рост выручки и дивиденды"};

    for (auto _ : state) {
        benchmark::DoNotOptimize(analyzer.score_article(article));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SentimentScoreCyrillic);

// Benchmark averaging over a news window
static void BM_SentimentAverage(benchmark::State& state) {
    SentimentAnalyzer analyzer;
    auto articles = make_articles(static_cast<std::size_t>(state.range(0)));

    for (auto _ : state) {
        benchmark::DoNotOptimize(analyzer.average_sentiment(articles));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_SentimentAverage)->Range(1, 256);
