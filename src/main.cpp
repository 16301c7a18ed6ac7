#include "cli/cli.hpp"
#include "core/errors.hpp"
#include "core/records.hpp"
#include "core/text_utils.hpp"
#include "pipeline/analysis_pipeline.hpp"
#include "storage/record_store.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

using namespace tfa;

// ============== Helper Functions ==============

std::string format_duration(std::chrono::steady_clock::duration d) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    std::stringstream ss;
    if (ms >= 1000) {
        ss << std::fixed << std::setprecision(2) << (ms / 1000.0) << "s";
    } else {
        ss << ms << "ms";
    }
    return ss.str();
}

// Config from --config (or the usual fallbacks), with command-line overrides
PipelineConfig resolve_config(const Args& args) {
    PipelineConfig config = load_config_with_fallback(args.get("config"));

    if (args.has("store")) config.store_path = args.get("store");
    if (args.has("method")) config.clustering_method = args.get("method");
    if (args.has("embeddings")) config.embedding_provider = args.get("embeddings");
    if (args.has("no-remote")) config.remote_sentiment_enabled = false;
    if (args.has("workers")) config.max_workers = args.get_int("workers", config.max_workers);
    if (args.has("verbose")) config.verbose = true;

    std::string error;
    if (!config.validate(error)) {
        throw ConfigError("Invalid configuration: " + error);
    }
    return config;
}

// Accepts a JSON array of evaluations or {"evaluations": [...]}
std::vector<EvaluationText> load_evaluations(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open evaluations file: " + path);
    }

    json j;
    file >> j;

    const json& items = j.is_object() && j.contains("evaluations") ? j["evaluations"] : j;
    if (!items.is_array()) {
        throw std::runtime_error("Evaluations file must hold an array: " + path);
    }

    std::vector<EvaluationText> evaluations;
    for (const auto& item : items) {
        evaluations.push_back(EvaluationText::from_json(item));
    }
    return evaluations;
}

void write_json(const std::string& path, const json& j) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open output file: " + path);
    }
    file << j.dump(2);
}

// ============== tfa analyze ==============
int cmd_analyze(const Args& args) {
    auto start = std::chrono::steady_clock::now();

    std::string input_path = args.require("input");
    PipelineConfig config = resolve_config(args);
    int batch_size = args.get_int("batch-size", 100);

    std::cout << "Loading evaluations from: " << input_path << "\n";
    auto evaluations = load_evaluations(input_path);
    std::cout << "Loaded " << evaluations.size() << " evaluations\n";

    JsonFileRecordStore store(config.store_path);

    // Register the evaluations so analyses and insights can refer to them
    {
        StoreTransaction transaction(store);
        for (auto& evaluation : evaluations) {
            evaluation.id = store.add_evaluation(evaluation);
        }
        transaction.commit();
    }

    AnalysisPipeline pipeline(config, AnalysisServices::create(config), store);

    ClusteringParams params;
    if (args.has("clusters")) {
        params.n_clusters = args.get_int("clusters", 0);
    }

    std::vector<Analysis> analyses;
    for (size_t offset = 0; offset < evaluations.size(); offset += batch_size) {
        size_t end = std::min(evaluations.size(), offset + static_cast<size_t>(batch_size));
        std::vector<EvaluationText> batch(evaluations.begin() + offset, evaluations.begin() + end);
        std::cout << "Batch " << (offset / batch_size + 1) << ": evaluations "
                  << offset + 1 << "-" << end << "\n";
        auto part = pipeline.process_batch(batch, params);
        analyses.insert(analyses.end(), part.begin(), part.end());
    }

    pipeline.get_statistics().print_summary();

    if (args.has("output")) {
        json out = json::array();
        for (const auto& analysis : analyses) {
            out.push_back(analysis.to_json());
        }
        write_json(args.get("output"), out);
        std::cout << "Saved analyses to: " << args.get("output") << "\n";
    }

    std::cout << "Store: " << config.store_path << "\n";
    std::cout << "Time: " << format_duration(std::chrono::steady_clock::now() - start) << "\n";
    return 0;
}

// ============== tfa insights ==============
int cmd_insights(const Args& args) {
    PipelineConfig config = resolve_config(args);
    JsonFileRecordStore store(config.store_path);

    InsightMinerConfig miner_config;
    miner_config.verbose = config.verbose;
    InsightMiner miner(miner_config);

    auto insights = miner.generate(store);

    std::cout << "Generated " << insights.size() << " insights\n\n";
    for (const auto& insight : insights) {
        std::cout << "  [" << insight_kind_to_string(insight.kind) << "] "
                  << insight.title << "\n";
        std::cout << "      " << insight.description << "\n";
        std::cout << "      confidence: " << insight.confidence << "\n";
    }

    if (args.has("output")) {
        json out = json::array();
        for (const auto& insight : insights) {
            out.push_back(insight.to_json());
        }
        write_json(args.get("output"), out);
        std::cout << "\nSaved insights to: " << args.get("output") << "\n";
    }
    return 0;
}

// ============== tfa themes ==============
int cmd_themes(const Args& args) {
    PipelineConfig config = resolve_config(args);
    JsonFileRecordStore store(config.store_path);
    int top_n = args.get_int("top", 50);

    ThemeCategorizer categorizer;
    CategoryBreakdown breakdown = categorizer.get_categorized_themes(
        store, static_cast<size_t>(top_n));

    if (args.has("json")) {
        std::cout << breakdown.to_json().dump(2) << "\n";
        return 0;
    }

    std::cout << "\nTheme categories (top " << top_n << " themes)\n";
    std::cout << std::string(50, '-') << "\n";
    for (const auto& stats : breakdown.categories) {
        std::cout << std::left << std::setw(30) << category_to_string(stats.category)
                  << std::right << std::setw(6) << stats.percentage << "%  ("
                  << stats.count << " themes, frequency " << stats.total_frequency << ")\n";
        for (size_t i = 0; i < stats.themes.size() && i < 5; ++i) {
            const auto& theme = stats.themes[i];
            std::cout << "    " << theme.name << " [" << language_to_string(theme.language)
                      << "] x" << theme.frequency << "\n";
        }
    }
    return 0;
}

// ============== tfa clusters ==============
int cmd_clusters(const Args& args) {
    PipelineConfig config = resolve_config(args);
    JsonFileRecordStore store(config.store_path);

    auto clusters = store.clusters();
    std::cout << clusters.size() << " clusters\n\n";
    for (const auto& cluster : clusters) {
        std::cout << "  " << cluster.label << " (id " << cluster.id << ", size "
                  << cluster.size << ", avg sentiment " << std::fixed
                  << std::setprecision(2) << cluster.avg_sentiment << ")\n";
        std::cout.unsetf(std::ios::fixed);
        if (!cluster.representative_themes.empty()) {
            std::cout << "      themes:";
            for (const auto& theme : cluster.representative_themes) {
                std::cout << " " << theme << ";";
            }
            std::cout << "\n";
        }
    }
    return 0;
}

// ============== tfa detect ==============
int cmd_detect(const Args& args) {
    std::string text = args.require("text");

    LanguageClassifier classifier(make_default_language_identifier(), args.has("verbose"));
    LanguageDetection detection = classifier.detect_with_confidence(text);
    DarijaFeatures features = classifier.darija_features(to_lower_utf8(text));

    std::cout << "Language:   " << language_to_string(detection.language) << "\n";
    std::cout << "Confidence: " << detection.confidence << "\n";
    std::cout << "Darija markers: " << features.markers
              << ", patterns: " << features.patterns << "\n";
    return 0;
}

// ============== tfa sentiment ==============
int cmd_sentiment(const Args& args) {
    std::string text = args.require("text");
    PipelineConfig config = resolve_config(args);

    LanguageLabel language;
    if (args.has("language")) {
        language = language_from_string(args.get("language")).value();
    } else {
        LanguageClassifier classifier(make_default_language_identifier(), config.verbose);
        language = classifier.detect(text);
    }

    auto scorer = make_sentiment_scorer(make_default_http_client(),
                                        config.remote_sentiment_config(),
                                        config.remote_sentiment_enabled);
    ScoredSentiment scored = scorer->analyze(text, language);

    std::cout << "Language:   " << language_to_string(language) << "\n";
    std::cout << "Polarity:   " << polarity_to_string(scored.result.polarity) << "\n";
    std::cout << "Score:      " << scored.result.score << "\n";
    std::cout << "Confidence: " << scored.result.confidence << "\n";
    std::cout << "Label:      " << scored.result.source_label << "\n";
    std::cout << "Strategy:   " << scored.strategy << "\n";
    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("tfa", "1.0.0");

    const std::vector<std::string> methods = {"kmeans", "dbscan"};
    const std::vector<std::string> providers = {"http", "hashing"};
    const std::vector<std::string> languages = {
        language_to_string(LanguageLabel::FR),
        language_to_string(LanguageLabel::AR),
        language_to_string(LanguageLabel::DARIJA)
    };

    // tfa analyze
    cli.register_command({
        "analyze",
        "Analyze evaluation comments and store analyses, clusters and themes",
        {
            text_arg("input", "i", "Evaluations JSON file", true),
            text_arg("store", "s", "Record store JSON file"),
            text_arg("config", "c", "Path to config file (optional)"),
            choice_arg("method", "m", "Clustering method", methods),
            int_arg("clusters", "k", "Number of K-Means clusters (default: configured or elbow)", 1),
            choice_arg("embeddings", "e", "Embedding provider", providers),
            int_arg("batch-size", "b", "Evaluations per batch (default: 100)", 1),
            int_arg("workers", "w", "Worker threads per batch", 1),
            text_arg("output", "o", "Write the new analyses to this JSON file"),
            flag_arg("no-remote", "n", "Skip the hosted sentiment models"),
            flag_arg("verbose", "v", "Verbose logging")
        },
        cmd_analyze
    });

    // tfa insights
    cli.register_command({
        "insights",
        "Generate insights from stored evaluations and analyses",
        {
            text_arg("store", "s", "Record store JSON file"),
            text_arg("config", "c", "Path to config file (optional)"),
            text_arg("output", "o", "Write the new insights to this JSON file"),
            flag_arg("verbose", "v", "Verbose logging")
        },
        cmd_insights
    });

    // tfa themes
    cli.register_command({
        "themes",
        "Show the most frequent themes grouped into categories",
        {
            text_arg("store", "s", "Record store JSON file"),
            text_arg("config", "c", "Path to config file (optional)"),
            int_arg("top", "t", "Number of themes to categorize (default: 50)", 1),
            flag_arg("json", "j", "Print JSON instead of a table")
        },
        cmd_themes
    });

    // tfa clusters
    cli.register_command({
        "clusters",
        "List stored clusters",
        {
            text_arg("store", "s", "Record store JSON file"),
            text_arg("config", "c", "Path to config file (optional)")
        },
        cmd_clusters
    });

    // tfa detect
    cli.register_command({
        "detect",
        "Detect the language of a text (FR, AR, DARIJA)",
        {
            text_arg("text", "t", "Text to classify", true),
            flag_arg("verbose", "v", "Verbose logging")
        },
        cmd_detect
    });

    // tfa sentiment
    cli.register_command({
        "sentiment",
        "Score the sentiment of a text",
        {
            text_arg("text", "t", "Text to score", true),
            choice_arg("language", "l", "Comment language (default: detected)", languages),
            text_arg("config", "c", "Path to config file (optional)"),
            flag_arg("no-remote", "n", "Skip the hosted sentiment models"),
            flag_arg("verbose", "v", "Verbose logging")
        },
        cmd_sentiment
    });

    return cli.run(argc, argv);
}
