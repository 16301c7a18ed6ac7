#include "pipeline/analysis_pipeline.hpp"
#include <iostream>
#include <iomanip>

using namespace tfa;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

// Progress callback function
void progress_handler(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
) {
    std::cout << "[" << stage << "] ";
    if (total > 0) {
        std::cout << current << "/" << total << " ";
        int percent = (current * 100) / total;
        std::cout << "(" << percent << "%) ";
    }
    if (!message.empty()) {
        std::cout << "- " << message;
    }
    std::cout << std::endl;
}

EvaluationText make_evaluation(const std::string& formation, const std::string& trainer,
                               int satisfaction, const std::string& comment) {
    EvaluationText e;
    e.formation_type = formation;
    e.trainer_id = trainer;
    e.satisfaction = satisfaction;
    e.comment = comment;
    e.date = std::chrono::system_clock::now();
    return e;
}

int main() {
    print_separator("Training Feedback Analysis Pipeline");

    std::cout << "This example runs the complete pipeline offline:\n";
    std::cout << "  Comments -> Language -> Sentiment -> Themes -> Clusters -> Insights\n";

    // =========================================================================
    // Configuration
    // =========================================================================

    print_separator("Step 1: Configuration");

    PipelineConfig config = create_default_config();
    config.remote_sentiment_enabled = false;   // lexicon scoring only
    config.embedding_provider = "hashing";     // no model server needed
    config.embedding_dimension = 128;
    config.max_workers = 2;

    std::cout << config.to_json().dump(2) << "\n";

    // =========================================================================
    // Input
    // =========================================================================

    print_separator("Step 2: Evaluations");

    InMemoryRecordStore store;
    std::vector<EvaluationText> evaluations = {
        make_evaluation("Management", "T-01", 5,
                        "Excellent formation, formateur très compétent et clair"),
        make_evaluation("Management", "T-01", 4,
                        "Contenu utile et exercices pratiques, bonne organisation"),
        make_evaluation("Excel", "T-02", 2,
                        "Formation décevante, salle mal équipée et rythme trop rapide"),
        make_evaluation("Excel", "T-02", 1,
                        "Support obsolète, perte de temps"),
        make_evaluation("Excel", "T-02", 2, ""),
        make_evaluation("Communication", "T-03", 4,
                        "daba fhemt bezzaf dyal l7wayej, formation mezyan"),
        make_evaluation("Communication", "T-03", 5,
                        "التكوين ممتاز والمكون مفيد جدا")
    };

    {
        StoreTransaction transaction(store);
        for (auto& evaluation : evaluations) {
            evaluation.id = store.add_evaluation(evaluation);
        }
        transaction.commit();
    }
    std::cout << "Registered " << evaluations.size() << " evaluations\n";

    // =========================================================================
    // Analysis
    // =========================================================================

    print_separator("Step 3: Analysis");

    std::vector<Analysis> analyses;
    try {
        AnalysisPipeline pipeline(config, AnalysisServices::create(config), store);
        pipeline.set_progress_callback(progress_handler);

        ClusteringParams params;
        params.n_clusters = 2;
        analyses = pipeline.process_batch(evaluations, params);

        std::cout << "\n";
        for (const auto& analysis : analyses) {
            std::cout << "  #" << analysis.evaluation_id
                      << "  " << std::setw(6) << std::left
                      << language_to_string(analysis.language)
                      << "  " << std::setw(8) << polarity_to_string(analysis.sentiment.polarity)
                      << " " << std::fixed << std::setprecision(2)
                      << analysis.sentiment.score
                      << "  (" << analysis.sentiment_strategy << ")";
            if (analysis.cluster_id) {
                std::cout << "  cluster " << *analysis.cluster_id;
            }
            std::cout << "\n";
        }

        pipeline.get_statistics().print_summary();

        // =====================================================================
        // Insights and themes
        // =====================================================================

        print_separator("Step 4: Insights");

        for (const auto& insight : pipeline.generate_insights()) {
            std::cout << "  [" << insight_kind_to_string(insight.kind) << "] "
                      << insight.title << "\n";
            std::cout << "      " << insight.description << "\n";
        }

        print_separator("Step 5: Theme Categories");

        CategoryBreakdown breakdown = pipeline.get_categorized_themes();
        for (const auto& stats : breakdown.categories) {
            std::cout << "  " << std::setw(24) << std::left
                      << category_to_string(stats.category)
                      << std::setprecision(1) << stats.percentage << "%  ("
                      << stats.count << " themes)\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Pipeline failed: " << e.what() << "\n";
        return 1;
    }

    print_separator("Done");
    return 0;
}
