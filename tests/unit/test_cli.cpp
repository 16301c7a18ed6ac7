#include <gtest/gtest.h>
#include "cli/cli.hpp"

using namespace tfa;

namespace {

Command analyze_command() {
    return {
        "analyze",
        "Analyze evaluation comments",
        {
            text_arg("input", "i", "Evaluations JSON file", true),
            choice_arg("method", "m", "Clustering method", {"kmeans", "dbscan"}),
            choice_arg("language", "l", "Comment language", {"FR", "AR", "DARIJA"}),
            int_arg("clusters", "k", "Number of clusters", 1),
            flag_arg("verbose", "v", "Verbose logging")
        },
        [](const Args&) { return 0; }
    };
}

} // namespace

// ==========================================
// Argument Parsing Tests
// ==========================================

TEST(CliTest, ParsesLongShortAndInlineForms) {
    Args args = CLI::parse_args(analyze_command(),
                                {"--input", "evals.json", "-k", "4", "--method=dbscan", "-v"});
    EXPECT_EQ(args.require("input"), "evals.json");
    EXPECT_EQ(args.get_int("clusters", 0), 4);
    EXPECT_EQ(args.get("method"), "dbscan");
    EXPECT_TRUE(args.has("verbose"));
    EXPECT_FALSE(args.has("language"));
    EXPECT_EQ(args.get_int("missing", 7), 7);
}

TEST(CliTest, ChoicesAreCanonicalized) {
    Args args = CLI::parse_args(analyze_command(),
                                {"-i", "evals.json", "--language", "darija", "-m", "KMeans"});
    EXPECT_EQ(args.get("language"), "DARIJA");
    EXPECT_EQ(args.get("method"), "kmeans");
}

TEST(CliTest, RejectsValuesOutsideChoices) {
    EXPECT_THROW(CLI::parse_args(analyze_command(), {"-i", "x", "--method", "spectral"}),
                 std::runtime_error);
    EXPECT_THROW(CLI::parse_args(analyze_command(), {"-i", "x", "--language", "EN"}),
                 std::runtime_error);
}

TEST(CliTest, RejectsMalformedIntegers) {
    EXPECT_THROW(CLI::parse_args(analyze_command(), {"-i", "x", "-k", "three"}),
                 std::runtime_error);
    EXPECT_THROW(CLI::parse_args(analyze_command(), {"-i", "x", "-k", "3x"}),
                 std::runtime_error);
    EXPECT_THROW(CLI::parse_args(analyze_command(), {"-i", "x", "-k", "0"}),
                 std::runtime_error);
}

TEST(CliTest, RejectsMissingAndUnknownArguments) {
    EXPECT_THROW(CLI::parse_args(analyze_command(), {"-k", "3"}), std::runtime_error);
    EXPECT_THROW(CLI::parse_args(analyze_command(), {"-i", "x", "--seed", "1"}),
                 std::runtime_error);
    EXPECT_THROW(CLI::parse_args(analyze_command(), {"-i", "x", "stray"}), std::runtime_error);
    EXPECT_THROW(CLI::parse_args(analyze_command(), {"-i"}), std::runtime_error);
    EXPECT_THROW(CLI::parse_args(analyze_command(), {"-i", "x", "--verbose=yes"}),
                 std::runtime_error);
}

TEST(CliTest, RunReturnsErrorCodes) {
    CLI cli("tfa", "1.0.0");
    int handled = 0;
    Command cmd = analyze_command();
    cmd.handler = [&handled](const Args& args) {
        handled = args.get_int("clusters", 0);
        return 0;
    };
    cli.register_command(cmd);

    char program[] = "tfa";
    char name[] = "analyze";
    char input_flag[] = "-i";
    char input[] = "evals.json";
    char clusters_flag[] = "-k";
    char clusters[] = "5";
    char bad_clusters[] = "-5";

    char* ok_argv[] = {program, name, input_flag, input, clusters_flag, clusters};
    EXPECT_EQ(cli.run(6, ok_argv), 0);
    EXPECT_EQ(handled, 5);

    char* bad_argv[] = {program, name, input_flag, input, clusters_flag, bad_clusters};
    EXPECT_EQ(cli.run(6, bad_argv), 1);

    char unknown[] = "report";
    char* unknown_argv[] = {program, unknown};
    EXPECT_EQ(cli.run(2, unknown_argv), 1);
}
