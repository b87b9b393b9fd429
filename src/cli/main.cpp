// =============================================================================
// tokvec CLI - vocabulary building, token-classifier training and encoding
// =============================================================================
//
// Usage:
//   tokvec [-c config] [-v] <command> [options]
//
// Commands:
//   vocabulary  Build a sub-word vocabulary from a JSON-lines corpus
//   train       Train the per-token classifiers and write the model file
//   transform   Encode texts into normalized vectors
//   convert     Re-encode a model file at another precision
//   version     Show version information
//   help        Show this help message
//
// Examples:
//   tokvec vocabulary --lang es --voc-size-exponent 13 tweets.json.gz
//   tokvec train --vocabulary seqtm_es_13.json.gz -o tokvec_es_13.json.gz tweets.json.gz
//   tokvec transform -m tokvec_es_13.json.gz -o vectors.json texts.json
//   tokvec convert --from float32 --to float16 -o model16.json.gz model.json.gz
//
// =============================================================================

#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "tokvec/build/token_trainer.hpp"
#include "tokvec/build/vocabulary_builder.hpp"
#include "tokvec/config.hpp"
#include "tokvec/error.hpp"
#include "tokvec/io/artifact_io.hpp"
#include "tokvec/io/json_lines.hpp"
#include "tokvec/logging.hpp"
#include "tokvec/model/encoder.hpp"
#include "tokvec/thread_pool.hpp"

namespace tokvec::cli {
    int cmd_vocabulary(int argc, char* argv[]);
    int cmd_train(int argc, char* argv[]);
    int cmd_transform(int argc, char* argv[]);
    int cmd_convert(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define TOKVEC_VERSION_MAJOR 0
#define TOKVEC_VERSION_MINOR 3
#define TOKVEC_VERSION_PATCH 0
#define TOKVEC_VERSION_STRING "0.3.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"vocabulary", "Build a sub-word vocabulary from a corpus", tokvec::cli::cmd_vocabulary},
    {"train",      "Train per-token classifiers into a model file", tokvec::cli::cmd_train},
    {"transform",  "Encode texts into normalized vectors", tokvec::cli::cmd_transform},
    {"convert",    "Re-encode a model file at another precision", tokvec::cli::cmd_convert},
    {"version",    "Show version information", tokvec::cli::cmd_version},
    {"help",       "Show this help message", tokvec::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file;
    bool verbose = false;
};

static GlobalOptions g_options;

namespace {

// Worker pool sized by perf.max_threads (0 = hardware concurrency)
tokvec::ThreadPool& worker_pool() {
    static tokvec::ThreadPool pool(
        tokvec::Config::getInstance().get<size_t>("perf.max_threads", 0));
    return pool;
}

// Surface-form table named by voc.symbols, empty when unset
tokvec::text::SymbolTable symbol_table() {
    const std::string path = tokvec::Config::getInstance().get<std::string>("voc.symbols");
    if (path.empty()) {
        return {};
    }
    return tokvec::io::load_symbols(path);
}

struct FlagOption {
    const char* flag;
    const char* key;
    bool takes_value;
};

// Consumes "--flag value" pairs into config keys and collects the positional arguments
bool apply_flags(int argc, char* argv[], const std::vector<FlagOption>& options,
                 std::vector<std::string>& positional) {
    tokvec::Config& config = tokvec::Config::getInstance();
    for (int i = 0; i < argc; ++i) {
        const std::string arg = argv[i];
        bool matched = false;
        for (const auto& option : options) {
            if (arg != option.flag) continue;
            matched = true;
            if (!option.takes_value) {
                config.set(option.key, "true");
            } else if (i + 1 < argc) {
                config.set(option.key, argv[++i]);
            } else {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            break;
        }
        if (matched) continue;
        if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
        positional.push_back(arg);
    }
    return true;
}

} // namespace

namespace tokvec::cli {

// =============================================================================
// Help Command
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "tokvec - sub-word vocabularies and token-classifier embeddings\n";
    std::cout << "Version " << TOKVEC_VERSION_STRING << "\n\n";
    std::cout << "Usage: tokvec [-c config] [-v] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     key = value configuration file\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "\nvocabulary <corpus>       --lang, --voc-size-exponent, --limit, --symbols,\n";
    std::cout << "                          --no-prefix-suffix, -o <output>\n";
    std::cout << "train <corpus>            --vocabulary <file>, --min-pos, --max-pos,\n";
    std::cout << "                          --precision, --intercept, --symbols, -o <output>\n";
    std::cout << "transform <texts>         -m <model>, --precision, --symbols, -o <output>\n";
    std::cout << "convert <model>           --from, --to, -o <output>\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  TOKVEC_LOG_LEVEL        debug | info | warn | error | fatal\n";
    std::cout << "  TOKVEC_MAX_THREADS      Worker threads (0 = all cores)\n";
    return 0;
}

// =============================================================================
// Version Command
// =============================================================================

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "tokvec " << TOKVEC_VERSION_STRING << "\n";
    std::cout << "Eigen " << EIGEN_WORLD_VERSION << "." << EIGEN_MAJOR_VERSION << "."
              << EIGEN_MINOR_VERSION << "\n";
    std::cout << "Threads: " << worker_pool().num_threads() << "\n";
    return 0;
}

// =============================================================================
// Vocabulary Command
// =============================================================================

int cmd_vocabulary(int argc, char* argv[]) {
    std::vector<std::string> positional;
    if (!apply_flags(argc, argv, {
            {"--lang", "voc.lang", true},
            {"--voc-size-exponent", "voc.size_exponent", true},
            {"--limit", "voc.limit", true},
            {"--symbols", "voc.symbols", true},
            {"--no-prefix-suffix", "cli.no_prefix_suffix", false},
            {"-o", "cli.output", true},
            {"--output", "cli.output", true},
        }, positional)) {
        return 1;
    }
    if (positional.size() != 1) {
        std::cerr << "Usage: tokvec vocabulary [options] <corpus>\n";
        return 1;
    }

    const Config& config = Config::getInstance();
    build::VocabularyBuildOptions options = build::VocabularyBuildOptions::from_config();
    if (config.get<bool>("cli.no_prefix_suffix", false)) {
        options.prefix_suffix = false;
    }

    const std::vector<std::string> corpus = io::read_texts(positional[0], options.limit);
    const build::VocabularyBuilder builder(options, {}, worker_pool());
    const text::Vocabulary vocabulary = builder.build(corpus);

    std::string output = config.get<std::string>("cli.output");
    if (output.empty()) {
        output = vocabulary.identifier() + ".json.gz";
    }
    io::save_vocabulary(vocabulary, output);
    std::cout << output << "\n";
    return 0;
}

// =============================================================================
// Train Command
// =============================================================================

int cmd_train(int argc, char* argv[]) {
    std::vector<std::string> positional;
    if (!apply_flags(argc, argv, {
            {"--vocabulary", "cli.vocabulary", true},
            {"--min-pos", "train.min_pos", true},
            {"--max-pos", "train.max_pos", true},
            {"--precision", "train.precision", true},
            {"--intercept", "train.intercept", false},
            {"--symbols", "voc.symbols", true},
            {"-o", "cli.output", true},
            {"--output", "cli.output", true},
        }, positional)) {
        return 1;
    }

    const Config& config = Config::getInstance();
    const std::string vocabulary_file = config.get<std::string>("cli.vocabulary");
    const std::string output = config.get<std::string>("cli.output");
    if (positional.size() != 1 || vocabulary_file.empty() || output.empty()) {
        std::cerr << "Usage: tokvec train --vocabulary <file> -o <output> [options] <corpus>\n";
        return 1;
    }

    const build::TrainerOptions options = build::TrainerOptions::from_config();
    std::shared_ptr<const text::Vocabulary> vocabulary =
        io::load_vocabulary(vocabulary_file, -1, symbol_table());
    const std::vector<std::string> corpus = io::read_texts(positional[0]);

    const size_t trained = build::build_embedding_model(vocabulary, corpus, output, options, worker_pool());
    std::cout << trained << " token classifiers written to " << output << "\n";
    return 0;
}

// =============================================================================
// Transform Command
// =============================================================================

int cmd_transform(int argc, char* argv[]) {
    std::vector<std::string> positional;
    if (!apply_flags(argc, argv, {
            {"-m", "cli.model", true},
            {"--model", "cli.model", true},
            {"--precision", "train.precision", true},
            {"--symbols", "voc.symbols", true},
            {"-o", "cli.output", true},
            {"--output", "cli.output", true},
        }, positional)) {
        return 1;
    }

    const Config& config = Config::getInstance();
    const std::string model_file = config.get<std::string>("cli.model");
    if (positional.size() != 1 || model_file.empty()) {
        std::cerr << "Usage: tokvec transform -m <model> [-o <output>] <texts>\n";
        return 1;
    }

    const model::Encoder encoder = model::Encoder::load(model_file, model::EncoderConfig::from_config(),
                                                        symbol_table(), worker_pool());
    const std::vector<std::string> texts = io::read_texts(positional[0]);
    const Matrix X = encoder.transform(texts);

    const std::string output = config.get<std::string>("cli.output");
    std::unique_ptr<io::LineWriter> writer;
    if (!output.empty()) {
        writer = std::make_unique<io::LineWriter>(output);
    }
    for (Eigen::Index i = 0; i < X.rows(); ++i) {
        boost::json::array row;
        for (Eigen::Index j = 0; j < X.cols(); ++j) {
            row.push_back(static_cast<double>(X(i, j)));
        }
        if (writer) {
            writer->write(boost::json::value(std::move(row)));
        } else {
            std::cout << boost::json::serialize(row) << "\n";
        }
    }
    if (writer) {
        writer->close();
    }
    return 0;
}

// =============================================================================
// Convert Command
// =============================================================================

int cmd_convert(int argc, char* argv[]) {
    std::vector<std::string> positional;
    Config::getInstance().set("cli.from", "float32");
    Config::getInstance().set("cli.to", "float16");
    if (!apply_flags(argc, argv, {
            {"--from", "cli.from", true},
            {"--to", "cli.to", true},
            {"-o", "cli.output", true},
            {"--output", "cli.output", true},
        }, positional)) {
        return 1;
    }

    const Config& config = Config::getInstance();
    const std::string output = config.get<std::string>("cli.output");
    if (positional.size() != 1 || output.empty()) {
        std::cerr << "Usage: tokvec convert [--from float32] [--to float16] -o <output> <model>\n";
        return 1;
    }

    const size_t converted = io::convert_precision(positional[0], output,
                                                   parse_precision(config.get<std::string>("cli.from")),
                                                   parse_precision(config.get<std::string>("cli.to")));
    std::cout << converted << " token records converted\n";
    return 0;
}

} // namespace tokvec::cli

// =============================================================================
// Main Entry Point
// =============================================================================

int parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else {
            // First non-global argument is the command
            break;
        }
        ++i;
    }

    argc -= i;
    argv += i;
    return 0;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (!tokvec::init_config(g_options.config_file)) {
        return 1;
    }
    if (g_options.verbose) {
        tokvec::set_log_level(tokvec::LogLevel::DEBUG);
    }

    if (argc < 1) {
        tokvec::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            try {
                return cmd->handler(argc, argv);
            } catch (const tokvec::TokvecException& e) {
                LOG_ERROR(e.what());
                return 2;
            } catch (const std::exception& e) {
                LOG_ERROR("Unexpected failure: ", e.what());
                return 3;
            }
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'tokvec help' for usage.\n";
    return 1;
}
