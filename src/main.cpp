/// @file src/main.cpp
/// @brief daloop CLI entry point.
///
/// Usage:
///   daloop --demo [options]          Adapt on generated shifted blobs
///   daloop --train <csv> [options]   Adapt on a domain-tagged CSV dataset
///   daloop --help                    Print usage

#include "daloop/adaptation.hpp"
#include "daloop/callbacks.hpp"
#include "daloop/criterion.hpp"
#include "daloop/data_loader.hpp"
#include "daloop/errors.hpp"
#include "daloop/model.hpp"
#include "daloop/synthetic.hpp"
#include "daloop/trainer.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  daloop --demo [options]          Adapt on generated shifted blobs\n"
        "  daloop --train <csv> [options]   Adapt on a domain-tagged CSV dataset\n"
        "  daloop --help                    Show this help\n"
        "\n"
        "Options:\n"
        "  --epochs N          training epochs (default 10)\n"
        "  --batch-size N      minibatch size (default 32)\n"
        "  --lr X              SGD learning rate (default 0.1)\n"
        "  --momentum X        memory-bank momentum in [0,1) (default 0.7)\n"
        "  --update-rule R     ema | scaled-overwrite | legacy-decay (default ema)\n"
        "  --hidden N          feature dimension of the MLP (default 16)\n"
        "  --seed N            seed for init, shuffling and data (default 0)\n"
        "  --verbose           per-epoch and per-hook logging to stderr\n"
        "\n"
        "CSV format (header required):\n"
        "  sample_idx,domain,label,f0,f1,...\n"
        "  domain >= 0 is source, domain < 0 is target; target label left empty\n"
    );
}

struct RunOptions {
    daloop::TrainerConfig          trainer{};
    daloop::TargetMemoryBankConfig memory{};
    std::size_t                    hidden  = 16;
    unsigned                       seed    = 0;
    bool                           verbose = false;
};

std::optional<double> parse_double(const std::string& s) {
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (s.empty() || end != s.c_str() + s.size()) {
        return std::nullopt;
    }
    return v;
}

std::optional<unsigned long> parse_unsigned(const std::string& s) {
    if (s.empty() || s[0] == '-') {
        return std::nullopt;
    }
    char* end = nullptr;
    const unsigned long v = std::strtoul(s.c_str(), &end, 10);
    if (end != s.c_str() + s.size()) {
        return std::nullopt;
    }
    return v;
}

std::optional<daloop::MemoryUpdateRule> parse_rule(const std::string& s) {
    using daloop::MemoryUpdateRule;
    for (auto rule : {MemoryUpdateRule::Ema, MemoryUpdateRule::ScaledOverwrite,
                      MemoryUpdateRule::LegacyDecay}) {
        if (s == daloop::to_string(rule)) {
            return rule;
        }
    }
    return std::nullopt;
}

/// Parse options from argv[first..]. Returns nullopt after printing an error.
std::optional<RunOptions> parse_options(int argc, char* argv[], int first) {
    RunOptions opts;
    for (int i = first; i < argc; ++i) {
        const std::string flag(argv[i]);
        if (flag == "--verbose") {
            opts.verbose = true;
            continue;
        }
        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", flag);
            return std::nullopt;
        }
        const std::string value(argv[++i]);
        bool ok = true;
        if (flag == "--epochs" || flag == "--batch-size" || flag == "--hidden" ||
            flag == "--seed") {
            const auto n = parse_unsigned(value);
            ok = n.has_value();
            if (ok && flag == "--epochs")     opts.trainer.max_epochs = *n;
            if (ok && flag == "--batch-size") opts.trainer.batch_size = *n;
            if (ok && flag == "--hidden")     opts.hidden = *n;
            if (ok && flag == "--seed")       opts.seed = static_cast<unsigned>(*n);
        } else if (flag == "--lr" || flag == "--momentum") {
            const auto x = parse_double(value);
            ok = x.has_value();
            if (ok && flag == "--lr")       opts.trainer.learning_rate = *x;
            if (ok && flag == "--momentum") opts.memory.momentum = *x;
        } else if (flag == "--update-rule") {
            const auto rule = parse_rule(value);
            ok = rule.has_value();
            if (ok) opts.memory.rule = *rule;
        } else {
            fmt::print(stderr, "Unknown option: {}\n", flag);
            return std::nullopt;
        }
        if (!ok) {
            fmt::print(stderr, "Error: invalid value '{}' for {}\n", value, flag);
            return std::nullopt;
        }
    }
    opts.trainer.seed    = opts.seed;
    opts.trainer.verbose = opts.verbose;
    opts.memory.verbose  = false;  // one line per batch is too chatty for the CLI
    return opts;
}

/// Largest source label + 1, or 0 if no source row is labelled.
std::size_t infer_n_classes(const daloop::DomainDataset& ds) {
    int max_label = -1;
    for (std::size_t i = 0; i < ds.size(); ++i) {
        if (daloop::is_source(ds.domain[i]) && ds.label[i]) {
            max_label = std::max(max_label, *ds.label[i]);
        }
    }
    return static_cast<std::size_t>(max_label + 1);
}

struct RunResult {
    std::vector<daloop::EpochSummary> history;
    std::vector<int>                  target_predictions;  ///< in target-row order
};

/// Train an MLP on `train` with both adaptation hooks attached.
RunResult run_adaptation(const daloop::DomainDataset& train, std::size_t n_classes,
                         const RunOptions& opts) {
    daloop::MlpClassifier model(daloop::MlpConfig{
        .input_dim  = train.dim(),
        .hidden_dim = opts.hidden,
        .n_classes  = n_classes,
        .seed       = opts.seed,
        .device     = daloop::Device{},
    });

    daloop::AdaptationState state(train, model.feature_dim(), n_classes,
                                  model.device(), opts.seed);

    daloop::SourceCentroidConfig centroid_cfg;
    centroid_cfg.n_classes = n_classes;
    centroid_cfg.verbose   = opts.verbose;

    const daloop::PseudoLabelCriterion criterion(state);
    daloop::Trainer trainer(model, criterion, state, opts.trainer);
    trainer.add_callback(std::make_shared<daloop::SourceCentroidEstimator>(state, centroid_cfg));
    trainer.add_callback(std::make_shared<daloop::TargetMemoryBank>(state, opts.memory));

    RunResult result;
    result.history = trainer.fit(train);

    const auto target = train.select(train.target_rows());
    if (!target.empty()) {
        result.target_predictions = model.predict(target.X);
    }
    return result;
}

void print_history(const std::vector<daloop::EpochSummary>& history) {
    for (const auto& e : history) {
        fmt::print("epoch {:3d}  loss={:.5f}  pseudo={:5d}  k={}\n",
                   e.epoch, e.mean_loss, e.n_pseudo, e.n_clusters);
    }
}

int run_demo(const RunOptions& opts) {
    daloop::ShiftedBlobsConfig blobs_cfg;
    blobs_cfg.seed = opts.seed;
    const auto blobs = daloop::make_shifted_blobs(blobs_cfg);

    fmt::print("Generated {} source and {} target samples ({} classes)\n",
               blobs.train.n_source(), blobs.train.n_target(), blobs_cfg.n_classes);

    const auto result = run_adaptation(blobs.train, blobs_cfg.n_classes, opts);
    print_history(result.history);

    std::size_t correct = 0;
    for (std::size_t i = 0; i < result.target_predictions.size(); ++i) {
        if (result.target_predictions[i] == blobs.target_truth[i]) {
            ++correct;
        }
    }
    const double accuracy = result.target_predictions.empty()
        ? 0.0
        : static_cast<double>(correct) / static_cast<double>(result.target_predictions.size());
    fmt::print("Target accuracy: {:.4f} ({}/{})\n",
               accuracy, correct, result.target_predictions.size());
    return 0;
}

int run_train(const std::string& filepath, const RunOptions& opts) {
    auto ds = daloop::DataLoader::load_csv(filepath);
    if (!ds) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", filepath);
        return 1;
    }
    if (ds->empty()) {
        fmt::print(stderr, "Error: no valid rows loaded from '{}'\n", filepath);
        return 1;
    }

    const std::size_t n_classes = infer_n_classes(*ds);
    if (n_classes == 0) {
        fmt::print(stderr, "Error: '{}' has no labelled source row\n", filepath);
        return 1;
    }

    fmt::print("Loaded {} source and {} target samples ({} features, {} classes) from '{}'\n",
               ds->n_source(), ds->n_target(), ds->dim(), n_classes, filepath);

    const auto result = run_adaptation(*ds, n_classes, opts);
    print_history(result.history);

    std::vector<std::size_t> counts(n_classes, 0);
    for (int c : result.target_predictions) {
        ++counts[static_cast<std::size_t>(c)];
    }
    for (std::size_t c = 0; c < n_classes; ++c) {
        fmt::print("Target predicted class {}: {}\n", c, counts[c]);
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    try {
        if (mode == "--demo") {
            const auto opts = parse_options(argc, argv, 2);
            if (!opts) {
                return 1;
            }
            return run_demo(*opts);
        }

        if (mode == "--train") {
            if (argc < 3) {
                fmt::print(stderr, "Error: --train requires a CSV file path\n");
                print_usage();
                return 1;
            }
            const auto opts = parse_options(argc, argv, 3);
            if (!opts) {
                return 1;
            }
            return run_train(std::string(argv[2]), *opts);
        }
    } catch (const std::exception& e) {
        fmt::print(stderr, "[FATAL] {}\n", e.what());
        return 1;
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
