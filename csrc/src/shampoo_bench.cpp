// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <fmt/core.h>

#include "optimizers/shampoo.h"
#include "training/logging.h"
#include "utilities/comm.h"

/**
 * @brief CLI11 lexical cast hook for parsing ETensorDType options.
 */
bool lexical_cast(const std::string& input, ETensorDType& output) {
    output = dtype_from_str(input);
    return true;
}

namespace CLI::detail {
    template<>
    constexpr const char* type_name<ETensorDType>() {
        return "DTYPE";
    }
}

namespace {

//! "2048x64" -> {2048, 64}; "scalar" -> {}
std::vector<long> parse_shape(const std::string& text) {
    if (text == "scalar") {
        return {};
    }
    std::vector<long> shape;
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, 'x')) {
        std::size_t used = 0;
        long extent = std::stol(item, &used);
        if (used != item.size() || extent < 0) {
            throw std::invalid_argument(fmt::format("Invalid shape '{}'", text));
        }
        shape.push_back(extent);
    }
    if (shape.empty()) {
        throw std::invalid_argument(fmt::format("Invalid shape '{}'", text));
    }
    return shape;
}

/**
 * @brief Parameters of a synthetic quadratic problem, identical on every worker.
 *
 * loss = 1/2 sum_i h_i (p_i - t_i)^2 with a fixed positive curvature h and target t.
 */
struct QuadraticProblem {
    std::vector<std::vector<long>> Shapes;
    std::vector<std::vector<float>> Values;
    std::vector<std::vector<float>> Grads;
    std::vector<std::vector<float>> Targets;
    std::vector<std::vector<float>> Curvature;
    std::vector<shampoo::Parameter> Params;

    QuadraticProblem(const std::vector<std::vector<long>>& shapes, unsigned seed) : Shapes(shapes) {
        std::mt19937 rng(seed);
        std::normal_distribution<float> normal(0.f, 1.f);
        std::uniform_real_distribution<float> scale(0.1f, 10.f);
        for (const auto& shape : Shapes) {
            const auto n = static_cast<std::size_t>(shape_numel(shape));
            std::vector<float> value(n), target(n), curvature(n);
            for (std::size_t i = 0; i < n; ++i) {
                value[i] = normal(rng);
                target[i] = normal(rng);
                curvature[i] = scale(rng);
            }
            Values.push_back(std::move(value));
            Targets.push_back(std::move(target));
            Curvature.push_back(std::move(curvature));
            Grads.emplace_back(n, 0.f);
        }
        for (std::size_t t = 0; t < Shapes.size(); ++t) {
            shampoo::Parameter p;
            p.Name = fmt::format("tensor{}", t);
            p.Value = Tensor::from_vector(Values[t], Shapes[t]);
            p.Grad = Tensor::from_vector(Grads[t], Shapes[t]);
            Params.push_back(p);
        }
    }

    //! Writes the gradients and returns the loss.
    float evaluate() {
        double loss = 0.0;
        for (std::size_t t = 0; t < Values.size(); ++t) {
            for (std::size_t i = 0; i < Values[t].size(); ++i) {
                const float diff = Values[t][i] - Targets[t][i];
                Grads[t][i] = Curvature[t][i] * diff;
                loss += 0.5 * Curvature[t][i] * diff * diff;
            }
        }
        return static_cast<float>(loss);
    }
};

} // namespace

class BenchRunner {
public:
    void load_config(int argc, const char** argv);
    void run(int argc, const char** argv);

private:
    void run_worker(Communicator* comm, int argc, const char** argv);

    shampoo::ShampooConfig Config;
    std::vector<std::string> ShapeArgs = {"256x128", "2048x64", "4096"};
    int Workers = 1;
    int Steps = 20;
    unsigned Seed = 42;
    std::string LogFile;
    int Verbosity = 0;
    std::string SaveSnapshot;
    std::string LoadSnapshot;
    std::vector<std::vector<long>> Shapes;
};

void BenchRunner::load_config(int argc, const char** argv) {
    CLI::App app{"Benchmark distributed Shampoo on a synthetic quadratic problem"};

    std::string config_file;
    std::string large_dim_method = shampoo::to_str(Config.large_dim_method);
    std::string grafting_type = shampoo::to_str(Config.grafting_type);
    bool no_bias_correction = false;
    bool coupled_weight_decay = false;
    bool no_merge_dims = false;
    bool unprotected_eigh = false;

    auto config_opt = app.add_option("--config", config_file, "JSON file with the optimizer configuration")->check(CLI::ExistingFile);
    app.add_option("--shape", ShapeArgs, "Tensor shapes, e.g. 2048x64; may be repeated");
    app.add_option("--workers", Workers, "Number of in-process workers")->check(CLI::PositiveNumber);
    app.add_option("--steps", Steps, "Number of optimizer steps")->check(CLI::NonNegativeNumber);
    app.add_option("--seed", Seed, "Seed of the synthetic problem");
    app.add_option("--log-file", LogFile, "Where to save the run log");
    app.add_option("--verbosity", Verbosity, "-2 silent, -1 quiet, 0 default, 1 verbose")->check(CLI::Range(-2, 1));
    app.add_option("--save-snapshot", SaveSnapshot, "Save the optimizer state after the last step; %r is replaced by the worker rank");
    app.add_option("--load-snapshot", LoadSnapshot, "Restore the optimizer state before the first step; %r is replaced by the worker rank");

    app.add_option("--lr,--learning-rate", Config.defaults.lr, "Learning rate")->check(CLI::NonNegativeNumber)->excludes(config_opt);
    app.add_option("--beta-1", Config.defaults.beta1, "First moment decay")->excludes(config_opt);
    app.add_option("--beta-2", Config.defaults.beta2, "Second moment decay")->excludes(config_opt);
    app.add_option("--epsilon", Config.defaults.epsilon, "Epsilon added to the statistics")->excludes(config_opt);
    app.add_option("--momentum", Config.defaults.momentum, "Momentum")->excludes(config_opt);
    app.add_option("--weight-decay", Config.defaults.weight_decay, "Weight decay")->excludes(config_opt);
    app.add_option("--grafting-epsilon", Config.defaults.grafting_epsilon, "Epsilon of the grafting method")->excludes(config_opt);
    app.add_option("--grafting-beta-2", Config.defaults.grafting_beta2, "Second moment decay of the grafting method")->excludes(config_opt);
    app.add_option("--max-preconditioner-dim", Config.max_preconditioner_dim, "Largest dimension with a full Kronecker factor")->excludes(config_opt);
    app.add_option("--precondition-frequency", Config.precondition_frequency, "Steps between root inversions")->excludes(config_opt);
    app.add_option("--start-preconditioning-step", Config.start_preconditioning_step, "First step that uses the preconditioner; -1 for the precondition frequency")->excludes(config_opt);
    app.add_option("--exponent-override", Config.exponent_override, "Root of the inverse; 0 for 2 * tensor order")->excludes(config_opt);
    app.add_option("--exponent-multiplier", Config.exponent_multiplier, "Multiplier of the inverse root exponent")->excludes(config_opt);
    app.add_flag("--nesterov", Config.use_nesterov, "Use Nesterov momentum")->excludes(config_opt);
    app.add_flag("--no-bias-correction", no_bias_correction, "Disable bias correction")->excludes(config_opt);
    app.add_flag("--coupled-weight-decay", coupled_weight_decay, "Add weight decay to the gradient (L2 regularization)")->excludes(config_opt);
    app.add_flag("--no-merge-dims", no_merge_dims, "Do not merge small dimensions before blocking")->excludes(config_opt);
    app.add_option("--preconditioner-dtype", Config.preconditioner_dtype, "Storage and inversion precision: fp32 or fp64")->excludes(config_opt);
    app.add_option("--large-dim-method", large_dim_method, "diagonal, adagrad or blocking")
        ->check(CLI::IsMember({"diagonal", "adagrad", "blocking"}, CLI::ignore_case))->excludes(config_opt);
    app.add_option("--grafting-type", grafting_type, "none, sgd, adagrad, rmsprop, adam, or a *_normalized variant")
        ->check(CLI::IsMember({"none", "sgd", "adagrad", "rmsprop", "adam", "adagrad_normalized", "rmsprop_normalized",
                               "adam_normalized"}, CLI::ignore_case))->excludes(config_opt);
    app.add_option("--workers-per-group", Config.num_workers_per_group, "Workers sharing the preconditioner work; -1 for the local world size")->excludes(config_opt);
    app.add_flag("--unprotected-eigh", unprotected_eigh, "Fail instead of falling back when a root inversion fails")->excludes(config_opt);
    app.add_option("--max-stale-inversions", Config.max_stale_inversions, "Consecutive stale factor reuses before failing; 0 for unbounded")->excludes(config_opt);
    app.add_flag("--debug", Config.debug_mode, "Log root inverse residuals")->excludes(config_opt);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    if (!config_file.empty()) {
        Config = shampoo::load_shampoo_config(config_file);
    } else {
        Config.large_dim_method = shampoo::large_dim_method_from_str(large_dim_method);
        Config.grafting_type = shampoo::grafting_type_from_str(grafting_type);
        Config.use_bias_correction = !no_bias_correction;
        Config.use_decoupled_weight_decay = !coupled_weight_decay;
        Config.use_merge_dims = !no_merge_dims;
        Config.use_protected_eigh = !unprotected_eigh;
    }
    Config.validate();

    for (const auto& text : ShapeArgs) {
        Shapes.push_back(parse_shape(text));
    }
}

void BenchRunner::run_worker(Communicator* comm, int argc, const char** argv) {
    const int rank = comm ? comm->rank() : 0;
    auto replace_rank = [rank](std::string name) {
        if (auto pos = name.find("%r"); pos != std::string::npos) {
            name.replace(pos, 2, std::to_string(rank));
        }
        return name;
    };

    RunLogger logger(LogFile, rank, static_cast<RunLogger::EVerbosity>(Verbosity));
    logger.log_cmd(argc, argv);

    QuadraticProblem problem(Shapes, Seed);
    shampoo::ParamGroup group;
    for (auto& p : problem.Params) {
        group.Params.push_back(&p);
    }
    shampoo::DistributedShampoo optimizer({group}, Config, comm, &logger);

    if (!LoadSnapshot.empty()) {
        optimizer.load_state_dict(shampoo::load_snapshot(replace_rank(LoadSnapshot)));
        logger.log_message(0, fmt::format("restored optimizer state from {}", replace_rank(LoadSnapshot)));
    }

    for (int step = 1; step <= Steps; ++step) {
        auto start = std::chrono::steady_clock::now();
        std::optional<float> loss = optimizer.step([&problem]() { return problem.evaluate(); });
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        logger.log_step(step, static_cast<int>(duration.count()), loss.value_or(0.f), optimizer.group_options(0).lr);
    }

    if (!SaveSnapshot.empty()) {
        auto section = logger.log_section_start(Steps, "save snapshot");
        shampoo::save_snapshot(optimizer.state_dict(), replace_rank(SaveSnapshot));
    }
}

void BenchRunner::run(int argc, const char** argv) {
    if (Workers == 1) {
        run_worker(nullptr, argc, argv);
        return;
    }
    Communicator::run_communicators(Workers, [&](Communicator& comm) {
        run_worker(&comm, argc, argv);
    });
}

int main(int argc, const char** argv) {
    try {
        BenchRunner runner;
        runner.load_config(argc, argv);
        runner.run(argc, argv);
        return 0;
    } catch (const std::exception& e) {
        ::fprintf(stderr, "ERROR: %s\n", e.what());
        fflush(stderr);
        return EXIT_FAILURE;
    }
}
