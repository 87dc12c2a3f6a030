#include <algorithm>
#include <exception>
#include <iostream>
#include <thread>

#include "train_frontend.hpp"
#include "wordbpe/config.hpp"
#include "wordbpe/errors.hpp"
#include "wordbpe/formats.hpp"
#include "wordbpe/logging.hpp"
#include "wordbpe/trainer.hpp"
#include "wordbpe/words.hpp"

namespace
{
int run_train(const wordbpe::Config &cfg, const wordbpe::Logger &log)
{
    wordbpe::LogConfig(cfg, log);

    wordbpe::WordCountOptions count_opts;
    count_opts.lowercase = cfg.lowercase;
    count_opts.read.mode = cfg.load_mode;
    auto words = wordbpe::BuildWordFrequencies(cfg.data_dir, count_opts, log);

    wordbpe::TrainerOptions opts;
    opts.num_merges = cfg.num_merges;
    opts.num_threads = cfg.threads;
    opts.log_interval = cfg.log_interval;
    wordbpe::BpeTrainer trainer(opts, log);
    trainer.Fit(words);
    trainer.LogStatistics();

    const auto output_dir = wordbpe::EffectiveOutputDir(cfg);
    try
    {
        trainer.SaveArtifacts(output_dir);
        if (cfg.write_tokenizer_json)
        {
            const auto json_path = output_dir / "tokenizer.json";
            wordbpe::SaveAsTokenizerJson(trainer.artifacts(), json_path);
            log.Info("Saved tokenizer: ", json_path.string());
        }
    }
    catch (const wordbpe::ArtifactIoError &e)
    {
        log.Warn("Failed to save artifacts to ", output_dir.string(), ": ", e.what());
        return 2;
    }

    log.Info("Tokenizer training pipeline complete.");
    return 0;
}
} // namespace

int main(int argc, char **argv)
{
    std::ios::sync_with_stdio(false);

    wordbpe::Config cfg;
    wordbpe::Logger log(std::cerr, wordbpe::LogLevel::kInfo);

    // Explicit flags override the config file, which overrides .env.
    cfg.env_path = detect_arg_value(argc, argv, "--env", cfg.env_path);
    cfg.config_path = detect_arg_value(argc, argv, "--config", cfg.config_path);

    try
    {
        wordbpe::ApplyEnvOverrides(cfg, wordbpe::ReadEnvFile(cfg.env_path), log);
        if (!cfg.config_path.empty() && !wordbpe::LoadConfigFile(cfg, cfg.config_path, log))
        {
            log.Error("Cannot continue without the requested config file.");
            return 1;
        }

        std::string parse_err;
        bool show_help = false;
        if (!parse_train_args(argc, argv, cfg, parse_err, show_help))
        {
            if (show_help)
            {
                print_train_usage();
                return 0;
            }
            std::cerr << parse_err << "\n";
            print_train_usage();
            return 1;
        }

        if (cfg.debug)
        {
            log.SetMinLevel(wordbpe::LogLevel::kDebug);
        }
        if (cfg.threads == 0)
        {
            cfg.threads = std::max<std::size_t>(1, std::thread::hardware_concurrency());
        }
        wordbpe::ValidateConfig(cfg);

        return run_train(cfg, log);
    }
    catch (const std::exception &e)
    {
        log.Error(e.what());
        return 1;
    }
}
