#include "train_frontend.hpp"

#include <cstdint>
#include <iostream>
#include <limits>
#include <string>

#include "wordbpe/errors.hpp"

namespace
{
bool parse_u64(const std::string &s, std::uint64_t &out)
{
    if (s.empty() || s[0] == '-')
    {
        return false;
    }
    try
    {
        std::size_t pos = 0;
        std::uint64_t v = static_cast<std::uint64_t>(std::stoull(s, &pos, 10));
        if (pos != s.size())
        {
            return false;
        }
        out = v;
        return true;
    }
    catch (const std::exception &)
    {
        return false;
    }
}

bool parse_size_value(const std::string &s, std::size_t &out)
{
    std::uint64_t v = 0;
    if (!parse_u64(s, v))
    {
        return false;
    }
    if (v > static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max()))
    {
        return false;
    }
    out = static_cast<std::size_t>(v);
    return true;
}
} // namespace

std::string detect_arg_value(int argc, char **argv, const std::string &flag, const std::string &default_value)
{
    std::string value = default_value;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == flag && i + 1 < argc)
        {
            value = argv[i + 1];
            ++i;
        }
    }
    return value;
}

void print_train_usage()
{
    std::cerr << "BPE vocabulary trainer\n"
              << "Usage:\n"
              << "  wordbpe_train [options]\n\n"
              << "Options:\n"
              << "  --env <path>                Path to .env (default: .env)\n"
              << "  --config <path>             YAML config file applied after .env\n"
              << "  --data <dir>                Directory of corpus files (overrides DATA_PATH)\n"
              << "  --base-dir <dir>            Artifacts base directory (default: artifacts)\n"
              << "  --output-dir <dir>          Output directory (default: <base-dir>/data/vocabulary)\n"
              << "  --merges <n>                Merge budget (default: 10000)\n"
              << "  --lowercase / --no-lowercase  Lower-case words before counting (default: off)\n"
              << "  --mode <line|chunk>         Text loading mode (default: line)\n"
              << "  --threads <n>               Pair counting threads (0=auto, default: 1)\n"
              << "  --log-interval <n>          Log every n merges (default: 100)\n"
              << "  --tokenizer-json            Also write tokenizer.json\n"
              << "  --debug                     Enable debug logging\n"
              << "  --help                      Show this help\n";
}

bool parse_train_args(int argc, char **argv, wordbpe::Config &cfg, std::string &err, bool &show_help)
{
    show_help = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto require_value = [&](const std::string &name) -> const char * {
            if (i + 1 >= argc)
            {
                err = "missing value for " + name;
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h")
        {
            show_help = true;
            return false;
        }
        if (arg == "--env" || arg == "--config")
        {
            // Consumed before the env and config files are applied.
            if (!require_value(arg))
            {
                return false;
            }
            continue;
        }
        if (arg == "--data")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            cfg.data_dir = v;
            continue;
        }
        if (arg == "--base-dir")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            cfg.base_dir = v;
            continue;
        }
        if (arg == "--output-dir")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            cfg.output_dir = v;
            continue;
        }
        if (arg == "--merges")
        {
            const char *v = require_value(arg);
            if (!v || !parse_size_value(v, cfg.num_merges) || cfg.num_merges == 0)
            {
                err = "invalid --merges (expected a positive integer)";
                return false;
            }
            continue;
        }
        if (arg == "--lowercase")
        {
            cfg.lowercase = true;
            continue;
        }
        if (arg == "--no-lowercase")
        {
            cfg.lowercase = false;
            continue;
        }
        if (arg == "--mode")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            try
            {
                cfg.load_mode = wordbpe::ParseLoadMode(v);
            }
            catch (const wordbpe::UnsupportedModeError &e)
            {
                err = e.what();
                return false;
            }
            continue;
        }
        if (arg == "--threads")
        {
            const char *v = require_value(arg);
            if (!v || !parse_size_value(v, cfg.threads))
            {
                err = "invalid --threads";
                return false;
            }
            continue;
        }
        if (arg == "--log-interval")
        {
            const char *v = require_value(arg);
            if (!v || !parse_size_value(v, cfg.log_interval))
            {
                err = "invalid --log-interval";
                return false;
            }
            continue;
        }
        if (arg == "--tokenizer-json")
        {
            cfg.write_tokenizer_json = true;
            continue;
        }
        if (arg == "--debug")
        {
            cfg.debug = true;
            continue;
        }

        err = "unknown argument: " + arg;
        return false;
    }

    if (cfg.log_interval == 0)
    {
        cfg.log_interval = 1;
    }
    return true;
}
