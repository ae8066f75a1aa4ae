#include "itemstream/cat_command.hpp"

#include "itemstream/checkpoint_store.hpp"
#include "itemstream/checkpointed_reader.hpp"
#include "itemstream/errors.hpp"
#include "itemstream/line_source.hpp"
#include "itemstream/logger.hpp"
#include "itemstream/signals.hpp"
#include "itemstream/tar_entry_source.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <memory>
#include <optional>
#include <string>

namespace itemstream {

namespace {

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "  %s -i <input|-> [-s <state.json>] [-n <name>] [-c <items>] [-l <items>]\n"
        "     [--tar] [--no-state] [--reset] [-v]\n"
        "\n"
        "Prints the items of <input> to stdout and records the position in the\n"
        "state file, so that the next run continues where this one stopped.\n"
        "\n"
        "Options:\n"
        "  -i, --input               Input file path or '-' for stdin (.gz is inflated)\n"
        "  -s, --state               JSON state file (default: none, nothing persisted)\n"
        "  -n, --name                Stream name used for state keys (default \"items\")\n"
        "  -c, --checkpoint-every    Items between checkpoints (default 100)\n"
        "  -l, --limit               Stop after this many items in this run\n"
        "      --tar                 Items are the regular files of an archive\n"
        "      --no-state            Do not write the position\n"
        "      --reset               Delete the state file before starting\n"
        "  -v, --verbose             Debug logging\n"
        "  -h, --help                Show this help\n",
        argv);
}

bool ParseCount(const char *arg, std::uint64_t &out) {
    char *end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(arg, &end, 10);
    if (errno != 0 || !end || *end != '\0' || *arg == '\0' || *arg == '-') return false;
    out = static_cast<std::uint64_t>(v);
    return true;
}

struct CliOptions {
    const char *input = nullptr;
    const char *state = nullptr;
    std::string name = "items";
    std::uint64_t checkpoint_every = 100;
    std::optional<std::uint64_t> limit;
    bool tar = false;
    bool persist = true;
    bool reset = false;
};

void PrintItem(std::FILE *out, const std::string &line) {
    std::fwrite(line.data(), 1, line.size(), out);
    std::fputc('\n', out);
}

void PrintItem(std::FILE *out, const TarEntry &entry) {
    std::fprintf(out, "%s\t%llu\n", entry.path.c_str(), (unsigned long long)entry.size);
}

bool Cancelled() {
    return g_cancel.load(std::memory_order_relaxed);
}

template <typename T>
void Run(std::unique_ptr<ISource<T>> source, const CliOptions &cli, std::FILE *out) {
    std::optional<CheckpointStore> store;
    if (cli.state) store.emplace(cli.state);

    if (store && cli.reset) {
        store->Clear();
        LogInfo("State file %s cleared", store->Path().c_str());
    }

    CheckpointContext ctx = store ? store->Load() : CheckpointContext{};

    ReaderOptions opt;
    opt.stream_name = cli.name;
    opt.persist_enabled = cli.persist && store.has_value();
    opt.max_item_count = cli.limit;

    CheckpointedReader<T> reader(std::move(source), opt);
    reader.Open(ctx);
    const std::uint64_t start = reader.ItemsRead();

    auto checkpoint = [&] {
        reader.Checkpoint(ctx);
        if (store && ctx.IsDirty()) store->Save(ctx);
    };

    std::uint64_t since_checkpoint = 0;
    while (!Cancelled()) {
        std::optional<T> item;
        try {
            item = reader.Read();
        } catch (const SourceError &) {
            if (!Cancelled()) throw;
            // The interrupted attempt is counted; keep the last checkpoint.
            LogInfo("[%s] interrupted while reading, position stays at the last checkpoint",
                    cli.name.c_str());
            reader.Close(ctx);
            return;
        }
        if (!item) break;
        PrintItem(out, *item);

        if (cli.checkpoint_every > 0 && ++since_checkpoint >= cli.checkpoint_every) {
            std::fflush(out);
            checkpoint();
            since_checkpoint = 0;
        }
    }

    std::fflush(out);
    checkpoint();

    const std::uint64_t position = reader.ItemsRead();
    reader.Close(ctx);

    if (Cancelled()) {
        LogInfo("[%s] interrupted at item %llu", cli.name.c_str(), (unsigned long long)position);
    }
    LogSuccess("[%s] %llu items this run, position %llu", cli.name.c_str(),
               (unsigned long long)(position - start), (unsigned long long)position);
}

} // namespace

int RunCatCommand(int argc, char **argv, std::FILE *out) {
    CliOptions cli;

    static option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"state", required_argument, nullptr, 's'},
        {"name", required_argument, nullptr, 'n'},
        {"checkpoint-every", required_argument, nullptr, 'c'},
        {"limit", required_argument, nullptr, 'l'},
        {"tar", no_argument, nullptr, 1000},
        {"no-state", no_argument, nullptr, 1001},
        {"reset", no_argument, nullptr, 1002},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    // Full getopt re-initialisation; the command may run more than once per process.
    optind = 0;

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hvi:s:n:c:l:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'v':
                SetVerbose(true);
                break;

            case 'i':
                cli.input = optarg;
                break;

            case 's':
                cli.state = optarg;
                break;

            case 'n':
                cli.name = optarg;
                break;

            case 'c':
                if (!ParseCount(optarg, cli.checkpoint_every)) {
                    std::fprintf(stderr, "Invalid --checkpoint-every: %s\n", optarg);
                    return 2;
                }
                break;

            case 'l': {
                std::uint64_t v = 0;
                if (!ParseCount(optarg, v)) {
                    std::fprintf(stderr, "Invalid --limit: %s\n", optarg);
                    return 2;
                }
                cli.limit = v;
                break;
            }

            case 1000:
                cli.tar = true;
                break;

            case 1001:
                cli.persist = false;
                break;

            case 1002:
                cli.reset = true;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (!cli.input || cli.name.empty()) {
        PrintUsage(argv[0]);
        return 2;
    }

    try {
        if (cli.tar) {
            Run<TarEntry>(std::make_unique<TarEntrySource>(cli.input), cli, out);
        } else {
            Run<std::string>(std::make_unique<LineSource>(cli.input), cli, out);
        }
    } catch (const std::exception &e) {
        LogError("%s", DescribeError(e).c_str());
        return 1;
    }

    return 0;
}

} // namespace itemstream
