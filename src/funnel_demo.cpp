#include <iostream>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>
#include "log.hpp"

using namespace logfunnel;

void print_usage(const char *prog_name)
{
    std::cerr << "Usage: " << prog_name << " [options]\n"
              << "Options:\n"
              << "  -f <file>         Also write to this file\n"
              << "  -n <workers>      Number of worker processes (default: 3)\n"
              << "  -l <level>        Sink level: trace, debug, info, warn, error, fatal (default: info)\n"
              << "  -t                Truncate the file instead of appending\n"
              << "  -h                Show this help\n"
              << "Logger levels can be set with LOGFUNNEL_LEVEL, e.g. LOGFUNNEL_LEVEL=\"debug,worker.*=trace\"\n";
}

int run_worker(int index)
{
    auto &lg = get_logger("worker").child(std::to_string(index));
    lg.debug("starting");

    for (int step = 1; step <= 3; ++step)
    {
        LOG(lg, info).add("step", step) << "working on item " << index * 10 + step;
    }

    if (index == 2)
    {
        try
        {
            throw std::runtime_error("item 23 is corrupt");
        }
        catch (...)
        {
            lg.log_exception(log_level::error, std::current_exception(), "giving up on item {}", 23);
            return 2;
        }
    }

    lg.info("done");
    return 0;
}

int main(int argc, char *argv[])
{
    funnel_config config{.name = "DEMO"};
    int num_workers = 3;

    for (int i = 1; i < argc; i++)
    {
        if (strcmp(argv[i], "-f") == 0 && i + 1 < argc) { config.path = argv[++i]; }
        else if (strcmp(argv[i], "-n") == 0 && i + 1 < argc) { num_workers = std::stoi(argv[++i]); }
        else if (strcmp(argv[i], "-l") == 0 && i + 1 < argc)
        {
            const char *name = argv[++i];
            if (!is_log_level_name(name))
            {
                std::cerr << "Unknown level: " << name << "\n";
                return 1;
            }
            config.level = log_level_from_string(name);
        }
        else if (strcmp(argv[i], "-t") == 0) { config.mode = file_mode::truncate; }
        else if (strcmp(argv[i], "-h") == 0)
        {
            print_usage(argv[0]);
            return 0;
        }
        else
        {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }
    if (config.path) { config.console = true; }

    if (std::getenv("LOGFUNNEL_LEVEL") && !logger_registry::instance().configure_from_env())
    {
        std::cerr << "Ignoring malformed LOGFUNNEL_LEVEL\n";
    }

    log_funnel funnel(config);
    {
        scoped_aggregation session(funnel);

        auto &main_log = get_logger("main");
        main_log.info("launching {} workers from pid {}", num_workers, ::getpid());

        std::vector<std::unique_ptr<worker_process>> workers;
        for (int i = 0; i < num_workers; ++i)
        {
            workers.push_back(process_context::instance().create(run_worker, i));
            workers.back()->start();
        }

        int failures = 0;
        for (auto &w : workers)
        {
            int code = w->join();
            if (code != 0)
            {
                ++failures;
                main_log.warn("worker {} exited with {}", w->pid(), code);
            }
        }

        funnel.sink().info("{} of {} workers succeeded", num_workers - failures, num_workers);
    }

    auto stats = funnel.stats();
    std::cerr << "forwarded=" << stats.forwarded << " below_level=" << stats.below_level << " echoes=" << stats.echoes
              << "\n";
    return 0;
}
