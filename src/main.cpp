#include "core/types.hpp"
#include "core/config.hpp"
#include "core/session.hpp"
#include "render/snapshot.hpp"
#include "scene/cartoon_source.hpp"
#include "scene/model.hpp"
#include "scene/obj_loader.hpp"
#include "terminal/input.hpp"
#include "terminal/terminal.hpp"
#include "cli/args.hpp"

#include <cstdio>
#include <iostream>
#include <string>

namespace {

pepterm::StructureCache make_cache(const pepterm::Config& config) {
    if (config.loader.cache_dir.empty()) return pepterm::StructureCache();
    return pepterm::StructureCache(config.loader.cache_dir);
}

int run_cache_command(const pepterm::Args& args, const pepterm::Config& config) {
    pepterm::StructureCache cache = make_cache(config);

    if (args.command == pepterm::Command::CacheClear) {
        size_t removed = 0;
        pepterm::Result r = cache.clear(removed);
        if (r.failure()) {
            std::cerr << "Error: Failed to clear cache: " << r.message << "\n";
            return 1;
        }
        printf("Cleared %zu cached files.\n", removed);
        return 0;
    }

    pepterm::CacheInfo info;
    pepterm::Result r = cache.info(info);
    if (r.failure()) {
        std::cerr << "Error: Failed to get cache info: " << r.message << "\n";
        return 1;
    }
    const double size_mb = static_cast<double>(info.bytes) / 1024.0 / 1024.0;
    printf("Cache directory: %s\n", cache.dir().c_str());
    printf("Files: %zu\n", info.files);
    printf("Total size: %.2f MB\n", size_mb);
    printf("\nUse 'pepterm cache clear' to remove cached files.\n");
    return 0;
}

bool load_config(const pepterm::Args& args, pepterm::Config& config) {
    config = pepterm::Config::defaults();
    if (!args.config_path.empty()) {
        std::string error;
        auto loaded = pepterm::Config::load(args.config_path, &error);
        if (!loaded) {
            std::cerr << "Error: Failed to load config file: " << args.config_path;
            if (!error.empty()) std::cerr << " (" << error << ")";
            std::cerr << "\n";
            return false;
        }
        config = pepterm::merge_config(config, *loaded);
    } else if (auto loaded_default = pepterm::Config::load_default()) {
        config = pepterm::merge_config(config, *loaded_default);
    }
    config = pepterm::apply_cli_overrides(config, args);

    std::string config_error;
    if (!config.validate(config_error)) {
        std::cerr << "Error: Invalid config: " << config_error << "\n";
        return false;
    }
    return true;
}

int run_snapshot(const pepterm::Args& args, pepterm::Config config, const pepterm::Model& model,
                 const pepterm::Terminal& terminal) {
    const pepterm::Size term_size = terminal.get_size();
    const int cols = args.snapshot_cols > 0 ? args.snapshot_cols : term_size.width;
    const int rows = args.snapshot_rows > 0 ? args.snapshot_rows : term_size.height;

    config.render.show_status = false;
    config.input.auto_rotate = false;
    pepterm::RenderSession session(model, config, args.input);
    session.resize(cols, rows);
    session.render_frame();

    pepterm::Result r = pepterm::save_snapshot(args.snapshot_path, session.pipeline(), session.gradient());
    if (r.failure()) {
        std::cerr << "Error: " << r.message << "\n";
        return 1;
    }
    std::cerr << "Snapshot written to " << args.snapshot_path << "\n";
    return 0;
}

int run_interactive(const pepterm::Args& args, const pepterm::Config& config, const pepterm::Model& model,
                    pepterm::Terminal& terminal) {
    if (!terminal.get_info().is_tty) {
        std::cerr << "Error: Interactive view needs a terminal; use --snapshot for headless output\n";
        return 1;
    }

    pepterm::Result r = pepterm::install_signal_handlers();
    if (r.failure()) {
        std::cerr << "Error: " << r.message << "\n";
        return 1;
    }

    r = terminal.enter_interactive(true);
    if (r.failure()) {
        std::cerr << "Error: " << r.message << "\n";
        return 1;
    }

    pepterm::RenderSession session(model, config, args.input);
    pepterm::Result run_result = session.run(terminal);

    r = terminal.restore();
    if (r.failure()) {
        std::cerr << "Warning: " << r.message << "\n";
    }

    if (config.debug.profile_live) {
        pepterm::print_perf_summary(session.run_stats());
    }

    if (run_result.failure()) {
        std::cerr << "Error: " << run_result.message << "\n";
        return 1;
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    pepterm::Args args = pepterm::parse_args(argc, argv);

    if (args.show_help) {
        pepterm::print_help(argv[0]);
        return 0;
    }
    if (args.show_version) {
        pepterm::print_version();
        return 0;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << "\n";
        std::cerr << "Run '" << argv[0] << " --help' for usage.\n";
        return 1;
    }

    pepterm::Config config;
    if (!load_config(args, config)) {
        return 1;
    }

    if (args.command != pepterm::Command::View) {
        return run_cache_command(args, config);
    }

    if (args.input.empty()) {
        std::cerr << "Error: No input specified\n";
        pepterm::print_help(argv[0]);
        return 1;
    }

    std::cerr << "Loading " << args.input;
    if (!args.chain.empty()) std::cerr << " (chain " << args.chain << ")";
    std::cerr << "...\n";

    pepterm::CartoonSource::Options source_opts;
    source_opts.pymol_path = config.loader.pymol_path;
    source_opts.cartoon_sampling = config.loader.cartoon_sampling;
    pepterm::CartoonSource source(source_opts, make_cache(config));

    std::string obj_path;
    pepterm::Result r = source.resolve(args.input, args.chain, obj_path);
    if (r.failure()) {
        std::cerr << "Error: Failed to load " << args.input << ": " << r.message << "\n";
        return 1;
    }

    pepterm::ObjLoadOptions load_opts;
    load_opts.mode = config.loader.primitive_mode;
    load_opts.min_edge_length = config.loader.min_edge_length;
    load_opts.max_edges = static_cast<size_t>(config.loader.max_edges);

    pepterm::Model model;
    r = pepterm::load_obj(obj_path, load_opts, model);
    if (r.failure()) {
        std::cerr << "Error: Failed to load " << obj_path << ": " << r.message << "\n";
        return 1;
    }

    pepterm::Terminal terminal;

    if (!args.snapshot_path.empty()) {
        return run_snapshot(args, config, model, terminal);
    }
    return run_interactive(args, config, model, terminal);
}
