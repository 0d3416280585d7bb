#include "compose/compose.hpp"
#include "compose/log.hpp"

namespace compose {

void run(const Options& opts){
    const auto config = with_context("failed to read config", [&]{ return load_config(find_config(opts.in_path)); });

    if(!opts.no_process)
        with_context("failed to process entries", [&]{ process_entries(opts.in_path, opts.out_path, config); });
    else
        debug_log("run", "copy skipped (--no-process)");

    with_context("failed to prune entries", [&]{ prune_entries(opts.out_path, make_spare_set(config, opts.spare)); });

    with_context("failed to write root Cargo.toml", [&]{ write_workspace_manifest(opts.out_path, config, opts.add_tools); });
}

} // namespace compose
