#pragma once

#include "config.hpp"
#include "runner.hpp"
#include "sandbox.hpp"
#include "types.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <stop_token>
#include <vector>

namespace tare::cli {

    // Returns an exit code when the process should end without running (help, version, bad usage)
    std::optional<int> parse_cli(int argc, char** argv, run_config& cfg);

    // Fields present in the file override `cfg`; unknown keys are ignored
    void apply_config_file(const std::filesystem::path& path, run_config& cfg);

    void print_config(const run_config& cfg, std::ostream& os);
    void print_operations(const std::vector<operation_spec>& operations, std::ostream& os);
    void print_report(const run_report& report, std::ostream& os);

    /*
     * Parses arguments, runs the selected operations and writes the requested outputs.
     * Returns 0 when every selected operation produced a result, 1 when any failed, 2 on a usage
     * error and 130 when `stop` cancelled the run.
     */
    int execute(
            int argc,
            char** argv,
            const std::vector<operation_spec>& operations,
            const sandbox_factory& factory,
            std::stop_token stop = {});

}  // namespace tare::cli
