// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <cleave/core/log_level_map.hpp>
#include <cleave/core/result.hpp>
#include <cleave/model/model_json.hpp>
#include <cleave/report/analyze.hpp>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <quill/Quill.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>

int main(int argc, char *argv[])
{
    using namespace cleave;
    namespace fs = std::filesystem;

    CLI::App cli{"cleave"};
    cli.option_defaults()->always_capture_default();

    fs::path model_path{};
    std::optional<fs::path> output_path;
    AnalysisOptions options{};
    bool no_integrity = false;
    bool no_storage_domain = false;
    auto log_level = quill::LogLevel::Info;

    cli.add_option("--model", model_path, "contract model json file")
        ->required();
    cli.add_option(
        "--output", output_path, "report json file, stdout when omitted");
    cli.add_option(
        "--gas-limit",
        options.simulation.gas_limit,
        "gas ceiling for simulated deployments");
    cli.add_option(
        "--max-functions",
        options.partition.max_functions_per_facet,
        "maximum functions per facet");
    cli.add_option(
        "--safe-size",
        options.partition.safe_facet_size,
        "working facet size ceiling in bytes");
    cli.add_option(
        "--namespace-prefix",
        options.simulation.storage.namespace_prefix,
        "prefix of derived storage namespaces");
    cli.add_flag(
        "--no-integrity", no_integrity, "skip simulated codehash checks");
    cli.add_flag(
        "--no-storage-domain",
        no_storage_domain,
        "do not consolidate storage heavy functions into one facet");
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::RequiredError const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    // stdout may carry the report
    auto stderr_handler = quill::stderr_handler();
    stderr_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stderr_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    options.simulation.verify_integrity = !no_integrity;
    options.partition.consolidate_storage = !no_storage_domain;

    auto const model = load_contract_model(model_path);
    if (model.has_error()) {
        LOG_ERROR(
            "failed to load {}: {}",
            model_path.string(),
            model.error().message().c_str());
        quill::flush();
        return 1;
    }

    auto const report = analyze_contract(model.value(), options);
    if (report.has_error()) {
        LOG_ERROR("analysis failed: {}", report.error().message().c_str());
        quill::flush();
        return 1;
    }

    auto const json = report.value().to_json();
    if (output_path.has_value()) {
        std::ofstream out{output_path.value()};
        if (!out) {
            LOG_ERROR("cannot write {}", output_path.value().string());
            quill::flush();
            return 1;
        }
        out << json.dump(2) << '\n';
        LOG_INFO("report written to {}", output_path.value().string());
    }
    else {
        std::cout << json.dump(2) << '\n';
    }
    quill::flush();
    return 0;
}
