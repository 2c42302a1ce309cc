#include "commands.hpp"
#include "app_context.hpp"
#include "ingest.hpp"
#include "errors.hpp"
#include <iostream>

namespace semsearch {

int cmd_ingest(const std::string& config_path, const std::vector<std::string>& args) {
    Config cfg = Config::load(config_path);

    std::string input;
    bool json_report = false;
    for (size_t i = 0; i < args.size(); i++) {
        if ((args[i] == "-i" || args[i] == "--input") && i + 1 < args.size()) {
            input = args[++i];
        } else if (args[i] == "--index" && i + 1 < args.size()) {
            cfg.store.index = args[++i];
        } else if (args[i] == "--batch-size" && i + 1 < args.size()) {
            cfg.ingest.batch_size = std::stoi(args[++i]);
        } else if (args[i] == "--strict") {
            cfg.ingest.strict = true;
        } else if (args[i] == "--no-pipeline") {
            cfg.ingest.pipeline_writes = false;
        } else if (args[i] == "--json") {
            json_report = true;
        } else {
            std::cerr << "Unknown ingest option: " << args[i] << "\n";
            return 1;
        }
    }

    if (input.empty()) {
        std::cerr << "Usage: semsearch ingest --input FILE [--index NAME] [--batch-size N] [--strict] [--no-pipeline] [--json]\n";
        return 1;
    }
    if (cfg.ingest.batch_size <= 0) {
        std::cerr << "--batch-size must be > 0\n";
        return 1;
    }

    AppContext ctx;
    try {
        ctx = AppContext::open(cfg);
    } catch (const std::exception& e) {
        std::cerr << "[ingest] Startup failed: " << e.what() << "\n";
        return 1;
    }

    IngestOptions opts;
    opts.batch_size = static_cast<size_t>(cfg.ingest.batch_size);
    opts.index_name = cfg.store.index;
    opts.strict = cfg.ingest.strict;
    opts.pipeline_writes = cfg.ingest.pipeline_writes;

    IngestReport report;
    try {
        SourceReader source(input);
        IngestPipeline pipeline(*ctx.embedder, *ctx.store);
        report = pipeline.run(source, opts);
    } catch (const std::exception& e) {
        std::cerr << "[ingest] Failed: " << e.what() << "\n";
        return 1;
    }

    if (json_report) {
        std::cout << report.to_json().dump(2) << "\n";
    } else {
        std::cout << "Indexed " << report.items_indexed << " questions into '" << opts.index_name << "'"
                  << " (" << report.batches << " batches, " << report.batches_failed << " failed, "
                  << report.answers_filtered << " answers filtered, "
                  << report.malformed_skipped << " malformed lines skipped) in "
                  << static_cast<int>(report.elapsed_ms) << " ms\n";
        std::cout << "Read " << report.lines_read << " lines, " << report.records_read << " records\n";
        for (auto& e : report.errors) std::cout << "  error: " << e << "\n";
    }
    return report.batches_failed == 0 ? 0 : 2;
}

} // namespace semsearch
