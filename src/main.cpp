#include <config/config.hpp>
#include <orchestrator/orchestrator.hpp>
#include <process/process_runner.hpp>
#include <reporting/default_report_renderer.hpp>
#include <reporting/report_engine.hpp>
#include <upload/pipeline.hpp>
#include <util/sleeper.hpp>
#include <workflow/engine.hpp>

#include <cxxopts.hpp>
#include <di.hpp>
#include <fmt/format.h>

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <string>

using rep_renderer_t    = DefaultReportRenderer;
using reporting_t       = ReportEngine<rep_renderer_t>;
using process_runner_t  = ProcessRunner;
using sleeper_t         = util::ThreadSleeper;
using workflow_engine_t = WorkflowEngine<process_runner_t, sleeper_t, reporting_t>;
using upload_pipeline_t = UploadPipeline<reporting_t>;
using orchestrator_t    = Orchestrator<workflow_engine_t, upload_pipeline_t, reporting_t>;

void usage(std::string msg) {
    fmt::print("{}\n", msg);
    exit(EXIT_SUCCESS);
}

auto parse_options(int argc, char **argv) {
    // clang-format off
    cxxopts::Options options("opsrunner", "Local automation runner for workflows and uploads");
    options.add_options()
      ("c,config", "Path to the configuration file", cxxopts::value<std::string>()->default_value("config.yaml"))
      ("w,workflow", "Workflow definition to execute", cxxopts::value<std::string>())
      ("u,upload", "File to process through the upload pipeline", cxxopts::value<std::string>())
      ("l,list", "List the workflow definitions found in the workflow directory")
      ("v,verbose", "Level of output verbosity, overrides logging.log_level", cxxopts::value<uint16_t>())
      ("h,help", "Print help message and exit")
    ;
    // clang-format on

    auto result = options.parse(argc, argv);
    if(result["help"].as<bool>())
        usage(options.help());

    return result;
}

void print_workflows(workflow_engine_t &engine) {
    auto const workflows = engine.list_workflows();
    if(workflows.empty()) {
        fmt::print("no workflow definitions in {}\n", engine.config().workflow_dir.string());
        return;
    }

    for(auto const &workflow : workflows) {
        fmt::print("{}  {} (version: {}, {} steps, priority: {})\n",
            util::to_string(workflow.id), workflow.name, workflow.version, workflow.steps.size(), to_string(workflow.metadata.priority));
    }
}

int main(int argc, char **argv) try {
    auto result = parse_options(argc, argv);
    auto config = Config::load(result["config"].as<std::string>());

    auto verbose = result.count("verbose")
        ? result["verbose"].as<uint16_t>()
        : verbosity_from_level(config.logging.log_level);

    rep_renderer_t renderer{ verbose, config.logging.enable_console, config.logging.log_file };
    auto reporting_deps = di::Deps<rep_renderer_t>{ renderer };
    reporting_t reporting{ reporting_deps, true };

    di::Deps<reporting_t> base_deps{ reporting };

    process_runner_t process_runner{};
    sleeper_t sleeper{};

    auto engine_deps = di::combine(base_deps, di::Deps<process_runner_t, sleeper_t>{ process_runner, sleeper });
    workflow_engine_t engine{ engine_deps, config.workflow };
    upload_pipeline_t pipeline{ base_deps, config.upload };

    if(result.count("list"))
        print_workflows(engine);

    auto orchestrator_deps = di::combine(base_deps, di::Deps<workflow_engine_t, upload_pipeline_t>{ engine, pipeline });
    orchestrator_t orchestrator{ orchestrator_deps, config.workflow, config.upload };

    if(result.count("workflow")) {
        auto submission = orchestrator.submit_workflow(result["workflow"].as<std::string>());
        auto execution  = submission.result.get();
        fmt::print("execution {} {}\n", util::to_string(execution.id), to_string(execution.status));
    }

    if(result.count("upload")) {
        auto submission = orchestrator.submit_upload(result["upload"].as<std::string>());
        auto info       = submission.result.get();
        fmt::print("upload {} {} -> {}\n", util::to_string(info.id), to_string(info.processing_status), info.processed_path.string());
    }

    return EXIT_SUCCESS;
} catch(std::exception const &e) {
    fmt::print("{}\n", e.what());
    return EXIT_FAILURE;
}
