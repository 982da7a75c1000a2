//! # ordo-demo
//!
//! Runs a few suites concurrently and prints the ordered event stream.
//!
//! ```text
//! ordo-demo [-v|-vv|-vvv] [--log-level=LEVEL] [--config=PATH]
//! ```
//!
//! Settings come from `ordo.toml` in the working directory (or `--config`),
//! then from the `ORDO_*` environment variables.

#include "events/event.hpp"
#include "exec/run.hpp"
#include "exec/run_config.hpp"
#include "exec/suite.hpp"
#include "log/log.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

using namespace ordo;

namespace {

void sleep_ms(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

auto build_suites() -> std::vector<Rc<exec::Suite>> {
    auto calc = make_rc<exec::FunctionSuite>("Calc");
    calc->test("add",
               [](exec::TestContext& ctx) {
                   sleep_ms(40);
                   ctx.info("2 + 2 = 4");
                   if (2 + 2 != 4) {
                       throw std::runtime_error("addition is broken");
                   }
               })
        .test("sub", [](exec::TestContext&) {
            if (5 - 3 != 2) {
                throw std::runtime_error("subtraction is broken");
            }
        });

    auto parser = make_rc<exec::FunctionSuite>("Parser");
    parser->note("parser fixtures loaded")
        .scope("numbers",
               [](exec::FunctionSuite& s) {
                   s.test("integers", [](exec::TestContext&) { sleep_ms(20); })
                       .test("floats", [](exec::TestContext& ctx) {
                           ctx.markup("*1.5* parsed as `double`");
                       });
               })
        .scope("strings",
               [](exec::FunctionSuite& s) {
                   s.test("escapes", [](exec::TestContext&) { throw exec::PendingTest(); })
                       .ignore("unicode");
               })
        .test("rejects garbage", [](exec::TestContext&) {
            throw std::runtime_error("accepted \"1..2\"");
        });

    auto storage = make_rc<exec::FunctionSuite>("Storage");
    auto memory = make_rc<exec::FunctionSuite>("Memory");
    memory->test("put", [](exec::TestContext&) { sleep_ms(30); })
        .test("get", [](exec::TestContext&) {});
    auto disk = make_rc<exec::FunctionSuite>("Disk");
    disk->test("write", [](exec::TestContext&) {
        throw exec::CanceledTest("no writable temp directory");
    });
    storage->nest(memory).nest(disk).on_before_all([] { sleep_ms(5); });

    return {calc, parser, storage};
}

} // namespace

int main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));
    log::set_thread_name("main");

    std::string config_path = "ordo.toml";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.starts_with("--config=")) {
            config_path = arg.substr(9);
        }
    }

    auto loaded = exec::load_run_config(config_path);
    if (is_err(loaded)) {
        std::cerr << "error: " << unwrap_err(loaded).to_string() << "\n";
        return 2;
    }
    auto overridden = exec::apply_env_overrides(unwrap(loaded));
    if (is_err(overridden)) {
        std::cerr << "error: " << unwrap_err(overridden).to_string() << "\n";
        return 2;
    }
    auto config = exec::validate(unwrap(overridden));
    if (is_err(config)) {
        std::cerr << "error: " << unwrap_err(config).to_string() << "\n";
        return 2;
    }

    auto created = exec::Run::create(unwrap(config), [](const events::EventRecord& event) {
        std::cout << events::to_string(event) << "\n";
    });
    if (is_err(created)) {
        std::cerr << "error: " << unwrap_err(created).to_string() << "\n";
        return 1;
    }
    auto& run = unwrap(created);

    auto result = run->execute(build_suites());
    if (is_err(result)) {
        std::cerr << "error: " << unwrap_err(result).to_string() << "\n";
        return 1;
    }

    const auto& summary = unwrap(result);
    std::cout << "\n"
              << summary.suites_started << " suites, " << summary.tests_total() << " tests: "
              << summary.tests_succeeded << " succeeded, " << summary.tests_failed << " failed, "
              << summary.tests_ignored << " ignored, " << summary.tests_pending << " pending, "
              << summary.tests_canceled << " canceled (" << summary.duration_ms << "ms)\n";
    log::Logger::instance().flush();
    return summary.tests_failed == 0 ? 0 : 1;
}
