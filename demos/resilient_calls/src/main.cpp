/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

/*
 *   Resilient Calls Demo
 *   Runs scripted scenarios against the mock backend on a real io_scheduler
 *
 *   - burst:       three quick calls, the spinner never shows
 *   - hang:        a call that never answers, the engine times out, recovers and replays it
 *   - transaction: purchases of one family queue behind each other
 *   - fault:       a server fault moves the engine to error until it is acknowledged
 *
 *   ./tether_demo --scenario hang --spinner-ms 500 --popup-ms 1500 --telemetry-console
 */

#include <chrono>
#include <iostream>
#include <string>

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wsuggest-override"
#pragma clang diagnostic ignored "-Wgnu-zero-variadic-macro-arguments"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsuggest-override"
#endif

#include <args.hxx>

#ifdef __clang__
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <coro/io_scheduler.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <demo_collaborators.h>
#include <tether/telemetry/console_telemetry_service.h>
#include <tether/tether.h>
#include <transports/mock_test/backend.h>

using namespace std::chrono_literals;

namespace demo
{
    constexpr tether::function_descriptor get_profile{"get_profile", tether::call_family{1}, false};
    constexpr tether::function_descriptor get_inventory{"get_inventory", tether::call_family{2}, false};
    constexpr tether::function_descriptor get_news{"get_news", tether::call_family{3}, false};
    constexpr tether::function_descriptor buy_item{"buy_item", tether::call_family{10}, true};
    constexpr tether::function_descriptor open_chest{"open_chest", tether::call_family{11}, true};

    void print_separator(const std::string& title)
    {
        std::cout << "\n";
        std::cout << std::string(60, '=') << "\n";
        std::cout << "  " << title << "\n";
        std::cout << std::string(60, '=') << "\n";
    }

    tether::function_response make_response(std::string body, std::string user_data = {})
    {
        tether::function_response response;
        response.body = std::move(body);
        response.user_data = std::move(user_data);
        return response;
    }

    CORO_TASK(void) issue(std::shared_ptr<tether::call_manager> manager,
        tether::function_descriptor descriptor,
        tether::function_parameters parameters,
        tether::spinner_mode mode,
        int& outstanding)
    {
        tether::function_response response;
        auto err = CO_AWAIT manager->call_resilient(descriptor, std::move(parameters), mode, response);
        if (err == tether::error::OK())
            fmt::print("  {} -> '{}'\n", descriptor.name, response.body);
        else
            fmt::print("  {} -> {}\n", descriptor.name, tether::error::to_string(err));
        outstanding--;
    }

    void start(std::shared_ptr<coro::io_scheduler> scheduler,
        std::shared_ptr<tether::call_manager> manager,
        tether::function_descriptor descriptor,
        tether::function_parameters parameters,
        tether::spinner_mode mode,
        int& outstanding)
    {
        if (!scheduler->spawn(issue(manager, descriptor, std::move(parameters), mode, outstanding)))
        {
            TETHER_ERROR("unable to start {}", descriptor.name);
            outstanding--;
        }
    }

    CORO_TASK(void) wait_for_all(std::shared_ptr<tether::i_tick_source> ticks, const int& outstanding)
    {
        while (outstanding > 0)
            CO_AWAIT ticks->next_tick();
    }

    CORO_TASK(void) sleep(std::shared_ptr<tether::i_tick_source> ticks, std::chrono::milliseconds duration)
    {
        auto deadline = ticks->now() + duration;
        while (ticks->now() < deadline)
            CO_AWAIT ticks->next_tick();
    }

    CORO_TASK(bool) run_burst(std::shared_ptr<coro::io_scheduler> scheduler,
        std::shared_ptr<tether::call_manager> manager,
        std::shared_ptr<tether::mock_test::mock_backend> backend,
        std::shared_ptr<tether::i_tick_source> ticks)
    {
        print_separator("BURST: three calls answering in 100ms");
        backend->respond_after("get_profile", 100ms, make_response("alice", "{\"level\":12}"));
        backend->respond_after("get_inventory", 100ms, make_response("sword,shield"));
        backend->respond_after("get_news", 100ms, make_response("double xp weekend"));

        int outstanding = 3;
        start(scheduler, manager, get_profile, {}, tether::spinner_mode::after_timeout, outstanding);
        start(scheduler, manager, get_inventory, {}, tether::spinner_mode::after_timeout, outstanding);
        start(scheduler, manager, get_news, {}, tether::spinner_mode::invisible, outstanding);
        CO_AWAIT wait_for_all(ticks, outstanding);
        CO_AWAIT sleep(ticks, 50ms);
        fmt::print("  state: {}\n", tether::to_string(manager->get_state()));
        CO_RETURN manager->get_state() == tether::manager_state::idle;
    }

    CORO_TASK(bool) run_hang(std::shared_ptr<coro::io_scheduler> scheduler,
        std::shared_ptr<tether::call_manager> manager,
        std::shared_ptr<tether::mock_test::mock_backend> backend,
        std::shared_ptr<tether::i_tick_source> ticks)
    {
        print_separator("HANG: first attempt never answers, replayed after recovery");
        tether::mock_test::mock_backend::behaviour b;
        b.delay = 200ms;
        b.response = make_response("leaderboard page 1");
        b.hang_attempts = 1;
        backend->set_behaviour("get_news", b);

        int outstanding = 1;
        start(scheduler, manager, get_news, {{"page", "1"}}, tether::spinner_mode::after_timeout, outstanding);
        CO_AWAIT wait_for_all(ticks, outstanding);
        fmt::print("  attempts: {}\n", backend->get_attempts("get_news"));
        CO_RETURN backend->get_attempts("get_news") == 2;
    }

    CORO_TASK(bool) run_transaction(std::shared_ptr<coro::io_scheduler> scheduler,
        std::shared_ptr<tether::call_manager> manager,
        std::shared_ptr<tether::mock_test::mock_backend> backend,
        std::shared_ptr<tether::i_tick_source> ticks)
    {
        print_separator("TRANSACTION: purchases queue per family");
        backend->respond_after("buy_item", 300ms, make_response("purchased"));
        backend->respond_after("open_chest", 300ms, make_response("3 gems"));

        int outstanding = 4;
        for (auto item : {"potion", "elixir", "scroll"})
            start(scheduler, manager, buy_item, {{"item", item}}, tether::spinner_mode::instant, outstanding);
        start(scheduler, manager, open_chest, {{"chest", "gold"}}, tether::spinner_mode::instant, outstanding);
        CO_AWAIT wait_for_all(ticks, outstanding);
        fmt::print("  buy_item max concurrency: {}\n", backend->get_max_in_flight("buy_item"));
        CO_RETURN backend->get_max_in_flight("buy_item") == 1;
    }

    CORO_TASK(bool) run_fault(std::shared_ptr<coro::io_scheduler> scheduler,
        std::shared_ptr<tether::call_manager> manager,
        std::shared_ptr<tether::mock_test::mock_backend> backend,
        std::shared_ptr<tether::i_tick_source> ticks)
    {
        print_separator("FAULT: the server rejects a call");
        backend->fault_after("get_inventory", 150ms, tether::error::TRANSPORT_ERROR(), "inventory corrupted");

        int outstanding = 1;
        start(scheduler, manager, get_inventory, {}, tether::spinner_mode::instant, outstanding);
        CO_AWAIT wait_for_all(ticks, outstanding);
        fmt::print("  state: {}\n", tether::to_string(manager->get_state()));
        bool faulted = manager->get_state() == tether::manager_state::error;

        manager->acknowledge_error();
        fmt::print("  state after acknowledge: {}\n", tether::to_string(manager->get_state()));
        CO_RETURN faulted && manager->get_state() == tether::manager_state::idle;
    }

    CORO_TASK(void) demo_task(std::shared_ptr<coro::io_scheduler> scheduler,
        std::shared_ptr<tether::call_manager> manager,
        std::shared_ptr<tether::mock_test::mock_backend> backend,
        std::shared_ptr<tether::i_tick_source> ticks,
        std::string scenario,
        bool* result,
        bool* completed)
    {
        bool ok = true;
        if (scenario == "all" || scenario == "burst")
            ok = CO_AWAIT run_burst(scheduler, manager, backend, ticks) && ok;
        if (scenario == "all" || scenario == "hang")
            ok = CO_AWAIT run_hang(scheduler, manager, backend, ticks) && ok;
        if (scenario == "all" || scenario == "transaction")
            ok = CO_AWAIT run_transaction(scheduler, manager, backend, ticks) && ok;
        if (scenario == "all" || scenario == "fault")
            ok = CO_AWAIT run_fault(scheduler, manager, backend, ticks) && ok;

        manager->shutdown();
        *result = ok;
        *completed = true;
    }
}

int main(int argc, char* argv[])
{
    args::ArgumentParser parser("tether demo - resilient remote calls against a scripted backend");
    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});
    args::ValueFlag<std::string> scenario(
        parser, "scenario", "all, burst, hang, transaction or fault", {"scenario"}, "all");
    args::ValueFlag<int> spinner_ms(parser, "ms", "spinner deadline in milliseconds", {"spinner-ms"}, 500);
    args::ValueFlag<int> popup_ms(parser, "ms", "popup deadline in milliseconds", {"popup-ms"}, 1500);
    args::ValueFlag<int> resolve_ms(parser, "ms", "simulated reconnection time", {"resolve-ms"}, 300);
    args::ValueFlag<int> tick_ms(parser, "ms", "tick resolution", {"tick-ms"}, 10);
    args::Flag telemetry_console(parser, "telemetry-console", "print engine telemetry", {"telemetry-console"});
    args::ValueFlag<std::string> log_level(
        parser, "level", "spdlog level: trace, debug, info, warn, err, critical, off", {"log-level"}, "info");

    try
    {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&)
    {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e)
    {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    auto settings = std::make_shared<tether::static_timeout_settings>();
    if (!settings->set_spinner_timeout(std::chrono::milliseconds(args::get(spinner_ms)))
        || !settings->set_popup_timeout(std::chrono::milliseconds(args::get(popup_ms))))
    {
        std::cerr << "deadlines must be positive" << std::endl;
        return 1;
    }

    int level = TETHER_LEVEL_INFO;
    if (!tether::parse_log_level(args::get(log_level), level))
    {
        std::cerr << "unknown log level '" << args::get(log_level) << "'" << std::endl;
        std::cerr << parser;
        return 1;
    }
    spdlog::set_level(static_cast<spdlog::level::level_enum>(level));
    tether::set_logger(spdlog::default_logger());

    auto scheduler = coro::io_scheduler::make_shared(
        coro::io_scheduler::options{.thread_strategy = coro::io_scheduler::thread_strategy_t::manual,
            .pool = coro::thread_pool::options{
                .thread_count = 1,
            },
            .execution_strategy = coro::io_scheduler::execution_strategy_t::process_tasks_inline});

    auto ticks
        = std::make_shared<tether::scheduler_tick_source>(scheduler, std::chrono::milliseconds(args::get(tick_ms)));
    auto backend = std::make_shared<tether::mock_test::mock_backend>(ticks);

    tether::call_manager::options opts;
    opts.transport = backend;
    opts.connectivity_resolver
        = std::make_shared<demo::simulated_resolver>(ticks, std::chrono::milliseconds(args::get(resolve_ms)));
    opts.settings = settings;
    opts.ticks = ticks;
    opts.spinner = std::make_shared<demo::console_spinner>(ticks);
    opts.user_data = std::make_shared<demo::logging_user_data_sink>();
    opts.resources = std::make_shared<demo::logging_resource_sink>();
    if (telemetry_console)
    {
        std::shared_ptr<tether::i_telemetry_service> telemetry;
        if (tether::console_telemetry_service::create(telemetry, "", "", {}))
            opts.telemetry = telemetry;
    }

    auto manager = tether::call_manager::create(scheduler, opts);
    auto err = manager->init();
    if (err != tether::error::OK())
    {
        std::cerr << "unable to start the call manager: " << tether::error::to_string(err) << std::endl;
        return 1;
    }

    bool result = false;
    bool completed = false;
    if (!scheduler->spawn(
            demo::demo_task(scheduler, manager, backend, ticks, args::get(scenario), &result, &completed)))
    {
        std::cerr << "unable to start the demo" << std::endl;
        return 1;
    }

    while (!completed)
    {
        scheduler->process_events(std::chrono::milliseconds(1));
    }
    // let aborted invocations unwind
    for (int i = 0; i < 10; i++)
        scheduler->process_events(ticks->get_resolution());

    std::cout << (result ? "\ndemo completed\n" : "\ndemo finished with unexpected results\n");
    return result ? 0 : 1;
}
