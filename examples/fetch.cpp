// ============================================================================
// fetch - concurrent HTTP fetcher
//
// Sends every URL given on the command line through one transfer engine with
// a bounded number of concurrent transfers, and prints one line per result.
//
//   fetch -p 8 https://example.com/ https://example.org/
//   fetch -X POST -d '{"k":1}' https://httpbin.org/post
// ============================================================================

#include <iostream>
#include <memory>
#include <vector>

#include "spindle.hpp"

#include "common/cli/fetch.hpp"

#include "lcr/format.hpp"

using namespace spindle::core;

int main(int argc, char** argv) {
    const auto params = spindle::examples::cli::fetch::configure(argc, argv,
        "spindle fetch: concurrent HTTP transfers",
        "Failures are reported per URL; the batch always runs to completion.");
    params.dump("Parameters", std::cout);

    transport::CurlEngine::config_type config;
    config.select_timeout = params.select_timeout;

    transport::CurlEngine engine{config};

    std::vector<Transaction> txns;
    txns.reserve(params.urls.size());
    for (const auto& url : params.urls) {
        std::shared_ptr<message::Body> body;
        if (!params.data.empty()) {
            body = std::make_shared<message::StringBody>(params.data);
        }
        txns.emplace_back(message::Request{params.method, url, {}, std::move(body)});
    }

    int failures = 0;
    for (auto& txn : txns) {
        auto& emitter = txn.request().emitter();

        emitter.on(event::names::COMPLETE, [](event::Event& ev, event::Emitter&) {
            const auto& response = *ev.transaction().response();
            const auto& stats = ev.get_if<event::Complete>()->stats;
            std::cout << response.status() << " " << response.reason()
                      << "  " << lcr::format_bytes_scaled(response.body().size())
                      << "  " << lcr::format_seconds(stats.total_time)
                      << "  " << ev.request().url() << '\n';
        });

        emitter.on(event::names::ERROR, [&failures](event::Event& ev, event::Emitter&) {
            ++failures;
            const auto& error = ev.get_if<event::Error>()->error;
            std::cout << "ERR " << to_string(error.kind()) << "  " << error.what() << '\n';
        });
    }

    try {
        engine.send_all(txns, params.parallelism);
    } catch (const std::exception& e) {
        SP_FATAL("[FETCH] Batch aborted: " << e.what());
        return 2;
    }

    if (params.telemetry) {
        engine.telemetry().debug_dump(std::cout);
        transport::telemetry::Pool pool;
        engine.pool()->copy_telemetry_to(pool);
        pool.debug_dump(std::cout);
    }

    return failures == 0 ? 0 : 1;
}
