// ============================================================================
// json_probe - fetch JSON documents and print the value at a JSON pointer
//
// A `complete` listener parses each body with simdjson. Malformed documents
// and missing pointers are turned into request failures, so they show up
// through the regular `error` event.
//
//   json_probe --pointer /current_user_url https://api.github.com/
// ============================================================================

#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <CLI/CLI.hpp>
#include <simdjson.h>

#include "spindle.hpp"

#include "common/cli/validators.hpp"
#include "common/logger.hpp"

using namespace spindle::core;

namespace {

struct Params {
    std::vector<std::string> urls;
    std::string pointer;
    std::size_t parallelism = 2;
    std::string log_level   = "info";
};

Params configure(int argc, char** argv) {
    CLI::App app{"spindle json_probe: extract a JSON pointer from HTTP responses"};
    Params params{};

    app.add_option("urls", params.urls, "JSON endpoint(s)")->required()
        ->check(spindle::examples::cli::http_url_validator);
    app.add_option("-j,--pointer", params.pointer, "JSON pointer (RFC 6901), empty == whole document")
        ->check(spindle::examples::cli::json_pointer_validator);
    app.add_option("-p,--parallelism", params.parallelism, "Maximum concurrent transfers")
        ->check(CLI::Range(std::size_t{1}, std::size_t{64}))->default_val(params.parallelism);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")
        ->default_val(params.log_level);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    spindle::examples::set_log_level(params.log_level);
    return params;
}

// -----------------------------------------------------------------------------
// JsonProbe - subscriber validating and probing JSON response bodies
// -----------------------------------------------------------------------------
class JsonProbe {
public:
    explicit JsonProbe(std::string pointer)
        : pointer_(std::move(pointer))
    {}

    std::vector<event::Subscription> events() {
        return {
            event::Subscription{std::string(event::names::COMPLETE),
                                [this](event::Event& ev, event::Emitter&) { on_complete_(ev); },
                                event::priority::verify_response},
            event::Subscription{std::string(event::names::ERROR),
                                [](event::Event& ev, event::Emitter&) {
                                    std::cout << "ERR  " << ev.request().url() << "  "
                                              << ev.get_if<event::Error>()->error.what() << '\n';
                                    ev.stop_propagation();
                                }},
        };
    }

private:
    void on_complete_(event::Event& ev) {
        const message::Response& response = *ev.transaction().response();
        if (response.status() >= 400) {
            throw RequestError(ErrorKind::Application,
                               "HTTP " + std::to_string(response.status()) + " " + response.reason());
        }

        simdjson::padded_string json{response.body()};
        simdjson::dom::element root;
        if (auto err = parser_.parse(json).get(root); err) {
            throw RequestError(ErrorKind::Application,
                               std::string("invalid JSON: ") + simdjson::error_message(err));
        }

        simdjson::dom::element value;
        if (auto err = root.at_pointer(pointer_).get(value); err) {
            throw RequestError(ErrorKind::Application,
                               "pointer '" + pointer_ + "' not found: " + simdjson::error_message(err));
        }

        std::cout << "OK   " << ev.request().url() << "  " << simdjson::to_string(value) << '\n';
    }

private:
    std::string pointer_;
    simdjson::dom::parser parser_; // one batch runs on one thread
};

} // namespace

int main(int argc, char** argv) {
    const Params params = configure(argc, argv);

    transport::CurlEngine engine;
    JsonProbe probe{params.pointer};

    std::vector<Transaction> txns;
    txns.reserve(params.urls.size());
    for (const auto& url : params.urls) {
        auto& txn = txns.emplace_back(message::Request{"GET", url, message::Headers{{"Accept", "application/json"}}});
        txn.request().emitter().attach(probe);
    }

    try {
        engine.send_all(txns, params.parallelism);
    } catch (const std::exception& e) {
        SP_FATAL("[PROBE] Batch aborted: " << e.what());
        return 2;
    }
    return 0;
}
