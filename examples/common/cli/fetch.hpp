#pragma once

#include <cstdlib>
#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "common/logger.hpp"

namespace spindle::examples::cli::fetch {

struct Params {
    std::vector<std::string> urls;
    std::size_t parallelism      = 4;
    std::string method           = "GET";
    std::string data;              // request body (POST/PUT), empty == none
    std::optional<double> select_timeout;
    std::string log_level        = "info";
    bool telemetry               = false;

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n  URLs        : ";
        for (const auto& u : urls) {
            os << u << " ";
        }
        os << "\n  Parallelism : " << parallelism
           << "\n  Method      : " << method
           << "\n  Body bytes  : " << data.size()
           << "\n  Log Level   : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description, std::string_view footer) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("urls", params.urls, "URL(s) to fetch")->required()->check(http_url_validator);
    app.add_option("-p,--parallelism", params.parallelism, "Maximum concurrent transfers")
        ->check(CLI::Range(std::size_t{1}, std::size_t{256}))->default_val(params.parallelism);
    app.add_option("-X,--method", params.method, "HTTP method")->default_val(params.method);
    app.add_option("-d,--data", params.data, "Request body sent with every request");
    app.add_option("--select-timeout", params.select_timeout, "Seconds to block waiting for activity")
        ->check(CLI::NonNegativeNumber);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")
        ->default_val(params.log_level);
    app.add_flag("--telemetry", params.telemetry, "Dump engine telemetry on exit");

    app.footer(std::string(footer));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    set_log_level(params.log_level);
    return params;
}

} // namespace spindle::examples::cli::fetch
