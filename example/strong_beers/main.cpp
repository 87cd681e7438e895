// SPDX-License-Identifier: MIT

// example/strong_beers/main.cpp
//
// Streams every beer above a minimum ABV from a paged listing API to stdout
// as a JSON array. Configuration comes from PAGE_STREAM_* variables; an
// optional first argument overrides the minimum ABV.
//
//   PAGE_STREAM_HOST=localhost PAGE_STREAM_PORT=8080 PAGE_STREAM_TLS=0 strong_beers 12.5
#include <charconv>
#include <csignal>
#include <cstdio>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>

#include <asio.hpp>
#include <fmt/format.h>

#include "lib/stream/paginated_stream.hpp"
#include "src/beer.hpp"
#include "src/beer_json_sink.hpp"
#include "src/beer_page_builder.hpp"
#include "src/config.hpp"
#include "src/http_page_fetcher.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitStreamError = 1;
constexpr int kExitConfigError = 2;
constexpr int kExitInterrupted = 130;

}  // namespace

int main(int argc, char** argv) {
    using namespace page_stream;

    auto config = StreamConfig::FromEnv();
    if (!config) {
        std::fprintf(stderr, "strong_beers: %s\n", config.error().message.c_str());
        return kExitConfigError;
    }
    if (argc > 2) {
        std::fprintf(stderr, "usage: %s [MIN_ABV]\n", argv[0]);
        return kExitConfigError;
    }
    if (argc == 2) {
        std::string_view arg(argv[1]);
        double min_abv = 0.0;
        auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), min_abv);
        if (ec != std::errc{} || ptr != arg.data() + arg.size()) {
            std::fprintf(stderr, "strong_beers: invalid MIN_ABV '%s'\n", argv[1]);
            return kExitConfigError;
        }
        config->min_abv = min_abv;
    }

    const auto& fetcher_config = config->fetcher;
    std::fprintf(stderr, "%s\n",
        fmt::format("strong_beers: {}://{}:{}{} abv > {}",
                    fetcher_config.use_tls ? "https" : "http", fetcher_config.host,
                    fetcher_config.port, fetcher_config.path, config->min_abv).c_str());

    try {
        asio::io_context ctx;
        HttpPageFetcher<BeerPageBuilder> fetcher(config->fetcher);
        PaginatedStream<Beer> stream(fetcher.AsPageFetcher(), AbvAbove(config->min_abv),
                                     config->sequencer);
        BeerJsonSink sink(std::cout);

        // Client gone: no new page request after the current one
        bool interrupted = false;
        asio::signal_set signals(ctx, SIGINT, SIGTERM);
        signals.async_wait([&](const asio::error_code& ec, int signo) {
            if (ec) return;
            std::fprintf(stderr, "strong_beers: signal %d, stopping\n", signo);
            interrupted = true;
            sink.Invalidate();
        });

        std::exception_ptr failure;
        asio::co_spawn(ctx, Drain(stream, sink), [&](std::exception_ptr e) {
            failure = e;
            signals.cancel();
        });
        ctx.run();

        if (failure) std::rethrow_exception(failure);

        if (interrupted) return kExitInterrupted;
        if (const auto& error = sink.error()) {
            std::fprintf(stderr, "strong_beers: %s error: %s\n",
                         std::string(error_category(error->code)).c_str(),
                         error->message.c_str());
            return kExitStreamError;
        }
        std::fprintf(stderr, "strong_beers: %zu beers from %u pages\n",
                     sink.count(), stream.pages_fetched());
        return kExitOk;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "strong_beers: %s\n", e.what());
        return kExitStreamError;
    }
}
