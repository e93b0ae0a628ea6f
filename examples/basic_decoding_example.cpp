/**
 * @file basic_decoding_example.cpp
 * @brief Decoding a service configuration file into typed structures
 *
 * This example shows how to load a YAML or JSON document and decode it.
 * It demonstrates:
 *
 * - Constructor-style (product) decoders with defaults and overloads
 * - Setter-style (bean) decoders
 * - User-defined decoders built with map()
 * - Optional values and fallbacks
 * - Error reporting with full paths
 *
 * Usage: configs_basic_example [config-file]
 * Without an argument an embedded sample document is used.
 */

#include <configs/common/debug.hpp>
#include <configs/configs.hpp>
#include <configs/loader/tree_loader.hpp>

#include <chrono>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace configs;
using namespace configs::decoder;
using namespace std::chrono_literals;
namespace debug = configs::common::debug;

namespace {

const char* const SAMPLE = R"(
service:
  name: inventory
  listen: {host: 0.0.0.0, port: 8080}
  upstreams:
    - {host: db.internal, port: 5432, scheme: postgres}
    - {host: cache.internal, port: 6379}
  request-timeout: 2s
  log-level: debug
limits.max-connections: 512
)";

enum class Scheme { HTTP, HTTPS, POSTGRES };

struct Endpoint {
    std::string host;
    int port;
    Scheme scheme;
};

struct Limits {
    int max_connections = 128;
    std::optional<int> max_body_kb;
};

struct Service {
    std::string name;
    Endpoint listen;
    std::vector<Endpoint> upstreams;
    std::chrono::milliseconds request_timeout;
    debug::LogLevel log_level;
};

Scheme parse_scheme(const std::string& text) {
    if (text == "http") return Scheme::HTTP;
    if (text == "https") return Scheme::HTTPS;
    if (text == "postgres") return Scheme::POSTGRES;
    throw std::invalid_argument("unknown scheme '" + text + "'");
}

const char* scheme_name(Scheme scheme) {
    switch (scheme) {
        case Scheme::HTTP:
            return "http";
        case Scheme::HTTPS:
            return "https";
        case Scheme::POSTGRES:
            return "postgres";
    }
    return "?";
}

}  // namespace

template<>
struct configs::decoder::DecoderTraits<Scheme> {
    static Decoder<Scheme> make() { return decoder_of<std::string>().map(&parse_scheme); }
};

template<>
struct configs::decoder::DecoderTraits<debug::LogLevel> {
    static Decoder<debug::LogLevel> make() {
        return decoder_of<std::string>().map(
            [](const std::string& name) { return debug::parse_log_level(name); });
    }
};

template<>
struct configs::decoder::DecoderTraits<Endpoint> {
    static Decoder<Endpoint> make() {
        return ProductDecoderBuilder<Endpoint>("Endpoint")
            .primary(factory<Endpoint>(
                [](std::string host, int port, Scheme scheme) {
                    return Endpoint{std::move(host), port, scheme};
                },
                param<std::string>("host"), param<int>("port"),
                param<Scheme>("scheme").with_default(Scheme::HTTP)))
            .secondary(factory<Endpoint>(
                [](std::string url) {
                    auto colon = url.rfind(':');
                    if (colon == std::string::npos) {
                        throw std::invalid_argument("missing port in '" + url + "'");
                    }
                    return Endpoint{url.substr(0, colon), std::stoi(url.substr(colon + 1)),
                                    Scheme::HTTP};
                },
                param<std::string>("address")))
            .build();
    }
};

template<>
struct configs::decoder::DecoderTraits<Limits> {
    static Decoder<Limits> make() {
        return BeanDecoderBuilder<Limits>("Limits")
            .property("maxConnections", &Limits::max_connections)
            .property("maxBodyKb", &Limits::max_body_kb)
            .build();
    }
};

template<>
struct configs::decoder::DecoderTraits<Service> {
    static Decoder<Service> make() {
        return ProductDecoderBuilder<Service>("Service")
            .primary(factory<Service>(
                [](std::string name, Endpoint listen, std::vector<Endpoint> upstreams,
                   std::chrono::milliseconds timeout, debug::LogLevel level) {
                    return Service{std::move(name), std::move(listen), std::move(upstreams),
                                   timeout, level};
                },
                param<std::string>("name"), param<Endpoint>("listen"),
                param<std::vector<Endpoint>>("upstreams").with_default({}),
                param<std::chrono::milliseconds>("requestTimeout").with_default(5s),
                param<debug::LogLevel>("logLevel").with_default(debug::LogLevel::INFO)))
            .build();
    }
};

int main(int argc, char* argv[]) {
    debug::init_logging_from_env(debug::LogLevel::INFO);

    auto tree_loader = loader::create_tree_loader();
    auto tree        = argc > 1 ? tree_loader->load(argv[1]) : tree_loader->parse(SAMPLE);
    if (tree.is_failure()) {
        std::cerr << tree.error().to_string() << std::endl;
        return 1;
    }

    auto service = get<Service>(tree.value(), "service");
    if (service.is_failure()) {
        std::cerr << "Invalid configuration:\n" << service.error().to_string() << std::endl;
        return 1;
    }

    const auto& s = service.value();
    debug::init_logging(s.log_level);
    CONFIGS_LOG_INFO(debug::category::GENERAL,
                     "Service '" << s.name << "' listening on " << s.listen.host << ':'
                                 << s.listen.port);

    for (const auto& upstream : s.upstreams) {
        std::cout << "  upstream " << scheme_name(upstream.scheme) << "://" << upstream.host
                  << ':' << upstream.port << '\n';
    }
    std::cout << "  request timeout " << s.request_timeout.count() << " ms\n";

    auto limits = get_or_else<Limits>(tree.value(), "limits", Limits{});
    if (limits.is_failure()) {
        std::cerr << limits.error().to_string() << std::endl;
        return 1;
    }
    std::cout << "  max connections " << limits.value().max_connections << '\n';
    if (auto body = limits.value().max_body_kb) {
        std::cout << "  max body " << *body << " KiB\n";
    }

    // A value that fails to decode is reported with its full path
    auto bad = get<int>(tree.value(), "service.name");
    if (bad.is_failure()) {
        CONFIGS_LOG_DEBUG(debug::category::GENERAL, "Expected failure: " << bad.error().to_string());
    }

    debug::shutdown_logging();
    return 0;
}
