#include <charconv>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "fmt/format.h"

#include "json_export.hpp"
#include "search_target.hpp"
#include "ssdp_discovery.hpp"

// The library default of 0 ms would end the search right after sending it
#define DEFAULT_TIMEOUT 2000

struct cli_options
{
    discovery::config cfg;
    std::string st {discovery::to_string(discovery::search_target::all)};
    bool devices = false;
    bool json_output = false;
    bool help = false;
};

static void print_usage(const char* prog)
{
    fmt::print(
        "Usage: {} [options]\n"
        "Sends an SSDP M-SEARCH request and lists the devices that answer.\n\n"
        "  -p, --port <n>          port to send to and listen on (default {})\n"
        "  -b, --broadcast <addr>  multicast address of the request (default {})\n"
        "  -t, --timeout <ms>      how long to wait for responses (default {})\n"
        "  -s, --st <target>       search target (default ssdp:all)\n"
        "  -d, --devices           fetch the description of every device found\n"
        "  -j, --json              print the results as json\n"
        "  -v, --verbose           trace requests and responses on stderr\n"
        "  -h, --help              show this text\n",
        prog, DISCOVERY_PORT, DISCOVERY_IP, DEFAULT_TIMEOUT);
}

static int parse_int(std::string_view flag, std::string_view value, int min, int max)
{
    int parsed = 0;
    auto res = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if(value.empty() || res.ec != std::errc {} || res.ptr != value.data() + value.size() || parsed < min || parsed > max)
        throw std::invalid_argument {fmt::format("invalid value '{}' for {}", value, flag)};
    return parsed;
}

static cli_options parse_args(int argc, char** argv)
{
    cli_options opts;
    opts.cfg.with_timeout(DEFAULT_TIMEOUT);

    for(int i = 1; i < argc; i++)
    {
        std::string_view arg {argv[i]};
        auto next_value = [&]() -> std::string_view {
            if(i + 1 >= argc)
                throw std::invalid_argument {fmt::format("missing value for {}", arg)};
            return argv[++i];
        };

        if(arg == "-p" || arg == "--port")
            opts.cfg.with_port(static_cast<uint16_t>(parse_int(arg, next_value(), 1, 65535)));
        else if(arg == "-b" || arg == "--broadcast")
            opts.cfg.with_broadcast(std::string {next_value()});
        else if(arg == "-t" || arg == "--timeout")
            opts.cfg.with_timeout(parse_int(arg, next_value(), 0, 3600 * 1000));
        else if(arg == "-s" || arg == "--st")
            opts.st = std::string {next_value()};
        else if(arg == "-d" || arg == "--devices")
            opts.devices = true;
        else if(arg == "-j" || arg == "--json")
            opts.json_output = true;
        else if(arg == "-v" || arg == "--verbose")
            opts.cfg.with_verbose(true);
        else if(arg == "-h" || arg == "--help")
            opts.help = true;
        else
            throw std::invalid_argument {fmt::format("unknown option '{}'", arg)};
    }

    return opts;
}

static void print_response(const discovery::search_response& res)
{
    fmt::print("-----------------\n");
    fmt::print("From     => {}\n", res.response_addr.to_string());
    fmt::print("ST       => {}\n", res.st);
    fmt::print("USN      => {}\n", res.usn);
    fmt::print("Location => {}\n", res.location ? res.location->to_string() : "");
    fmt::print("Server   => {}\n", res.server);
    fmt::print("Cache    => {}\n", res.cache_control);
    if(res.date)
        fmt::print("Date     => {}\n", http::format_date(*res.date));
}

static void print_device(const upnp::device_description& desc)
{
    fmt::print("-----------------\n");
    fmt::print("{} ({})\n", desc.friendly_name, desc.udn);
    fmt::print("  Type         => {}\n", desc.device_type);
    fmt::print("  Manufacturer => {}\n", desc.manufacturer);
    fmt::print("  Model        => {} {}\n", desc.model_name, desc.model_number);
    fmt::print("  Spec version => {}.{}\n", desc.spec.major_version, desc.spec.minor_version);
    for(const auto& ic : desc.icons)
        fmt::print("  Icon         => {} {}x{}x{} {}\n", ic.mime_type, ic.width, ic.height, ic.depth, ic.url);
}

int main(int argc, char** argv)
{
    cli_options opts;
    try {
        opts = parse_args(argc, argv);
    } catch(const std::invalid_argument& err) {
        fmt::print(stderr, "{}\n", err.what());
        print_usage(argv[0]);
        return 2;
    }

    if(opts.help)
    {
        print_usage(argv[0]);
        return EXIT_SUCCESS;
    }

    discovery::ssdp client {opts.cfg};
    try {
        if(opts.devices)
        {
            std::vector<upnp::device_description> devices = client.search_devices(opts.st);
            if(opts.json_output)
            {
                fmt::print("{}\n", json(devices).dump(2));
                return EXIT_SUCCESS;
            }

            fmt::print("Found {} device(s).\n", devices.size());
            for(const auto& desc : devices)
                print_device(desc);
        }
        else
        {
            std::vector<discovery::search_response> responses = client.search(opts.st);
            if(opts.json_output)
            {
                fmt::print("{}\n", json(responses).dump(2));
                return EXIT_SUCCESS;
            }

            fmt::print("Received {} response(s).\n", responses.size());
            for(const auto& res : responses)
                print_response(res);
        }
    } catch(const discovery::ssdp_error& err) {
        fmt::print(stderr, "{}: {}\n", discovery::to_string(err.kind()), err.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
