/*
================================================================================
EXAMPLE 02: JSON REQUEST / RESPONSE
================================================================================

Reads one quote request as JSON and writes the response the web front end
expects. This is the request handler without the HTTP server around it.

USAGE
-----
    02_json_request [--pricing FILE] [--verbose] [REQUEST_FILE]

    REQUEST_FILE defaults to stdin.

    $ echo '{"items": {"camisa": 12}, "delivery_location": "lisboa"}' \
        | 02_json_request
    {
      "total_cost": 9.0,
      "packs_mistos": {},
      ...
    }

EXIT CODES
----------
    0  quote written
    1  invalid request (unknown item, bad JSON)   -> {"error": "..."}
    2  solver or configuration failure            -> {"error": "..."}
    64 bad command line

================================================================================
*/

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

#include <laundry/laundry.h>

namespace {

    struct Options {
        std::optional<std::string> pricingFile;
        std::optional<std::string> requestFile;
        bool verbose = false;
    };

    std::optional<Options> parseArgs(int argc, char** argv)
    {
        Options opt;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--pricing" && i + 1 < argc) {
                opt.pricingFile = argv[++i];
            }
            else if (arg == "--verbose") {
                opt.verbose = true;
            }
            else if (!arg.empty() && arg[0] == '-') {
                return std::nullopt;
            }
            else if (!opt.requestFile) {
                opt.requestFile = arg;
            }
            else {
                return std::nullopt;
            }
        }
        return opt;
    }

    std::string readAll(std::istream& in)
    {
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

} // namespace

int main(int argc, char** argv)
{
    auto opt = parseArgs(argc, argv);
    if (!opt) {
        std::cerr << "usage: " << argv[0] << " [--pricing FILE] [--verbose] [REQUEST_FILE]\n";
        return 64;
    }

    laundry::Logger log(std::cerr, opt->verbose ? laundry::LogLevel::Debug : laundry::LogLevel::Info);

    try {
        laundry::PricingConfig pricing = opt->pricingFile
            ? laundry::loadPricingFile(*opt->pricingFile)
            : laundry::defaultPricing();
        laundry::LaundryOptimizer optimizer(std::move(pricing), {}, log);

        std::string body;
        if (opt->requestFile) {
            std::ifstream in(*opt->requestFile);
            if (!in) {
                log.error("cannot open request file '{}'", *opt->requestFile);
                std::cout << laundry::errorJson("cannot open request file").dump(2) << "\n";
                return 1;
            }
            body = readAll(in);
        }
        else {
            body = readAll(std::cin);
        }

        laundry::QuoteRequest req = laundry::parseRequestText(body);
        laundry::Quote quote = optimizer.optimize(req.items, req.deliveryLocation);
        std::cout << laundry::toJson(quote).dump(2) << "\n";
        return 0;

    } catch (const laundry::ValidationError& e) {
        log.warn("rejected request: {}", e.what());
        std::cout << laundry::errorJson(e.what()).dump(2) << "\n";
        return 1;
    } catch (const laundry::Error& e) {
        log.error("{}", e.what());
        std::cout << laundry::errorJson(e.what()).dump(2) << "\n";
        return 2;
    }
}
