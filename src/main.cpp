#include <iostream>
#include <string>
#include <string_view>

#include "ps/cli.hpp"
#include "ps/config.hpp"
#include "ps/error.hpp"
#include "ps/observer.hpp"
#include "ps/pipeline.hpp"
#include "ps/report.hpp"

namespace {

constexpr std::string_view version = "0.1.0";

} // namespace

int main(int argc, char** argv) {
    const std::string_view program = argc > 0 ? argv[0] : "primescan";

    ps::cli_options options;
    try {
        options = ps::parse_args(argc, argv);
    } catch (const ps::usage_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        ps::print_usage(std::cerr, program);
        return 2;
    } catch (const ps::scan_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }

    if (options.help) {
        ps::print_usage(std::cout, program);
        return 0;
    }
    if (options.show_version) {
        std::cout << "primescan " << version << std::endl;
        return 0;
    }

    try {
        options.config.validate();
        const auto contents = ps::load_file(options.file);

        ps::stream_observer observer(std::cerr, !options.quiet);
        const auto report = ps::run_scan(contents, options.config, observer);

        if (report.primes_only) {
            ps::print_primes(std::cout, report.primes);
        } else {
            ps::print_matches(std::cout, report.matches);
        }
    } catch (const ps::scan_error& e) {
        std::cerr << "Error (" << ps::to_string(e.code()) << "): " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
