#include <iostream>
#include <string>
#include "logging.hpp"
#include "ulidlite.hpp"

static void usage(std::ostream &os) {
    os << "usage: ulid [-n count] [-s seed]\n"
          "  prints new ULIDs, one per line (default 1)\n"
          "  -n count  number of ULIDs, strictly increasing\n"
          "  -s seed   fixed seed for the random part\n";
}

int main(int argc, char *argv[]) {
    ULIDLite::Logger::initialize("ulid", "info", true);
    auto config = ULIDLite::Config::FromEnvironment();
    ULIDLite::Logger::initialize("ulid", config.logLevel, true);

    uint64_t count = 1;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            usage(std::cout);
            return 0;
        }
        if ((arg == "-n" || arg == "-s") && i + 1 < argc) {
            auto value = ULIDLite::ParseUnsigned(argv[++i]);
            if (!value || (arg == "-n" && *value == 0)) {
                std::cerr << "ulid: invalid value for " << arg << ": " << argv[i] << "\n";
                usage(std::cerr);
                return 1;
            }
            if (arg == "-n")
                count = *value;
            else
                config.seed = value;
            continue;
        }
        std::cerr << "ulid: unknown argument " << arg << "\n";
        usage(std::cerr);
        return 1;
    }

    try {
        auto generator = ULIDLite::MakeGenerator(config);
        for (uint64_t n = 0; n < count; ++n) {
            std::cout << generator.Next() << '\n';
        }
    } catch (const ULIDLite::ULIDException &e) {
        LOG_ERROR("{}", e.what());
        ULIDLite::Logger::shutdown();
        return 1;
    }
    ULIDLite::Logger::shutdown();
    return 0;
}
