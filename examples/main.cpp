#include "geovalid/geovalid.hpp"

#include <boost/json/serialize.hpp>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <iostream>

// Usage: geovalid-check <file.geojson>...
// Prints one validation report per file. SPDLOG_LEVEL=debug shows type resolution.
int main(int argc, char **argv) {
    spdlog::cfg::load_env_levels();

    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <file.geojson>...\n";
        return 2;
    }

    int status = 0;
    for (int i = 1; i < argc; ++i) {
        const std::string path = argv[i];
        try {
            // 1) Decode, no validation yet
            auto geojson = geovalid::read(path);

            // 2) Validate explicitly
            auto result = geovalid::validate(geojson);
            spdlog::info("{}: {} is {}", path, geovalid::typeOf(geojson), result.hasErrors() ? "invalid" : "valid");

            // 3) Report
            boost::json::object report;
            report["file"] = path;
            report["type"] = geovalid::typeOf(geojson);
            report["result"] = geovalid::toJson(result);
            std::cout << boost::json::serialize(report) << "\n";

            if (result.hasErrors())
                status = 1;
        } catch (const geovalid::DecodeError &e) {
            spdlog::error("{}: not a GeoJSON document: {}", path, e.what());
            status = 1;
        } catch (const std::exception &e) {
            spdlog::error("{}: {}", path, e.what());
            status = 1;
        }
    }
    return status;
}
