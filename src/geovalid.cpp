#include "geovalid/geovalid.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace geovalid {

    namespace op {
        std::string read_file(const std::filesystem::path &file) {
            std::ifstream ifs(file);
            if (!ifs) {
                throw std::runtime_error("geovalid::read(): cannot open \"" + file.string() + '\"');
            }
            std::stringstream buffer;
            buffer << ifs.rdbuf();
            return buffer.str();
        }
    } // namespace op

    GeoJson read(const std::filesystem::path &file) { return parseGeoJson(op::read_file(file)); }

    FeatureCollection readFeatureCollection(const std::filesystem::path &file) {
        return std::visit(
            [](auto &&value) -> FeatureCollection {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, FeatureCollection>) {
                    return std::move(value);
                } else if constexpr (std::is_same_v<T, Feature>) {
                    return FeatureCollection(std::vector<Feature>{std::move(value)});
                } else {
                    return FeatureCollection(std::vector<Feature>{Feature(std::nullopt, Geometry{std::move(value)})});
                }
            },
            read(file));
    }

    void write(const GeoJson &geojson, const std::filesystem::path &outPath) {
        std::ofstream ofs(outPath);
        if (!ofs)
            throw std::runtime_error("geovalid::write(): cannot open for write: " + outPath.string());
        ofs << serialize(geojson) << "\n";
    }

} // namespace geovalid
