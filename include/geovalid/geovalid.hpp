#pragma once

#include "feature.hpp"
#include "geometry.hpp"
#include "parser.hpp"
#include "types.hpp"
#include "validation.hpp"
#include "writter.hpp"

#include <filesystem>

namespace geovalid {

    // Decodes any GeoJSON document. Throws std::runtime_error when the file cannot be opened
    // and DecodeError when its content is not GeoJSON.
    GeoJson read(const std::filesystem::path &file);

    // Like read(), but a bare geometry or Feature is wrapped into a FeatureCollection.
    FeatureCollection readFeatureCollection(const std::filesystem::path &file);

    void write(const GeoJson &geojson, const std::filesystem::path &outPath);

} // namespace geovalid
