#include "geovalid/types.hpp"

#include <cmath>
#include <limits>
#include <ostream>
#include <sstream>
#include <utility>

namespace geovalid {

    namespace {
        constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

        bool same(double a, double b) { return a == b || (std::isnan(a) && std::isnan(b)); }

        bool isLengthValid(const std::vector<double> &coordinates) {
            return coordinates.size() == 2 || coordinates.size() == 3;
        }

        // NaN compares false on both sides, so it fails the range checks.
        bool isLongitudeValid(double longitude) { return longitude >= -180 && longitude <= 180; }

        bool isLatitudeValid(double latitude) { return latitude >= -90 && latitude <= 90; }

        std::string ringText(const LinearRing &ring) {
            std::ostringstream oss;
            oss << ring;
            return oss.str();
        }

        ValidationResult validateLinearRing(const LinearRing &ring, bool exterior) {
            ValidationResult result;
            if (ring.empty()) {
                if (exterior)
                    result.add("coordinates", "Exterior linear ring should not be blank/empty.",
                               "coordinates.exterior.ring.empty");
                else
                    result.add("coordinates", "Interior linear ring (hole) should not be blank/empty.",
                               "coordinates.hole.ring.empty");
            }
            if (ring.size() < 4) {
                result.add("coordinates", "Ring '" + ringText(ring) + "' must contain at least four positions.",
                           "coordinates.ring.length.invalid");
            }
            if (!ring.empty() && ring.front() != ring.back()) {
                result.add("coordinates", "Ring '" + ringText(ring) + "', first and last position must be the same.",
                           "coordinates.ring.circle.invalid");
            }
            for (auto const &position : ring)
                result.merge(position.validate());
            return result;
        }
    } // namespace

    Position::Position() : coordinates_{NaN, NaN} {}

    Position::Position(std::vector<double> coordinates) : coordinates_(std::move(coordinates)) {}

    Position::Position(double longitude, double latitude) : coordinates_{longitude, latitude} {}

    Position::Position(double longitude, double latitude, double altitude)
        : coordinates_{longitude, latitude, altitude} {}

    Position Position::of(const std::vector<double> &coordinates) { return validateOrThrow(Position(coordinates)); }

    Position Position::of(double longitude, double latitude) { return validateOrThrow(Position(longitude, latitude)); }

    Position Position::of(double longitude, double latitude, double altitude) {
        return validateOrThrow(Position(longitude, latitude, altitude));
    }

    double Position::longitude() const { return !coordinates_.empty() ? coordinates_[0] : NaN; }

    double Position::latitude() const { return coordinates_.size() > 1 ? coordinates_[1] : NaN; }

    double Position::altitude() const { return coordinates_.size() > 2 ? coordinates_[2] : NaN; }

    // Only the first failing rule is reported; range checks are meaningless on a bad arity.
    ValidationResult Position::validate() const {
        ValidationResult result;
        if (!isLengthValid(coordinates_)) {
            result.add("coordinates", "coordinates length is not valid", "coordinates.length.invalid");
        } else if (!isLongitudeValid(longitude())) {
            result.add("coordinates", "longitude is not valid", "coordinates.longitude.invalid");
        } else if (!isLatitudeValid(latitude())) {
            result.add("coordinates", "latitude is not valid", "coordinates.latitude.invalid");
        }
        return result;
    }

    bool Position::operator==(const Position &other) const {
        if (coordinates_.size() != other.coordinates_.size())
            return false;
        for (size_t i = 0; i < coordinates_.size(); ++i) {
            if (!same(coordinates_[i], other.coordinates_[i]))
                return false;
        }
        return true;
    }

    std::ostream &operator<<(std::ostream &os, Position const &position) {
        os << "[";
        bool first = true;
        for (double c : position.coordinates()) {
            if (!first)
                os << ", ";
            first = false;
            os << c;
        }
        os << "]";
        return os;
    }

    std::ostream &operator<<(std::ostream &os, std::vector<Position> const &positions) {
        os << "[";
        bool first = true;
        for (auto const &p : positions) {
            if (!first)
                os << ", ";
            first = false;
            os << p;
        }
        os << "]";
        return os;
    }

    PolygonCoordinates::PolygonCoordinates(LinearRing exterior, std::vector<LinearRing> holes)
        : exterior_(std::move(exterior)), holes_(std::move(holes)) {}

    PolygonCoordinates::PolygonCoordinates(const std::vector<LinearRing> &linear_rings) {
        if (linear_rings.empty())
            return;
        exterior_ = linear_rings.front();
        holes_.assign(linear_rings.begin() + 1, linear_rings.end());
    }

    PolygonCoordinates PolygonCoordinates::of(const std::vector<LinearRing> &linear_rings) {
        return validateOrThrow(PolygonCoordinates(linear_rings));
    }

    PolygonCoordinates PolygonCoordinates::of(const LinearRing &exterior, const std::vector<LinearRing> &holes) {
        return validateOrThrow(PolygonCoordinates(exterior, holes));
    }

    std::vector<LinearRing> PolygonCoordinates::coordinates() const {
        std::vector<LinearRing> rings;
        rings.reserve(holes_.size() + 1);
        rings.push_back(exterior_);
        rings.insert(rings.end(), holes_.begin(), holes_.end());
        return rings;
    }

    // Rings are checked independently; a broken hole never hides problems elsewhere.
    ValidationResult PolygonCoordinates::validate() const {
        ValidationResult result = validateLinearRing(exterior_, true);
        for (auto const &hole : holes_)
            result.merge(validateLinearRing(hole, false));
        return result;
    }

    bool PolygonCoordinates::operator==(const PolygonCoordinates &other) const {
        return exterior_ == other.exterior_ && holes_ == other.holes_;
    }

    std::ostream &operator<<(std::ostream &os, PolygonCoordinates const &coordinates) {
        os << "[";
        bool first = true;
        for (auto const &ring : coordinates.coordinates()) {
            if (!first)
                os << ", ";
            first = false;
            os << ring;
        }
        os << "]";
        return os;
    }

} // namespace geovalid

namespace std {
    size_t hash<geovalid::Position>::operator()(const geovalid::Position &position) const noexcept {
        size_t seed = position.size();
        for (double c : position.coordinates()) {
            // All NaNs hash alike, matching operator==. Normalise -0.0 to 0.0 for the same reason.
            size_t h = std::isnan(c) ? 0x7ff8u : std::hash<double>{}(c == 0.0 ? 0.0 : c);
            seed ^= h + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
} // namespace std
