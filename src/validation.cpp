#include "geovalid/validation.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <ostream>
#include <tuple>
#include <utility>

namespace geovalid {

    ValidationError::ValidationError(std::string field, std::string message, std::string key)
        : field_(std::move(field)), message_(std::move(message)), key_(std::move(key)) {
        if (field_.empty())
            throw std::invalid_argument("ValidationError: field must not be empty");
        if (key_.empty())
            throw std::invalid_argument("ValidationError: key must not be empty");
    }

    ValidationError ValidationError::of(const std::string &field, const std::string &message, const std::string &key) {
        return ValidationError(field, message, key);
    }

    bool ValidationError::operator==(const ValidationError &other) const {
        return field_ == other.field_ && message_ == other.message_ && key_ == other.key_;
    }

    bool ValidationError::operator<(const ValidationError &other) const {
        return std::tie(key_, field_, message_) < std::tie(other.key_, other.field_, other.message_);
    }

    std::ostream &operator<<(std::ostream &os, ValidationError const &error) {
        os << "ValidationError{field='" << error.field() << "', message='" << error.message() << "', key='"
           << error.key() << "'}";
        return os;
    }

    ValidationResult::ValidationResult(std::set<ValidationError> errors) : errors_(std::move(errors)) {}

    void ValidationResult::add(ValidationError error) { errors_.insert(std::move(error)); }

    void ValidationResult::add(const std::string &field, const std::string &message, const std::string &key) {
        errors_.insert(ValidationError(field, message, key));
    }

    void ValidationResult::merge(const ValidationResult &other) {
        errors_.insert(other.errors_.begin(), other.errors_.end());
    }

    bool ValidationResult::contains(const std::string &key) const {
        return std::any_of(errors_.begin(), errors_.end(), [&](const ValidationError &e) { return e.key() == key; });
    }

    bool ValidationResult::containsField(const std::string &field) const {
        return std::any_of(errors_.begin(), errors_.end(),
                           [&](const ValidationError &e) { return e.field() == field; });
    }

    std::ostream &operator<<(std::ostream &os, ValidationResult const &result) {
        os << "ValidationResult{errors=[";
        bool first = true;
        for (auto const &e : result) {
            if (!first)
                os << ", ";
            first = false;
            os << e;
        }
        os << "]}";
        return os;
    }

    ValidationException::ValidationException(const std::string &message, std::set<ValidationError> errors)
        : std::runtime_error(message), errors_(std::move(errors)) {}

    namespace detail {
        bool isBlank(const std::string &s) {
            return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
        }

        void validateType(ValidationResult &result, const std::string &type, const char *expected) {
            if (isBlank(type) || type != expected) {
                result.add("type", "type '" + type + "' is not valid. expected '" + expected + "'", "type.invalid");
            }
        }

        void logRejected(const ValidationResult &result) {
            if (!spdlog::should_log(spdlog::level::debug))
                return;
            for (auto const &e : result)
                spdlog::debug("geovalid: rejected value, {} ({}): {}", e.key(), e.field(), e.message());
        }
    } // namespace detail

} // namespace geovalid
