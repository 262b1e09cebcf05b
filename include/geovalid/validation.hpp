#pragma once

#include <iosfwd>
#include <set>
#include <stdexcept>
#include <string>

namespace geovalid {

    // A single failed rule. `key` is stable and meant for programmatic branching,
    // `message` is for humans.
    class ValidationError {
      private:
        std::string field_;
        std::string message_;
        std::string key_;

      public:
        // Throws std::invalid_argument when field or key is empty.
        ValidationError(std::string field, std::string message, std::string key);

        static ValidationError of(const std::string &field, const std::string &message, const std::string &key);

        const std::string &field() const { return field_; }
        const std::string &message() const { return message_; }
        const std::string &key() const { return key_; }

        bool operator==(const ValidationError &other) const;
        bool operator!=(const ValidationError &other) const { return !(*this == other); }
        bool operator<(const ValidationError &other) const;
    };

    std::ostream &operator<<(std::ostream &os, ValidationError const &error);

    class ValidationResult {
      private:
        std::set<ValidationError> errors_;

      public:
        ValidationResult() = default;
        explicit ValidationResult(std::set<ValidationError> errors);

        const std::set<ValidationError> &errors() const { return errors_; }

        bool hasErrors() const { return !errors_.empty(); }
        size_t size() const { return errors_.size(); }

        void add(ValidationError error);
        void add(const std::string &field, const std::string &message, const std::string &key);
        void merge(const ValidationResult &other);

        bool contains(const std::string &key) const;
        bool containsField(const std::string &field) const;

        bool operator==(const ValidationResult &other) const { return errors_ == other.errors_; }
        bool operator!=(const ValidationResult &other) const { return !(*this == other); }

        auto begin() const { return errors_.begin(); }
        auto end() const { return errors_.end(); }
    };

    std::ostream &operator<<(std::ostream &os, ValidationResult const &result);

    // Capability shared by every model entity. validate() must not throw for bad data.
    class Validatable {
      public:
        virtual ~Validatable() = default;

        virtual ValidationResult validate() const = 0;

        bool isValid() const { return !validate().hasErrors(); }
        bool hasErrors() const { return validate().hasErrors(); }
    };

    class ValidationException : public std::runtime_error {
      private:
        std::set<ValidationError> errors_;

      public:
        ValidationException(const std::string &message, std::set<ValidationError> errors);

        const std::set<ValidationError> &errors() const { return errors_; }
    };

    namespace detail {
        bool isBlank(const std::string &s);
        // Adds `type.invalid` unless `type` is exactly `expected`.
        void validateType(ValidationResult &result, const std::string &type, const char *expected);
        void logRejected(const ValidationResult &result);
    } // namespace detail

    // Used by the T::of(...) factories: returns the value when valid, throws otherwise.
    template <typename T> T validateOrThrow(T value) {
        ValidationResult result = value.validate();
        if (result.hasErrors()) {
            detail::logRejected(result);
            throw ValidationException("GeoJson Invalid", result.errors());
        }
        return value;
    }

} // namespace geovalid
