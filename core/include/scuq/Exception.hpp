#ifndef SCUQ_EXCEPTION_HPP
#define SCUQ_EXCEPTION_HPP

#include <exception>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace scuq {

struct exception : public std::exception {
    std::string          message;
    std::source_location sourceLocation;

    exception(std::string_view msg = "unknown exception", std::source_location location = std::source_location::current()) noexcept : message(msg), sourceLocation(location) {}

    [[nodiscard]] const char* what() const noexcept override {
        if (formattedMessage.empty()) {
            formattedMessage = fmt::format("{} at {}:{}", message, sourceLocation.file_name(), sourceLocation.line());
        }
        return formattedMessage.c_str();
    }

private:
    mutable std::string formattedMessage;
};

/// negative or non-finite variance, standard deviation, or correlation coefficient
struct InvalidUncertaintyError : public exception {
    using exception::exception;
};

/// additive, comparison, or conversion operation between units of different dimension
struct IncompatibleUnitsError : public exception {
    using exception::exception;
};

/// division whose divisor has an exactly-zero nominal value
struct DivisionByZeroError : public exception {
    using exception::exception;
};

/// evaluation outside the domain in which a first-order linearisation is defined
struct DomainError : public exception {
    using exception::exception;
};

/// unit exponent that cannot be represented as an exact rational number
struct FractionalDimensionError : public exception {
    using exception::exception;
};

} // namespace scuq

#endif // SCUQ_EXCEPTION_HPP
