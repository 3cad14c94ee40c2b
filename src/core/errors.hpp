// core/errors.hpp
// Domain exception types
#pragma once

#include <stdexcept>
#include <string>

namespace coverage {

/**
 * ServiceError - results service invoked in a state where it cannot submit
 */
class ServiceError : public std::runtime_error {
public:
    enum class Kind {
        MissingTestUUID,
    };

    explicit ServiceError(Kind kind)
        : std::runtime_error(describe(kind)), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    static const char* describe(Kind kind) {
        switch (kind) {
            case Kind::MissingTestUUID: return "missing test UUID";
        }
        return "service error";
    }

    Kind kind_;
};

/**
 * SubmissionError - control server rejected or never answered a request
 *
 * status() is the HTTP status, 0 when the transport failed before a response.
 */
class SubmissionError : public std::runtime_error {
public:
    SubmissionError(int status, const std::string& what)
        : std::runtime_error(what), status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

/**
 * PersistenceError - SQLite statement failed
 */
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace coverage
