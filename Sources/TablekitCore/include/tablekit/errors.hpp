#pragma once

#include <stdexcept>
#include <string>

namespace tablekit {

enum class error_kind {
    validation,   // bad identifier, unknown column, uncoercible value, narrowing conflict
    not_found,    // unknown table, row, view or foreign key
    conflict,     // unique-constraint violation
    integrity,    // missing foreign-key target, column still referenced
    transient,    // lock or connection timeout; safe to retry
    fatal,        // schema reconciliation impossible
    database      // unclassified driver failure
};

inline const char* to_string(error_kind kind) {
    switch (kind) {
        case error_kind::validation: return "validation";
        case error_kind::not_found: return "not_found";
        case error_kind::conflict: return "conflict";
        case error_kind::integrity: return "integrity";
        case error_kind::transient: return "transient";
        case error_kind::fatal: return "fatal";
        case error_kind::database: return "database";
    }
    return "database";
}

class engine_error : public std::runtime_error {
public:
    engine_error(error_kind kind, const std::string& msg, std::string field = {})
        : std::runtime_error(msg), kind_(kind), field_(std::move(field)) {}

    error_kind kind() const noexcept { return kind_; }

    /// Name of the offending field or identifier, empty when not applicable.
    const std::string& field() const noexcept { return field_; }

private:
    error_kind kind_;
    std::string field_;
};

class validation_error : public engine_error {
public:
    explicit validation_error(const std::string& msg, std::string field = {})
        : engine_error(error_kind::validation, msg, std::move(field)) {}
};

class not_found_error : public engine_error {
public:
    explicit not_found_error(const std::string& msg, std::string field = {})
        : engine_error(error_kind::not_found, msg, std::move(field)) {}
};

class conflict_error : public engine_error {
public:
    explicit conflict_error(const std::string& msg, std::string field = {})
        : engine_error(error_kind::conflict, msg, std::move(field)) {}
};

class integrity_error : public engine_error {
public:
    explicit integrity_error(const std::string& msg, std::string field = {})
        : engine_error(error_kind::integrity, msg, std::move(field)) {}
};

class transient_error : public engine_error {
public:
    explicit transient_error(const std::string& msg)
        : engine_error(error_kind::transient, msg) {}
};

class fatal_error : public engine_error {
public:
    explicit fatal_error(const std::string& msg, std::string field = {})
        : engine_error(error_kind::fatal, msg, std::move(field)) {}
};

class db_error : public engine_error {
public:
    explicit db_error(const std::string& msg) : engine_error(error_kind::database, msg) {}
};

} // namespace tablekit
