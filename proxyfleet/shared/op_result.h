#pragma once
#include <cstdint>
#include <string>
#include <utility>

enum manager_error : uint8_t
{
    err_none            = 0,
    err_validation      = 1,
    err_name_conflict   = 2,
    err_port_conflict   = 3,
    err_not_found       = 4,
    err_duplicate_user  = 5,
    err_process         = 6,
    err_certificate     = 7,
    err_io              = 8
};

inline constexpr const char* error_to_string(manager_error e)
{
    switch (e)
    {
        case err_none:           return "Ok";
        case err_validation:     return "ValidationError";
        case err_name_conflict:  return "NameConflict";
        case err_port_conflict:  return "PortConflict";
        case err_not_found:      return "NotFound";
        case err_duplicate_user: return "DuplicateUser";
        case err_process:        return "ProcessError";
        case err_certificate:    return "CertificateError";
        case err_io:             return "IOError";
    }
    return "UnknownError";
}

// Outcome of a manager operation: error kind plus a human readable reason.
struct op_result
{
    manager_error code = err_none;
    std::string message;

    static op_result ok() { return {}; }
    static op_result fail(manager_error code, std::string message)
    {
        return { code, std::move(message) };
    }

    bool is_ok() const { return code == err_none; }
    explicit operator bool() const { return code == err_none; }

    // "<Kind>: <message>", the form sent back to IPC clients
    std::string describe() const
    {
        if (code == err_none)
            return message;
        std::string out = error_to_string(code);
        if (!message.empty())
        {
            out += ": ";
            out += message;
        }
        return out;
    }
};

std::string errno_message(const char* what, int err);
