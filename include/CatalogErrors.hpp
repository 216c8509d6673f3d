#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

// Outcome of a single file read. Anything but Ok is a per-file skip, never fatal.
enum class IOStatus
{
    Ok,
    PermissionDenied,
    NotFound,
    IOError
};

inline IOStatus ToIOStatus(const std::error_code& Error)
{
    if (!Error)
    {
        return IOStatus::Ok;
    }
    if (Error == std::errc::permission_denied || Error == std::errc::operation_not_permitted)
    {
        return IOStatus::PermissionDenied;
    }
    if (Error == std::errc::no_such_file_or_directory || Error == std::errc::not_a_directory)
    {
        return IOStatus::NotFound;
    }
    return IOStatus::IOError;
}

inline std::string IOStatusToString(IOStatus Status)
{
    switch (Status)
    {
    case IOStatus::Ok:               return "Ok";
    case IOStatus::PermissionDenied: return "PermissionDenied";
    case IOStatus::NotFound:         return "NotFound";
    case IOStatus::IOError:          return "IOError";
    default:                         return "Unknown";
    }
}

// Fatal errors. Each one aborts the run and moves the engine to Failed.
class CatalogError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class FatalConfigError : public CatalogError
{
public:
    using CatalogError::CatalogError;
};

class SchemaError : public CatalogError
{
public:
    using CatalogError::CatalogError;
};

class StoreConflict : public CatalogError
{
public:
    using CatalogError::CatalogError;
};

class StoreError : public CatalogError
{
public:
    using CatalogError::CatalogError;
};
