#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
    Store,        // backing store unreachable or failed
    Connectivity, // completion / retrieval service unreachable
    Parse,        // malformed structured output or stored document
    NotFound,     // transition source record absent
    Duplicate,    // ticket_id collision
    Schema        // record does not fit the target store
};

const char* error_kind_name(ErrorKind kind);
bool is_retryable(ErrorKind kind);

class TicketError : public std::runtime_error {
public:
    TicketError(ErrorKind kind, const std::string& what);
    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class StoreError : public TicketError {
public:
    explicit StoreError(const std::string& what) : TicketError(ErrorKind::Store, what) {}
};

class ConnectivityError : public TicketError {
public:
    explicit ConnectivityError(const std::string& what) : TicketError(ErrorKind::Connectivity, what) {}
};

class ParseError : public TicketError {
public:
    explicit ParseError(const std::string& what) : TicketError(ErrorKind::Parse, what) {}
};

class NotFoundError : public TicketError {
public:
    explicit NotFoundError(const std::string& what) : TicketError(ErrorKind::NotFound, what) {}
};

class DuplicateError : public TicketError {
public:
    explicit DuplicateError(const std::string& what) : TicketError(ErrorKind::Duplicate, what) {}
};

class SchemaError : public TicketError {
public:
    explicit SchemaError(const std::string& what) : TicketError(ErrorKind::Schema, what) {}
};
