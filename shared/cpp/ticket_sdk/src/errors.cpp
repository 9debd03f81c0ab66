#include "../include/errors.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Store: return "StoreError";
        case ErrorKind::Connectivity: return "ConnectivityError";
        case ErrorKind::Parse: return "ParseError";
        case ErrorKind::NotFound: return "NotFoundError";
        case ErrorKind::Duplicate: return "DuplicateError";
        case ErrorKind::Schema: return "SchemaError";
    }
    return "TicketError";
}

bool is_retryable(ErrorKind kind) {
    return kind == ErrorKind::Store || kind == ErrorKind::Connectivity;
}

TicketError::TicketError(ErrorKind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}
