#pragma once

#include <stdexcept>
#include <string>

class ProvisionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Cannot establish or maintain the session.
class ConnectionError : public ProvisionError {
public:
    using ProvisionError::ProvisionError;
};

// The session vanished underneath an operation.
class TransportError : public ConnectionError {
public:
    using ConnectionError::ConnectionError;
};

// Credentials rejected. Never retried.
class AuthenticationError : public ProvisionError {
public:
    using ProvisionError::ProvisionError;
};

class CommandExecutionError : public ProvisionError {
public:
    using ProvisionError::ProvisionError;
};

class TimeoutError : public ProvisionError {
public:
    using ProvisionError::ProvisionError;
};

class IOError : public ProvisionError {
public:
    using ProvisionError::ProvisionError;
};

class FileNotFoundError : public ProvisionError {
public:
    using ProvisionError::ProvisionError;
};

class InsufficientSpaceError : public ProvisionError {
public:
    using ProvisionError::ProvisionError;
};

class FileTransferError : public ProvisionError {
public:
    using ProvisionError::ProvisionError;
};
