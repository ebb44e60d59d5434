#pragma once
#include <stdexcept>
#include <string>

// libcrypto lacks SHA-512 or AES-256-CBC. Fatal, reported once.
class UnsupportedEnvironmentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// "Wrong master key or bad config file". Catch this one in the UI layer.
class ConfigLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Short/odd blob, bad hex, or a CBC padding failure.
class DecryptionError : public ConfigLoadError {
public:
    using ConfigLoadError::ConfigLoadError;
};

// Decrypted fine, but the plaintext is not a service list.
class MalformedConfigError : public ConfigLoadError {
public:
    using ConfigLoadError::ConfigLoadError;
};

class DuplicateServiceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidServiceNameError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Fewer key bytes than template positions + 1. Internal contract violation.
class InvalidKeyLengthError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

class UnknownPatternError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};
