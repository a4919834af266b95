#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

// Base for every failure raised by the encryption core.
class EncryptionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// GCM tag did not verify: tampered data or wrong key.
class AuthenticationError : public EncryptionError {
public:
    AuthenticationError() : EncryptionError("GCM tag verification failed") {}
};

// User-correctable; shown inline.
class InvalidPassphrase : public EncryptionError {
public:
    InvalidPassphrase() : EncryptionError("Invalid passphrase. Please try again.") {}
};

// Transient: the passphrase could not be checked. Never a wrong-passphrase signal.
class VerificationUnavailable : public EncryptionError {
public:
    explicit VerificationUnavailable(const std::string& detail)
        : EncryptionError("Failed to verify passphrase: " + detail) {}
};

// Thrown by RemoteBackend implementations on transport/availability failure.
class RemoteUnavailable : public EncryptionError {
public:
    using EncryptionError::EncryptionError;
};

class NotUnlocked : public EncryptionError {
public:
    NotUnlocked() : EncryptionError("Encryption not unlocked") {}
};

class MissingFields : public EncryptionError {
public:
    MissingFields() : EncryptionError("Missing required fields for encryption") {}
};

// Remote has records but no salt. Fatal to the subsystem until resolved externally.
class DataInconsistency : public EncryptionError {
public:
    DataInconsistency()
        : EncryptionError("User has encrypted records but no salt: data inconsistency") {}
};

class LockedOut : public EncryptionError {
public:
    explicit LockedOut(std::int64_t remainingSeconds)
        : EncryptionError("Too many failed attempts. Try again in "
                          + std::to_string(remainingSeconds) + " seconds."),
          m_remainingSeconds(remainingSeconds) {}

    std::int64_t remainingSeconds() const { return m_remainingSeconds; }

private:
    std::int64_t m_remainingSeconds;
};

// Operation not valid in the session's current state.
class InvalidState : public EncryptionError {
public:
    using EncryptionError::EncryptionError;
};
