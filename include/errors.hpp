#ifndef QRCOMM_ERRORS_HPP
#define QRCOMM_ERRORS_HPP

#include <stdexcept>
#include <string>

// Base of every fatal qrcomm failure. Per-frame decode problems are not
// exceptions, see DecodeError in packet_parser.hpp.
class QrCommError : public std::runtime_error {
public:
    explicit QrCommError(const std::string& what) : std::runtime_error(what) {}
    virtual const char* kind() const noexcept = 0;
};

// Bad capacity, bad path, image size below codec minimum, unknown EC level...
class InvalidConfiguration : public QrCommError {
public:
    using QrCommError::QrCommError;
    const char* kind() const noexcept override { return "InvalidConfiguration"; }
};

// Segment does not fit one QR symbol at the chosen version / EC level.
class EncodeOverflow : public QrCommError {
public:
    using QrCommError::QrCommError;
    const char* kind() const noexcept override { return "EncodeOverflow"; }
};

// A frame disagrees with the transfer adopted from the first frame.
class InconsistentCount : public QrCommError {
public:
    using QrCommError::QrCommError;
    const char* kind() const noexcept override { return "InconsistentCount"; }
};

// Every segment arrived but the whole does not form the transmitted stream.
class CorruptPayload : public QrCommError {
public:
    using QrCommError::QrCommError;
    const char* kind() const noexcept override { return "CorruptPayload"; }
};

#endif // QRCOMM_ERRORS_HPP
