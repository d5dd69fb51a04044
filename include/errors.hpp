#pragma once

#include <stdexcept>
#include <string>

namespace errors {

// Base for every failure archdrop raises itself. Socket failures come
// through as boost::system::system_error instead.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// --- Archive codec ---
class NotFoundError : public Error {
public:
    using Error::Error;
};

class EncodeError : public Error {
public:
    using Error::Error;
};

class DecodeError : public Error {
public:
    using Error::Error;
};

class CorruptArchiveError : public Error {
public:
    using Error::Error;
};

class TruncatedEntryError : public Error {
public:
    using Error::Error;
};

class FieldOverflowError : public Error {
public:
    using Error::Error;
};

// --- Frame protocol ---
class MalformedFrameError : public Error {
public:
    using Error::Error;
};

class IncompleteMessageError : public Error {
public:
    using Error::Error;
};

// --- Transfer header / session ---
class MalformedHeaderError : public Error {
public:
    using Error::Error;
};

class OverlongTransferError : public Error {
public:
    using Error::Error;
};

class TransferError : public Error {
public:
    using Error::Error;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

} // namespace errors
