#pragma once
#include <stdexcept>
#include <string>

namespace ss {

// Base for every runtime failure raised by the source library.
class SourceError : public std::runtime_error {
public:
  explicit SourceError(const std::string& what) : std::runtime_error(what) {}
};

// Literal (non-pattern) path does not exist.
class NotFoundError : public SourceError {
public:
  explicit NotFoundError(const std::string& what) : SourceError(what) {}
};

// Channel open/seek/read failure.
class IoError : public SourceError {
public:
  explicit IoError(const std::string& what) : SourceError(what) {}
};

// Negative or inverted offsets, or a pattern combined with a byte range.
class InvalidRangeError : public SourceError {
public:
  explicit InvalidRangeError(const std::string& what) : SourceError(what) {}
};

// Record bytes rejected by a decoder.
class DecodeError : public SourceError {
public:
  explicit DecodeError(const std::string& what) : SourceError(what) {}
};

// Missing scheme in the channel registry, bad tool configuration.
class ConfigError : public SourceError {
public:
  explicit ConfigError(const std::string& what) : SourceError(what) {}
};

// Reader accessor called out of protocol order.
class IllegalStateError : public std::logic_error {
public:
  explicit IllegalStateError(const std::string& what) : std::logic_error(what) {}
};

}
