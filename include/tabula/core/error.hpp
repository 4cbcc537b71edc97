#pragma once

#include <stdexcept>
#include <string>

namespace tabula {

/// Base class of every error raised by the table engine.
class Error : public std::runtime_error {
   public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/// Duplicate, missing or reserved column names; invalid postfixes.
class SchemaError : public Error {
   public:
    explicit SchemaError(const std::string& message) : Error(message) {}
};

/// A new column name is already taken.
class NameCollisionError : public SchemaError {
   public:
    explicit NameCollisionError(const std::string& message) : SchemaError(message) {}
};

/// Row width, value count or expression result length disagrees with the table.
class ShapeMismatch : public Error {
   public:
    explicit ShapeMismatch(const std::string& message) : Error(message) {}
};

/// A value cannot be converted to the declared column type.
class TypeError : public Error {
   public:
    explicit TypeError(const std::string& message) : Error(message) {}
};

/// None of the persistence decoders accepted the input.
class LoadError : public Error {
   public:
    explicit LoadError(const std::string& message) : Error(message) {}
};

/// Invalid combination of arguments.
class ArgumentError : public Error {
   public:
    explicit ArgumentError(const std::string& message) : Error(message) {}
};

/// File system failure while reading or writing.
class IoError : public Error {
   public:
    explicit IoError(const std::string& message) : Error(message) {}
};

}  // namespace tabula
