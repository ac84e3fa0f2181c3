#ifndef EQUILIB_EXCEPTIONS_H
#define EQUILIB_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Equilib {

class EquilibException : public std::runtime_error {
public:
    explicit EquilibException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public EquilibException {
public:
    explicit IOException(const std::string& message) : EquilibException("IO Error: " + message) {}
};

class DatasetException : public EquilibException {
public:
    explicit DatasetException(const std::string& message) : EquilibException("Dataset Error: " + message) {}
};

class ConfigurationException : public EquilibException {
public:
    explicit ConfigurationException(const std::string& message) : EquilibException("Configuration Error: " + message) {}
};

// Label or protected column absent from the dataset, or listed inconsistently.
class SchemaError : public EquilibException {
public:
    explicit SchemaError(const std::string& message) : EquilibException("Schema Error: " + message) {}
};

// Protected attribute without exactly two observed values.
class UnsupportedCardinalityError : public EquilibException {
public:
    explicit UnsupportedCardinalityError(const std::string& message)
        : EquilibException("Unsupported Cardinality: " + message) {}
};

class EmptyGroupError : public EquilibException {
public:
    explicit EmptyGroupError(const std::string& message) : EquilibException("Empty Group: " + message) {}
};

// Observed weight of zero; the expected/observed ratio is undefined.
class DivisionByZeroError : public EquilibException {
public:
    explicit DivisionByZeroError(const std::string& message) : EquilibException("Division By Zero: " + message) {}
};

} // namespace Equilib

#endif // EQUILIB_EXCEPTIONS_H
