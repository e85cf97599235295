#ifndef CCRAM_EXCEPTIONS_H
#define CCRAM_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Ccram {

class CcramException : public std::runtime_error {
public:
    explicit CcramException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public CcramException {
public:
    explicit IOException(const std::string& message) : CcramException("IO Error: " + message) {}
};

class ConfigurationException : public CcramException {
public:
    explicit ConfigurationException(const std::string& message) : CcramException("Configuration Error: " + message) {}
};

// Negative counts, zero total, shape/metadata mismatch.
class InvalidTableException : public CcramException {
public:
    explicit InvalidTableException(const std::string& message) : CcramException("Invalid Table: " + message) {}
};

// Response listed among predictors, axis or category index out of range.
class InvalidAxisSpecException : public CcramException {
public:
    explicit InvalidAxisSpecException(const std::string& message) : CcramException("Invalid Axis Specification: " + message) {}
};

// Scaled measure requested for a response whose score variance is zero.
class DivisionByZeroException : public CcramException {
public:
    explicit DivisionByZeroException(const std::string& message) : CcramException("Division By Zero: " + message) {}
};

// Conditioning combination with zero probability mass. Recoverable: callers
// skip the combination or report it as not predicted.
class DegenerateConditionException : public CcramException {
public:
    explicit DegenerateConditionException(const std::string& message) : CcramException("Degenerate Condition: " + message) {}
};

class ResamplingException : public CcramException {
public:
    explicit ResamplingException(const std::string& message) : CcramException("Resampling Error: " + message) {}
};

} // namespace Ccram

#endif // CCRAM_EXCEPTIONS_H
