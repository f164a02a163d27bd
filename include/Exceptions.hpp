#pragma once

#include <stdexcept>
#include <string>

namespace netgsa {

// Custom exceptions
class NetGSAError : public std::runtime_error {
public:
    explicit NetGSAError(const std::string& message)
        : std::runtime_error(message) {}
};

// Shape or ordering mismatch between matrices
class DimensionError : public NetGSAError {
public:
    explicit DimensionError(const std::string& message)
        : NetGSAError(message) {}
};

// Overlapping or asymmetric zero/one masks
class ConstraintConflictError : public NetGSAError {
public:
    explicit ConstraintConflictError(const std::string& message)
        : NetGSAError(message) {}
};

class ConvergenceError : public NetGSAError {
public:
    explicit ConvergenceError(const std::string& message)
        : NetGSAError(message) {}
};

// Directed mask inconsistent with the declared topological order
class OrderingError : public NetGSAError {
public:
    explicit OrderingError(const std::string& message)
        : NetGSAError(message) {}
};

class DegenerateVarianceError : public NetGSAError {
public:
    explicit DegenerateVarianceError(const std::string& message)
        : NetGSAError(message) {}
};

class DataLoadingError : public NetGSAError {
public:
    explicit DataLoadingError(const std::string& message)
        : NetGSAError(message) {}
};

class ProcessingError : public NetGSAError {
public:
    explicit ProcessingError(const std::string& message)
        : NetGSAError(message) {}
};

inline std::string shapeString(long rows, long cols) {
    return std::to_string(rows) + "x" + std::to_string(cols);
}

}
