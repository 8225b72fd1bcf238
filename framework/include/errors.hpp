#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept> // std::runtime_error
#include <string> // std::string

class TransformError : public std::runtime_error {
    public:
        explicit TransformError(const std::string& message);
};

// Thrown for programmer errors: ill-shaped matrices, zero-length axes, mismatched landmarks
class InvalidTransformError : public TransformError {
    public:
        explicit InvalidTransformError(const std::string& message);
};

#endif // ERRORS_HPP
