
#include "errors.hpp"

TransformError::TransformError(const std::string& message) : std::runtime_error(message) {
}

InvalidTransformError::InvalidTransformError(const std::string& message) : TransformError(message) {
}
