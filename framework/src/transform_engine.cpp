
#include "transform_engine.hpp"
#include "logging.hpp"

#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtx/euler_angles.hpp>

#include <algorithm> // std::max_element
#include <cmath> // std::abs
#include <stdexcept> // std::out_of_range
#include <string> // std::to_string

glm::dmat4 invert_matrix(const glm::dmat4& matrix) {
    // Relative to the Hadamard bound, so that uniformly scaled matrices are not reported
    double bound = glm::length(matrix[0]) * glm::length(matrix[1]) * glm::length(matrix[2]) * glm::length(matrix[3]);
    if (!(std::abs(glm::determinant(matrix)) > 1e-12 * bound)) {
        log_message(LogLevel::Warning, "inverting a singular transformation matrix");
    }
    return glm::inverse(matrix);
}

TransformEngine::TransformEngine() {
}

TransformEngine::~TransformEngine() {
}

void TransformEngine::translate(const glm::dvec3& offset) {
    concatenate(glm::translate(glm::dmat4(1.0), offset));
}

void TransformEngine::scale(const glm::dvec3& factors) {
    concatenate(glm::scale(glm::dmat4(1.0), factors));
}

void TransformEngine::rotate_wxyz(double degrees, const glm::dvec3& axis) {
    concatenate(glm::rotate(glm::dmat4(1.0), glm::radians(degrees), axis));
}

void TransformEngine::rotate_x(double degrees) {
    rotate_wxyz(degrees, glm::dvec3(1.0, 0.0, 0.0));
}

void TransformEngine::rotate_y(double degrees) {
    rotate_wxyz(degrees, glm::dvec3(0.0, 1.0, 0.0));
}

void TransformEngine::rotate_z(double degrees) {
    rotate_wxyz(degrees, glm::dvec3(0.0, 0.0, 1.0));
}

glm::dvec3 TransformEngine::transform_point(const glm::dvec3& point) const {
    return glm::dvec3(get_matrix() * glm::dvec4(point, 1.0));
}

glm::dvec3 TransformEngine::transform_normal(const glm::dvec3& normal) const {
    glm::dmat3 m = glm::dmat3(get_matrix());

    // Cofactor matrix, the inverse transpose up to a factor of the determinant, stays finite for flattening transforms
    glm::dmat3 cofactor(glm::cross(m[1], m[2]), glm::cross(m[2], m[0]), glm::cross(m[0], m[1]));
    if (glm::determinant(m) < 0.0) {
        cofactor = -cofactor;
    }
    glm::dvec3 result = cofactor * normal;

    double length = glm::length(result);
    if (length > 0.0) {
        result /= length;
    }
    return result;
}

glm::dvec3 TransformEngine::get_position() const {
    return glm::dvec3(get_matrix()[3]);
}

glm::dvec3 TransformEngine::get_scale() const {
    glm::dmat3 m = glm::dmat3(get_matrix());
    glm::dvec3 scale(glm::length(m[0]), glm::length(m[1]), glm::length(m[2]));

    // A reflection is reported as a negative scale on every axis
    if (glm::determinant(m) < 0.0) {
        scale = -scale;
    }
    return scale;
}

glm::dvec3 TransformEngine::get_orientation() const {
    glm::dmat4 m = get_matrix();
    glm::dvec3 scale = get_scale();

    // Strip scaling from the basis vectors, leaving degenerate axes as identity
    glm::dmat4 rotation(1.0);
    for (int i = 0; i < 3; ++i) {
        if (scale[i] != 0.0) {
            rotation[i] = glm::dvec4(glm::dvec3(m[i]) / scale[i], 0.0);
        }
    }

    double y = 0.0;
    double x = 0.0;
    double z = 0.0;
    glm::extractEulerAngleYXZ(rotation, y, x, z);
    return glm::degrees(glm::dvec3(x, y, z));
}

// GlmTransformEngine implementation

GlmTransformEngine::GlmTransformEngine() : transforms(),
                                           next_serial(0u),
                                           pre_multiply_flag(false),
                                           inverse_flag(false),
                                           dirty(false),
                                           matrix(1.0) {
}

GlmTransformEngine::~GlmTransformEngine() {
}

std::unique_ptr<TransformEngine> GlmTransformEngine::clone() const {
    return std::make_unique<GlmTransformEngine>(*this);
}

void GlmTransformEngine::identity() {
    transforms.clear();
    dirty = true;
}

void GlmTransformEngine::set_matrix(const glm::dmat4& m) {
    identity();
    concatenate(m);
}

glm::dmat4 GlmTransformEngine::get_matrix() const {
    if (dirty) {
        recalculate();
    }
    return matrix;
}

void GlmTransformEngine::pre_multiply() {
    pre_multiply_flag = true;
}

void GlmTransformEngine::post_multiply() {
    pre_multiply_flag = false;
}

bool GlmTransformEngine::get_pre_multiply_flag() const {
    return pre_multiply_flag;
}

void GlmTransformEngine::concatenate(const glm::dmat4& m) {
    Entry entry { m, next_serial++ };
    bool pre = pre_multiply_flag;

    // While inverted the chain is stored un-inverted: N * inverse(M) == inverse(M * inverse(N)), so the new entry is
    // inverted and moved to the opposite end
    if (inverse_flag) {
        entry.matrix = invert_matrix(m);
        pre = !pre;
    }

    if (pre) {
        transforms.insert(transforms.begin(), entry);
    }
    else {
        transforms.push_back(entry);
    }
    dirty = true;
}

void GlmTransformEngine::pop() {
    if (transforms.empty()) {
        return;
    }

    auto newest = std::max_element(transforms.begin(), transforms.end(), [](const Entry& a, const Entry& b) {
        return a.serial < b.serial;
    });
    transforms.erase(newest);
    dirty = true;
}

std::size_t GlmTransformEngine::get_number_of_concatenated_transforms() const {
    return transforms.size();
}

glm::dmat4 GlmTransformEngine::get_concatenated_transform(std::size_t index) const {
    if (index >= transforms.size()) {
        throw std::out_of_range("concatenated transform index " + std::to_string(index) + " is out of range (" + std::to_string(transforms.size()) + " transforms)");
    }

    if (inverse_flag) {
        // Inverting the chain reverses its order
        return invert_matrix(transforms[transforms.size() - 1u - index].matrix);
    }
    return transforms[index].matrix;
}

void GlmTransformEngine::inverse() {
    inverse_flag = !inverse_flag;
    dirty = true;
}

bool GlmTransformEngine::get_inverse_flag() const {
    return inverse_flag;
}

void GlmTransformEngine::recalculate() const {
    glm::dmat4 result(1.0);
    for (const Entry& entry : transforms) {
        result = entry.matrix * result;
    }

    if (inverse_flag) {
        result = invert_matrix(result);
    }

    matrix = result;
    dirty = false;
}
