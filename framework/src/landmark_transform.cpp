
#include "landmark_transform.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <glm/gtc/quaternion.hpp>
#include <Eigen/Dense>

#include <cmath> // std::abs, std::sqrt
#include <string> // std::to_string

namespace {

    Eigen::Vector3d to_eigen(const glm::dvec3& v) {
        return Eigen::Vector3d(v.x, v.y, v.z);
    }

    // Copies the linear part of an Eigen matrix into the upper 3x3 block of a glm matrix
    glm::dmat4 to_glm(const Eigen::Matrix3d& m) {
        glm::dmat4 result(1.0);
        for (int column = 0; column < 3; ++column) {
            for (int row = 0; row < 3; ++row) {
                result[column][row] = m(row, column); // glm is indexed [column][row]
            }
        }
        return result;
    }

}

LandmarkTransform::LandmarkTransform(Mode mode) : mode(mode),
                                                  source(),
                                                  target(),
                                                  dirty(true),
                                                  matrix(1.0) {
}

LandmarkTransform::~LandmarkTransform() {
}

void LandmarkTransform::set_mode(Mode m) {
    mode = m;
    dirty = true;
}

LandmarkTransform::Mode LandmarkTransform::get_mode() const {
    return mode;
}

void LandmarkTransform::set_source_landmarks(const std::vector<glm::dvec3>& landmarks) {
    source = landmarks;
    dirty = true;
}

const std::vector<glm::dvec3>& LandmarkTransform::get_source_landmarks() const {
    return source;
}

void LandmarkTransform::set_target_landmarks(const std::vector<glm::dvec3>& landmarks) {
    target = landmarks;
    dirty = true;
}

const std::vector<glm::dvec3>& LandmarkTransform::get_target_landmarks() const {
    return target;
}

glm::dmat4 LandmarkTransform::get_matrix() const {
    if (dirty) {
        recalculate();
    }
    return matrix;
}

void LandmarkTransform::recalculate() const {
    std::size_t count = source.size();
    if (count != target.size()) {
        throw InvalidTransformError("source and target landmarks differ in size (" + std::to_string(count) + " vs " + std::to_string(target.size()) + ")");
    }

    glm::dmat4 result(1.0);

    if (count == 0u) {
        matrix = result;
        dirty = false;
        return;
    }

    glm::dvec3 source_centroid(0.0);
    glm::dvec3 target_centroid(0.0);
    for (std::size_t i = 0u; i < count; ++i) {
        source_centroid += source[i];
        target_centroid += target[i];
    }
    source_centroid /= static_cast<double>(count);
    target_centroid /= static_cast<double>(count);

    // A single landmark only determines a translation
    if (count == 1u) {
        result[3] = glm::dvec4(target_centroid - source_centroid, 1.0);
        matrix = result;
        dirty = false;
        return;
    }

    if (mode == Mode::Affine) {
        // Solve A * L = R for the linear part using centered landmarks
        Eigen::Matrix3d L = Eigen::Matrix3d::Zero();
        Eigen::Matrix3d R = Eigen::Matrix3d::Zero();
        for (std::size_t i = 0u; i < count; ++i) {
            Eigen::Vector3d s = to_eigen(source[i] - source_centroid);
            Eigen::Vector3d t = to_eigen(target[i] - target_centroid);
            L += s * s.transpose();
            R += t * s.transpose();
        }

        double trace = L.trace() / 3.0;
        if (!(std::abs(L.determinant()) > 1e-12 * trace * trace * trace)) {
            throw InvalidTransformError("affine landmark fit requires at least four non-coplanar landmarks");
        }

        // L is symmetric, so A^T = L^-1 * R^T
        Eigen::Matrix3d A = L.ldlt().solve(R.transpose()).transpose();

        result = to_glm(A);
        result[3] = glm::dvec4(target_centroid - glm::dmat3(result) * source_centroid, 1.0);
        matrix = result;
        dirty = false;
        return;
    }

    // Cross-covariance S(a, b) = sum(s_a * t_b) of the centered landmarks
    Eigen::Matrix3d S = Eigen::Matrix3d::Zero();
    double source_spread = 0.0;
    double target_spread = 0.0;
    for (std::size_t i = 0u; i < count; ++i) {
        Eigen::Vector3d s = to_eigen(source[i] - source_centroid);
        Eigen::Vector3d t = to_eigen(target[i] - target_centroid);

        S += s * t.transpose();
        source_spread += s.squaredNorm();
        target_spread += t.squaredNorm();
    }

    if (source_spread == 0.0) {
        log_message(LogLevel::Warning, "source landmarks are coincident, landmark fit reduced to a translation");
        result[3] = glm::dvec4(target_centroid - source_centroid, 1.0);
        matrix = result;
        dirty = false;
        return;
    }

    // The optimal rotation is the unit quaternion (w, x, y, z) along the eigenvector of the largest eigenvalue of N
    Eigen::Matrix4d N;
    N(0, 0) = S(0, 0) + S(1, 1) + S(2, 2);
    N(1, 1) = S(0, 0) - S(1, 1) - S(2, 2);
    N(2, 2) = -S(0, 0) + S(1, 1) - S(2, 2);
    N(3, 3) = -S(0, 0) - S(1, 1) + S(2, 2);
    N(0, 1) = N(1, 0) = S(1, 2) - S(2, 1);
    N(0, 2) = N(2, 0) = S(2, 0) - S(0, 2);
    N(0, 3) = N(3, 0) = S(0, 1) - S(1, 0);
    N(1, 2) = N(2, 1) = S(0, 1) + S(1, 0);
    N(1, 3) = N(3, 1) = S(2, 0) + S(0, 2);
    N(2, 3) = N(3, 2) = S(1, 2) + S(2, 1);

    Eigen::SelfAdjointEigenSolver<Eigen::Matrix4d> solver(N);
    if (solver.info() != Eigen::Success) {
        throw TransformError("landmark fit failed: eigen decomposition did not converge");
    }

    // Eigenvalues are sorted in increasing order
    Eigen::Vector4d q = solver.eigenvectors().col(3);

    glm::dquat rotation(q(0), q(1), q(2), q(3));
    glm::dmat3 linear = glm::mat3_cast(glm::normalize(rotation));

    if (mode == Mode::Similarity) {
        linear *= std::sqrt(target_spread / source_spread);
    }

    result = glm::dmat4(linear);
    result[3] = glm::dvec4(target_centroid - linear * source_centroid, 1.0);
    matrix = result;
    dirty = false;
}
