
#include "transform.hpp"
#include "landmark_transform.hpp"
#include "model.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <glm/gtc/quaternion.hpp>

#include <cmath> // std::abs, std::cos, std::sin
#include <string> // std::string, std::to_string

namespace {

    // Copies a row-major 3x3 or 4x4 matrix element by element, a 3x3 input keeps the homogeneous row / column of the identity
    glm::dmat4 rows_to_matrix(const std::vector<std::vector<double>>& rows) {
        std::size_t n = rows.size();
        if (n != 3u && n != 4u) {
            throw InvalidTransformError("expected a 3x3 or 4x4 matrix, got " + std::to_string(n) + " rows");
        }

        glm::dmat4 matrix(1.0);
        for (std::size_t i = 0u; i < n; ++i) {
            if (rows[i].size() != n) {
                throw InvalidTransformError("matrix row " + std::to_string(i) + " has " + std::to_string(rows[i].size()) + " elements, expected " + std::to_string(n));
            }

            for (std::size_t j = 0u; j < n; ++j) {
                matrix[j][i] = rows[i][j]; // glm is indexed [column][row]
            }
        }
        return matrix;
    }

}

Transform::Settings::Settings() : identity_tolerance(1e-12) {
}

Transform::Transform() : engine(std::make_unique<GlmTransformEngine>()),
                         inverse_flag(false),
                         settings() {
    engine->post_multiply();
}

Transform::Transform(const glm::dmat4& matrix) : Transform() {
    engine->set_matrix(matrix);
}

Transform::Transform(const glm::dmat3& matrix) : Transform() {
    engine->set_matrix(glm::dmat4(matrix));
}

Transform::Transform(const std::vector<std::vector<double>>& rows) : Transform() {
    engine->set_matrix(rows_to_matrix(rows));
}

Transform::Transform(const LandmarkTransform& landmarks) : Transform() {
    engine->set_matrix(landmarks.get_matrix());
}

Transform::Transform(const Transform& other) : engine(other.engine->clone()),
                                               inverse_flag(other.inverse_flag),
                                               settings(other.settings) {
}

Transform::Transform(Transform&& other) : engine(std::move(other.engine)),
                                          inverse_flag(other.inverse_flag),
                                          settings(other.settings) {
    // Leave the moved-from transform usable as an identity
    other.engine = std::make_unique<GlmTransformEngine>();
    other.inverse_flag = false;
}

Transform::~Transform() {
}

Transform& Transform::operator=(const Transform& other) {
    if (this == &other) {
        return *this;
    }

    engine = other.engine->clone();
    inverse_flag = other.inverse_flag;
    settings = other.settings;

    return *this;
}

Transform& Transform::operator=(Transform&& other) {
    if (this == &other) {
        return *this;
    }

    engine = std::move(other.engine);
    inverse_flag = other.inverse_flag;
    settings = other.settings;

    other.engine = std::make_unique<GlmTransformEngine>();
    other.inverse_flag = false;

    return *this;
}

glm::dvec3 Transform::apply_to(const glm::dvec3& point) const {
    return engine->transform_point(point);
}

std::vector<double> Transform::apply_to(const std::vector<double>& point) const {
    glm::dvec3 p;
    if (point.size() == 2u) {
        p = glm::dvec3(point[0], point[1], 0.0);
    }
    else if (point.size() == 3u) {
        p = glm::dvec3(point[0], point[1], point[2]);
    }
    else {
        throw InvalidTransformError("expected a 2D or 3D point, got " + std::to_string(point.size()) + " coordinates");
    }

    glm::dvec3 result = engine->transform_point(p);
    return { result.x, result.y, result.z };
}

void Transform::apply_to(Model& model) const {
    model.transform = std::make_shared<const Transform>(*this);

    if (is_identity()) {
        log_message(LogLevel::Trace, "transform is the identity, model geometry left unchanged");
        return;
    }

    Model output { };
    output.deep_copy(model);
    output.transform_points([this](const glm::vec3& position) {
        return glm::vec3(engine->transform_point(glm::dvec3(position)));
    });
    output.transform_normals([this](const glm::vec3& normal) {
        return glm::vec3(engine->transform_normal(glm::dvec3(normal)));
    });
    model.deep_copy(output);

    // Locators index the old coordinates
    model.point_locator.reset();
    model.cell_locator.reset();
    model.line_locator.reset();

    log_message(LogLevel::Trace, "transformed " + std::to_string(model.vertices.size()) + " model vertices");
}

Transform& Transform::reset() {
    engine->identity();
    return *this;
}

Transform& Transform::pop() {
    engine->pop();
    return *this;
}

Transform& Transform::invert() {
    engine->inverse();
    inverse_flag = engine->get_inverse_flag();
    return *this;
}

Transform Transform::compute_inverse() const {
    Transform inverse(invert_matrix(get_matrix()));
    inverse.settings = settings;
    return inverse;
}

Transform Transform::clone() const {
    return Transform(*this);
}

Transform& Transform::concatenate(const Transform& other, bool pre_multiply) {
    if (pre_multiply) {
        engine->pre_multiply();
    }
    engine->concatenate(other.get_matrix());
    engine->post_multiply();
    return *this;
}

Transform Transform::get_concatenated_transform(std::size_t index) const {
    Transform transform(engine->get_concatenated_transform(index));
    transform.settings = settings;
    return transform;
}

std::size_t Transform::get_number_of_concatenated_transforms() const {
    return engine->get_number_of_concatenated_transforms();
}

Transform& Transform::translate(const glm::dvec3& offset) {
    engine->translate(offset);
    return *this;
}

Transform& Transform::scale(double factor, bool origin) {
    return scale(glm::dvec3(factor), origin);
}

Transform& Transform::scale(double factor, const glm::dvec3& origin) {
    return scale(glm::dvec3(factor), origin);
}

Transform& Transform::scale(const glm::dvec3& factors, bool origin) {
    if (origin) {
        // Scale around the current position
        glm::dvec3 position = engine->get_position();
        if (glm::length(position) > 0.0) {
            engine->translate(-position);
            engine->scale(factors);
            engine->translate(position);
            return *this;
        }
    }

    engine->scale(factors);
    return *this;
}

Transform& Transform::scale(const glm::dvec3& factors, const glm::dvec3& origin) {
    engine->translate(-origin);
    engine->scale(factors);
    engine->translate(origin);
    return *this;
}

Transform& Transform::rotate(double angle, const glm::dvec3& axis, const glm::dvec3& point, bool rad) {
    double length = glm::length(axis);
    if (!(length > 0.0)) {
        throw InvalidTransformError("rotation axis must have a non-zero length");
    }

    double radians = rad ? angle : glm::radians(angle);
    glm::dvec3 direction = axis / length;

    // Rotation matrix derived from the quaternion of the half angle
    glm::dquat rotation(std::cos(radians / 2.0), direction * std::sin(radians / 2.0));
    glm::dmat3 R = glm::mat3_cast(rotation);

    // Where the current position has to end up when rotating around 'point'
    glm::dvec3 target = R * (engine->get_position() - point) + point;

    // The engine only rotates around the origin, so the position is corrected afterwards
    engine->rotate_wxyz(glm::degrees(radians), direction);
    engine->translate(target - engine->get_position());
    return *this;
}

Transform& Transform::rotate_x(double angle, bool rad, const std::optional<glm::dvec3>& around) {
    return rotate_around(Axis::X, angle, rad, around);
}

Transform& Transform::rotate_y(double angle, bool rad, const std::optional<glm::dvec3>& around) {
    return rotate_around(Axis::Y, angle, rad, around);
}

Transform& Transform::rotate_z(double angle, bool rad, const std::optional<glm::dvec3>& around) {
    return rotate_around(Axis::Z, angle, rad, around);
}

Transform& Transform::rotate_around(Axis axis, double angle, bool rad, const std::optional<glm::dvec3>& around) {
    double degrees = rad ? glm::degrees(angle) : angle;

    // Bring the pivot to the origin for the duration of the rotation
    if (around) {
        engine->translate(-*around);
    }

    switch (axis) {
        case Axis::X:
            engine->rotate_x(degrees);
            break;
        case Axis::Y:
            engine->rotate_y(degrees);
            break;
        case Axis::Z:
            engine->rotate_z(degrees);
            break;
    }

    if (around) {
        engine->translate(*around);
    }
    return *this;
}

Transform& Transform::set_position(const glm::dvec2& position) {
    return set_position(glm::dvec3(position, 0.0));
}

Transform& Transform::set_position(const glm::dvec3& position) {
    engine->translate(position - engine->get_position());
    return *this;
}

glm::dvec3 Transform::get_position() const {
    return engine->get_position();
}

Transform& Transform::set_scale(double scale) {
    return set_scale(glm::dvec3(scale));
}

Transform& Transform::set_scale(const glm::dvec3& scale) {
    glm::dvec3 current = engine->get_scale();
    glm::dvec3 factors(1.0);

    // TODO: scaling happens around the native origin, so the result is off after earlier scales around a pivot
    for (int i = 0; i < 3; ++i) {
        if (current[i] != 0.0) {
            factors[i] = scale[i] / current[i];
        }
    }

    engine->scale(factors);
    return *this;
}

glm::dvec3 Transform::get_scale() const {
    return engine->get_scale();
}

glm::dvec3 Transform::get_orientation() const {
    return engine->get_orientation();
}

void Transform::set_matrix(const glm::dmat4& matrix) {
    engine->set_matrix(matrix);
}

void Transform::set_matrix(const glm::dmat3& matrix) {
    engine->set_matrix(glm::dmat4(matrix));
}

void Transform::set_matrix(const std::vector<std::vector<double>>& rows) {
    engine->set_matrix(rows_to_matrix(rows));
}

glm::dmat4 Transform::get_matrix() const {
    return engine->get_matrix();
}

glm::dmat3 Transform::get_matrix3x3() const {
    return glm::dmat3(engine->get_matrix());
}

std::vector<std::vector<double>> Transform::get_matrix_rows() const {
    glm::dmat4 matrix = engine->get_matrix();

    std::vector<std::vector<double>> rows(4, std::vector<double>(4, 0.0));
    for (int i = 0; i < 4; ++i) {
        for (int j = 0; j < 4; ++j) {
            rows[i][j] = matrix[j][i];
        }
    }
    return rows;
}

bool Transform::get_inverse_flag() const {
    return inverse_flag;
}

bool Transform::is_identity() const {
    glm::dmat4 matrix = engine->get_matrix();

    for (int column = 0; column < 4; ++column) {
        for (int row = 0; row < 4; ++row) {
            double expected = (column == row) ? 1.0 : 0.0;
            if (!(std::abs(matrix[column][row] - expected) < settings.identity_tolerance)) {
                return false;
            }
        }
    }
    return true;
}

const Transform::Settings& Transform::get_settings() const {
    return settings;
}

void Transform::set_identity_tolerance(double tolerance) {
    settings.identity_tolerance = tolerance;
}

std::ostream& operator<<(std::ostream& stream, const Transform& transform) {
    stream << "Transformation Matrix 4x4:" << std::endl;
    for (const std::vector<double>& row : transform.get_matrix_rows()) {
        stream << "[" << row[0] << ", " << row[1] << ", " << row[2] << ", " << row[3] << "]" << std::endl;
    }
    return stream;
}
