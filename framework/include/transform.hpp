#ifndef TRANSFORM_HPP
#define TRANSFORM_HPP

#include "transform_engine.hpp"

#include <glm/glm.hpp>
#include <memory> // std::unique_ptr
#include <optional> // std::optional
#include <ostream> // std::ostream
#include <vector> // std::vector

struct Model;
class LandmarkTransform;

// Composable 3D affine transform
// Operations are concatenated in post-multiply order: each new translation / rotation / scale is applied after the
// ones already present. Mutating operations return the transform itself so calls can be chained
class Transform {
    public:
        struct Settings {
            Settings();

            // Element-wise tolerance used when deciding whether the matrix is the identity
            double identity_tolerance;
        };

        Transform();
        explicit Transform(const glm::dmat4& matrix);
        explicit Transform(const glm::dmat3& matrix);

        // Row-major 3x3 or 4x4 matrix, a 3x3 input is embedded into the identity
        explicit Transform(const std::vector<std::vector<double>>& rows);
        explicit Transform(const LandmarkTransform& landmarks);

        Transform(const Transform& other);
        Transform(Transform&& other);
        ~Transform();

        Transform& operator=(const Transform& other);
        Transform& operator=(Transform&& other);

        glm::dvec3 apply_to(const glm::dvec3& point) const;
        std::vector<double> apply_to(const std::vector<double>& point) const; // 2D points are placed at z = 0

        // Transforms the vertex positions and normals of the model in place and invalidates its locators
        // The model keeps a copy of this transform, geometry is left untouched if the transform is the identity
        void apply_to(Model& model) const;

        Transform& reset();
        Transform& pop();
        Transform& invert();
        Transform compute_inverse() const;
        Transform clone() const;

        Transform& concatenate(const Transform& other, bool pre_multiply = false);
        Transform get_concatenated_transform(std::size_t index) const;
        std::size_t get_number_of_concatenated_transforms() const;

        Transform& translate(const glm::dvec3& offset);

        // Origin: true scales around the current position, false around the world origin, a point around that point
        Transform& scale(double factor, bool origin = true);
        Transform& scale(double factor, const glm::dvec3& origin);
        Transform& scale(const glm::dvec3& factors, bool origin = true);
        Transform& scale(const glm::dvec3& factors, const glm::dvec3& origin);

        // Rotation around an arbitrary axis passing through 'point'
        Transform& rotate(double angle, const glm::dvec3& axis = glm::dvec3(1.0, 0.0, 0.0), const glm::dvec3& point = glm::dvec3(0.0), bool rad = false);
        Transform& rotate_x(double angle, bool rad = false, const std::optional<glm::dvec3>& around = std::nullopt);
        Transform& rotate_y(double angle, bool rad = false, const std::optional<glm::dvec3>& around = std::nullopt);
        Transform& rotate_z(double angle, bool rad = false, const std::optional<glm::dvec3>& around = std::nullopt);

        Transform& set_position(const glm::dvec2& position);
        Transform& set_position(const glm::dvec3& position);
        glm::dvec3 get_position() const;

        // Absolute scale, axes with a current scale of zero are left unchanged
        Transform& set_scale(double scale);
        Transform& set_scale(const glm::dvec3& scale);
        glm::dvec3 get_scale() const;

        glm::dvec3 get_orientation() const; // Euler angles in degrees

        void set_matrix(const glm::dmat4& matrix);
        void set_matrix(const glm::dmat3& matrix);
        void set_matrix(const std::vector<std::vector<double>>& rows);
        glm::dmat4 get_matrix() const;
        glm::dmat3 get_matrix3x3() const;
        std::vector<std::vector<double>> get_matrix_rows() const; // Row-major

        bool get_inverse_flag() const;
        bool is_identity() const;

        const Settings& get_settings() const;
        void set_identity_tolerance(double tolerance);

    private:
        enum class Axis {
            X,
            Y,
            Z
        };

        Transform& rotate_around(Axis axis, double angle, bool rad, const std::optional<glm::dvec3>& around);

        std::unique_ptr<TransformEngine> engine;
        bool inverse_flag;
        Settings settings;
};

std::ostream& operator<<(std::ostream& stream, const Transform& transform);

#endif // TRANSFORM_HPP
