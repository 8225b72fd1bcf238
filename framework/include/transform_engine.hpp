#ifndef TRANSFORM_ENGINE_HPP
#define TRANSFORM_ENGINE_HPP

#include <glm/glm.hpp>
#include <memory> // std::unique_ptr
#include <vector> // std::vector

// Matrix engine backing a Transform
// The engine owns the concatenation list: every call to concatenate() adds one entry, and the current matrix is the
// composition of all entries in application order
//   - post-multiply (default): M = N * M, the new transform is applied after the existing ones
//   - pre-multiply:            M = M * N, the new transform is applied before the existing ones
// Translation, scaling and rotation are expressed as concatenations of their respective matrices
// All angles taken by the engine are in degrees

// Inverse of 'matrix', logs a warning when the matrix is (numerically) singular
glm::dmat4 invert_matrix(const glm::dmat4& matrix);

class TransformEngine {
    public:
        TransformEngine();
        virtual ~TransformEngine();

        virtual std::unique_ptr<TransformEngine> clone() const = 0;

        // Clears the concatenation list (the inverse flag is not affected)
        virtual void identity() = 0;

        // Replaces the concatenation list with a single entry
        virtual void set_matrix(const glm::dmat4& matrix) = 0;
        virtual glm::dmat4 get_matrix() const = 0;

        virtual void pre_multiply() = 0;
        virtual void post_multiply() = 0;
        virtual bool get_pre_multiply_flag() const = 0;

        virtual void concatenate(const glm::dmat4& matrix) = 0;

        // Removes the most recently concatenated entry
        virtual void pop() = 0;

        virtual std::size_t get_number_of_concatenated_transforms() const = 0;

        // Entries are returned in application order, as seen from the current (possibly inverted) matrix
        virtual glm::dmat4 get_concatenated_transform(std::size_t index) const = 0;

        virtual void inverse() = 0;
        virtual bool get_inverse_flag() const = 0;

        void translate(const glm::dvec3& offset);
        void scale(const glm::dvec3& factors);

        // Rotation about an axis through the origin of the coordinate system
        void rotate_wxyz(double degrees, const glm::dvec3& axis);
        void rotate_x(double degrees);
        void rotate_y(double degrees);
        void rotate_z(double degrees);

        glm::dvec3 transform_point(const glm::dvec3& point) const;

        // Normals are transformed by the inverse transpose of the upper 3x3 block and renormalized
        // Directions collapsed by a singular matrix come out as the zero vector
        glm::dvec3 transform_normal(const glm::dvec3& normal) const;

        // Decomposition of the current matrix
        glm::dvec3 get_position() const;
        glm::dvec3 get_scale() const; // Negative for all three axes if the matrix flips handedness
        glm::dvec3 get_orientation() const; // Euler angles (degrees), rotation = Ry * Rx * Rz
};

class GlmTransformEngine final : public TransformEngine {
    public:
        GlmTransformEngine();
        ~GlmTransformEngine() override;

        std::unique_ptr<TransformEngine> clone() const override;

        void identity() override;

        void set_matrix(const glm::dmat4& matrix) override;
        glm::dmat4 get_matrix() const override;

        void pre_multiply() override;
        void post_multiply() override;
        bool get_pre_multiply_flag() const override;

        void concatenate(const glm::dmat4& matrix) override;
        void pop() override;

        std::size_t get_number_of_concatenated_transforms() const override;
        glm::dmat4 get_concatenated_transform(std::size_t index) const override;

        void inverse() override;
        bool get_inverse_flag() const override;

    private:
        void recalculate() const;

        struct Entry {
            glm::dmat4 matrix;
            std::size_t serial; // Insertion order, used by pop()
        };

        // Stored in application order: transforms[0] is applied to a point first
        // While the inverse flag is set, entries describe the non-inverted chain
        std::vector<Entry> transforms;
        std::size_t next_serial;

        bool pre_multiply_flag;
        bool inverse_flag;

        // Cached composition of all entries
        mutable bool dirty;
        mutable glm::dmat4 matrix;
};

#endif // TRANSFORM_ENGINE_HPP
