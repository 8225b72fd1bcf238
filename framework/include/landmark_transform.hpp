#ifndef LANDMARK_TRANSFORM_HPP
#define LANDMARK_TRANSFORM_HPP

#include <glm/glm.hpp>
#include <vector> // std::vector

// Best-fit transform mapping a set of source landmarks onto a set of target landmarks (least squares)
//   - RigidBody:  rotation + translation
//   - Similarity: rotation + translation + uniform scale
//   - Affine:     general 3x4 affine map, needs at least four non-coplanar landmarks
// Rigid and similarity fits use the closed-form quaternion solution of Horn (1987)
class LandmarkTransform {
    public:
        enum class Mode {
            RigidBody,
            Similarity,
            Affine
        };
        
        LandmarkTransform(Mode mode = Mode::Similarity);
        ~LandmarkTransform();
        
        void set_mode(Mode mode);
        Mode get_mode() const;
        
        void set_source_landmarks(const std::vector<glm::dvec3>& landmarks);
        const std::vector<glm::dvec3>& get_source_landmarks() const;
        
        void set_target_landmarks(const std::vector<glm::dvec3>& landmarks);
        const std::vector<glm::dvec3>& get_target_landmarks() const;
        
        // Throws InvalidTransformError if the landmark sets differ in size or cannot determine an affine fit
        glm::dmat4 get_matrix() const;
        
    private:
        void recalculate() const;
        
        Mode mode;
        std::vector<glm::dvec3> source;
        std::vector<glm::dvec3> target;
        
        mutable bool dirty;
        mutable glm::dmat4 matrix;
};

#endif // LANDMARK_TRANSFORM_HPP
