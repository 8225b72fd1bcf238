
#include "transform.hpp"
#include "landmark_transform.hpp"
#include "model.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <glm/glm.hpp>

#include <cstring> // std::strcmp
#include <iostream> // std::cout, std::cerr, std::endl
#include <vector> // std::vector

// Walks a cube through a chain of transforms and prints the intermediate state

namespace {

    void print_bounds(const char* label, const Model& model) {
        glm::vec3 minimum;
        glm::vec3 maximum;
        model.get_bounds(minimum, maximum);

        std::cout << label << ": bounds [" << minimum.x << ", " << minimum.y << ", " << minimum.z << "] - ["
                  << maximum.x << ", " << maximum.y << ", " << maximum.z << "]" << std::endl;
    }

    void print_vector(const char* label, const glm::dvec3& v) {
        std::cout << label << ": (" << v.x << ", " << v.y << ", " << v.z << ")" << std::endl;
    }

}

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--verbose") == 0) {
            set_log_level(LogLevel::Trace);
        }
    }

    try {
        Model cube = load_cube();
        print_bounds("cube", cube);

        // Identity leaves the model untouched
        Transform identity;
        identity.apply_to(cube);
        print_bounds("after identity", cube);

        // Move the cube away from the origin, then spin it a quarter turn around a vertical axis through (1, 0, 0)
        Transform transform;
        transform.translate(glm::dvec3(2.0, 0.0, 0.0))
                 .rotate(90.0, glm::dvec3(0.0, 1.0, 0.0), glm::dvec3(1.0, 0.0, 0.0));
        std::cout << transform;
        print_vector("position", transform.get_position());
        print_vector("orientation", transform.get_orientation());

        // Double its size around its own position
        transform.scale(2.0);
        print_vector("scale", transform.get_scale());

        transform.apply_to(cube);
        print_bounds("after transform", cube);

        // Undo everything through the inverse
        Transform inverse = transform.compute_inverse();
        inverse.apply_to(cube);
        print_bounds("after inverse", cube);

        // Composition: a pre-multiplied rotation is applied before the existing translation
        Transform composed;
        composed.translate(glm::dvec3(0.0, 1.0, 0.0));
        composed.concatenate(Transform().rotate_z(90.0), true);
        std::cout << "concatenated transforms: " << composed.get_number_of_concatenated_transforms() << std::endl;
        print_vector("composed (1, 0, 0)", composed.apply_to(glm::dvec3(1.0, 0.0, 0.0)));

        // Recover a rigid motion from point correspondences
        std::vector<glm::dvec3> source = { glm::dvec3(0.0), glm::dvec3(1.0, 0.0, 0.0), glm::dvec3(0.0, 1.0, 0.0), glm::dvec3(0.0, 0.0, 1.0) };
        std::vector<glm::dvec3> target;
        for (const glm::dvec3& point : source) {
            target.emplace_back(transform.apply_to(point));
        }

        LandmarkTransform landmarks(LandmarkTransform::Mode::Similarity);
        landmarks.set_source_landmarks(source);
        landmarks.set_target_landmarks(target);
        std::cout << "landmark fit " << Transform(landmarks);
    }
    catch (std::runtime_error& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    return 0;
}
