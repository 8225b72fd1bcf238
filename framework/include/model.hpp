#ifndef MODEL_HPP
#define MODEL_HPP

#include "locator.hpp"

#include <glm/glm.hpp>
#include <functional> // std::function
#include <memory> // std::shared_ptr
#include <vector> // std::vector

class Transform;

struct Model {
    struct Vertex {
        glm::vec3 position;
        glm::vec3 normal;
        glm::vec2 uv;
    };
    
    std::vector<Vertex> vertices;
    std::vector<unsigned> indices; // Triangle list
    std::vector<unsigned> lines; // Pairs of vertex indices
    
    // Spatial lookup caches, built on first use from the current vertex positions
    // Anything that moves the vertices must reset them
    std::shared_ptr<Locator> point_locator;
    std::shared_ptr<Locator> cell_locator; // Over triangle centroids
    std::shared_ptr<Locator> line_locator; // Over segment midpoints
    
    // Last transform applied to this model
    std::shared_ptr<const Transform> transform;
    
    void transform_points(const std::function<glm::vec3(const glm::vec3&)>& mapping);
    void transform_normals(const std::function<glm::vec3(const glm::vec3&)>& mapping);
    
    // Replaces the geometry of this model with a copy of the geometry of 'other' (locators and transform are not copied)
    void deep_copy(const Model& other);
    
    const Locator& get_point_locator();
    const Locator& get_cell_locator();
    const Locator& get_line_locator();
    
    void get_bounds(glm::vec3& minimum, glm::vec3& maximum) const;
};

// Primitives
Model load_cube(); // Unit cube centered at the origin
Model load_plane(); // Unit square in the XZ plane, facing +Y

#endif // MODEL_HPP
