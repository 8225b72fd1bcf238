
#include "model.hpp"

#include <limits> // std::numeric_limits
#include <stdexcept> // std::runtime_error
#include <string> // std::to_string
#include <utility> // std::move

void Model::transform_points(const std::function<glm::vec3(const glm::vec3&)>& mapping) {
    for (Vertex& vertex : vertices) {
        vertex.position = mapping(vertex.position);
    }
}

void Model::transform_normals(const std::function<glm::vec3(const glm::vec3&)>& mapping) {
    for (Vertex& vertex : vertices) {
        vertex.normal = mapping(vertex.normal);
    }
}

void Model::deep_copy(const Model& other) {
    if (this == &other) {
        return;
    }
    
    vertices = other.vertices;
    indices = other.indices;
    lines = other.lines;
}

const Locator& Model::get_point_locator() {
    if (!point_locator) {
        std::vector<glm::vec3> points;
        points.reserve(vertices.size());
        
        for (const Vertex& vertex : vertices) {
            points.emplace_back(vertex.position);
        }
        point_locator = std::make_shared<Locator>(std::move(points));
    }
    return *point_locator;
}

const Locator& Model::get_cell_locator() {
    if (!cell_locator) {
        if (indices.size() % 3 != 0) {
            throw std::runtime_error("failed to build cell locator: index count is not a multiple of 3!");
        }
        
        std::vector<glm::vec3> centroids;
        centroids.reserve(indices.size() / 3);
        
        for (std::size_t i = 0u; i < indices.size(); i += 3) {
            for (std::size_t j = 0u; j < 3u; ++j) {
                if (indices[i + j] >= vertices.size()) {
                    throw std::runtime_error("failed to build cell locator: vertex index " + std::to_string(indices[i + j]) + " is out of range (" + std::to_string(vertices.size()) + " vertices)!");
                }
            }
            
            const glm::vec3& vertex1 = vertices[indices[i + 0]].position;
            const glm::vec3& vertex2 = vertices[indices[i + 1]].position;
            const glm::vec3& vertex3 = vertices[indices[i + 2]].position;
            centroids.emplace_back((vertex1 + vertex2 + vertex3) / 3.0f);
        }
        cell_locator = std::make_shared<Locator>(std::move(centroids));
    }
    return *cell_locator;
}

const Locator& Model::get_line_locator() {
    if (!line_locator) {
        if (lines.size() % 2 != 0) {
            throw std::runtime_error("failed to build line locator: line index count is not a multiple of 2!");
        }
        
        std::vector<glm::vec3> midpoints;
        midpoints.reserve(lines.size() / 2);
        
        for (std::size_t i = 0u; i < lines.size(); i += 2) {
            if (lines[i] >= vertices.size() || lines[i + 1] >= vertices.size()) {
                throw std::runtime_error("failed to build line locator: segment " + std::to_string(i / 2) + " references a vertex out of range (" + std::to_string(vertices.size()) + " vertices)!");
            }
            midpoints.emplace_back((vertices[lines[i]].position + vertices[lines[i + 1]].position) / 2.0f);
        }
        line_locator = std::make_shared<Locator>(std::move(midpoints));
    }
    return *line_locator;
}

void Model::get_bounds(glm::vec3& minimum, glm::vec3& maximum) const {
    minimum = glm::vec3(std::numeric_limits<float>::max());
    maximum = glm::vec3(std::numeric_limits<float>::lowest());
    
    for (const Vertex& vertex : vertices) {
        minimum = glm::min(minimum, vertex.position);
        maximum = glm::max(maximum, vertex.position);
    }
}

Model load_cube() {
    Model model { };
    
    // One quad per face so that every face gets its own normals
    struct Face {
        glm::vec3 normal;
        glm::vec3 u; // Face tangent
        glm::vec3 v; // Face bitangent, u x v == normal
    };
    
    const Face faces[6] = {
        { glm::vec3( 1.0f,  0.0f,  0.0f), glm::vec3( 0.0f,  0.0f, -1.0f), glm::vec3(0.0f, 1.0f,  0.0f) },
        { glm::vec3(-1.0f,  0.0f,  0.0f), glm::vec3( 0.0f,  0.0f,  1.0f), glm::vec3(0.0f, 1.0f,  0.0f) },
        { glm::vec3( 0.0f,  1.0f,  0.0f), glm::vec3( 1.0f,  0.0f,  0.0f), glm::vec3(0.0f, 0.0f, -1.0f) },
        { glm::vec3( 0.0f, -1.0f,  0.0f), glm::vec3( 1.0f,  0.0f,  0.0f), glm::vec3(0.0f, 0.0f,  1.0f) },
        { glm::vec3( 0.0f,  0.0f,  1.0f), glm::vec3( 1.0f,  0.0f,  0.0f), glm::vec3(0.0f, 1.0f,  0.0f) },
        { glm::vec3( 0.0f,  0.0f, -1.0f), glm::vec3(-1.0f,  0.0f,  0.0f), glm::vec3(0.0f, 1.0f,  0.0f) },
    };
    
    const glm::vec2 corners[4] = { glm::vec2(0.0f, 0.0f), glm::vec2(1.0f, 0.0f), glm::vec2(1.0f, 1.0f), glm::vec2(0.0f, 1.0f) };
    
    for (const Face& face : faces) {
        unsigned base = static_cast<unsigned>(model.vertices.size());
        
        for (const glm::vec2& uv : corners) {
            Model::Vertex& vertex = model.vertices.emplace_back();
            vertex.position = 0.5f * face.normal + (uv.x - 0.5f) * face.u + (uv.y - 0.5f) * face.v;
            vertex.normal = face.normal;
            vertex.uv = uv;
        }
        
        // Counter-clockwise when viewed from outside
        model.indices.insert(model.indices.end(), { base + 0, base + 1, base + 2, base + 0, base + 2, base + 3 });
    }
    
    return model;
}

Model load_plane() {
    Model model { };
    
    const glm::vec2 corners[4] = { glm::vec2(0.0f, 0.0f), glm::vec2(1.0f, 0.0f), glm::vec2(1.0f, 1.0f), glm::vec2(0.0f, 1.0f) };
    
    for (const glm::vec2& uv : corners) {
        Model::Vertex& vertex = model.vertices.emplace_back();
        vertex.position = glm::vec3(uv.x - 0.5f, 0.0f, 0.5f - uv.y);
        vertex.normal = glm::vec3(0.0f, 1.0f, 0.0f);
        vertex.uv = uv;
    }
    
    model.indices = { 0, 1, 2, 0, 2, 3 };
    
    // Outline
    model.lines = { 0, 1, 1, 2, 2, 3, 3, 0 };
    
    return model;
}
