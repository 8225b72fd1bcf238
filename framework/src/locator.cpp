
#include "locator.hpp"

#include <limits> // std::numeric_limits
#include <stdexcept> // std::runtime_error, std::out_of_range
#include <utility> // std::move

Locator::Locator(std::vector<glm::vec3> p) : points(std::move(p)) {
}

Locator::~Locator() {
}

std::size_t Locator::find_closest_point(const glm::vec3& point) const {
    if (points.empty()) {
        throw std::runtime_error("failed to find closest point: locator is empty!");
    }

    std::size_t closest = 0u;
    float closest_distance = std::numeric_limits<float>::max();

    for (std::size_t i = 0u; i < points.size(); ++i) {
        glm::vec3 offset = points[i] - point;
        float distance = glm::dot(offset, offset);

        if (distance < closest_distance) {
            closest_distance = distance;
            closest = i;
        }
    }

    return closest;
}

std::size_t Locator::get_number_of_points() const {
    return points.size();
}

const glm::vec3& Locator::get_point(std::size_t index) const {
    if (index >= points.size()) {
        throw std::out_of_range("locator point index out of range");
    }
    return points[index];
}
