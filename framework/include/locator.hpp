#ifndef LOCATOR_HPP
#define LOCATOR_HPP

#include <glm/glm.hpp>
#include <vector> // std::vector

// Nearest-entry lookup over a snapshot of coordinates
// The snapshot is taken on construction, a locator goes stale as soon as the geometry it was built from moves
class Locator {
    public:
        explicit Locator(std::vector<glm::vec3> points);
        ~Locator();

        // Returns the index of the closest stored coordinate, throws if the locator is empty
        std::size_t find_closest_point(const glm::vec3& point) const;

        std::size_t get_number_of_points() const;
        const glm::vec3& get_point(std::size_t index) const;

    private:
        std::vector<glm::vec3> points;
};

#endif // LOCATOR_HPP
