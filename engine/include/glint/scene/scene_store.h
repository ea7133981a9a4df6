#pragma once

#include <glint/scene/primitive.h>

#include <glm/glm.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace glint
{

// Authoritative primitive storage. Each type keeps its active slots as a
// contiguous prefix [0, count) capped at PRIMITIVE_CAPACITY; removal compacts.
// Every accepted mutation bumps revision(). Invalid input is rejected and logged,
// so an invalid scene never reaches the marching stage.
class SceneStore
{
public:
    // Adds a primitive with default parameters, offset so consecutive adds do not overlap.
    // Returns the new slot or -1 when the type is at capacity.
    int addPrimitive(PrimitiveType type);

    int addSphere(const Sphere& sphere);
    int addBox(const Box& box);
    int addTorus(const Torus& torus);

    bool removePrimitive(PrimitiveType type, int index);
    bool setParam(PrimitiveType type, int index, PrimitiveParam param, float value);
    std::optional<float> getParam(PrimitiveType type, int index, PrimitiveParam param) const;

    // Bulk replacement of one record; validated as a whole
    bool updateSphere(int index, const Sphere& sphere);
    bool updateBox(int index, const Box& box);
    bool updateTorus(int index, const Torus& torus);

    bool setPosition(const PrimitiveRef& ref, const glm::vec3& position);
    std::optional<glm::vec3> getPosition(const PrimitiveRef& ref) const;
    std::optional<glm::vec3> getColor(const PrimitiveRef& ref) const;

    bool isValid(const PrimitiveRef& ref) const;
    int count(PrimitiveType type) const;
    int totalCount() const;
    bool isFull(PrimitiveType type) const { return count(type) >= PRIMITIVE_CAPACITY; }

    const std::vector<Sphere>& getSpheres() const { return m_spheres; }
    const std::vector<Box>& getBoxes() const { return m_boxes; }
    const std::vector<Torus>& getTori() const { return m_tori; }

    uint64_t revision() const { return m_revision; }
    void clear();

    static bool validate(const Sphere& sphere);
    static bool validate(const Box& box);
    static bool validate(const Torus& torus);

private:
    template <typename T>
    int append(std::vector<T>& list, const T& value, PrimitiveType type);

    template <typename T>
    bool replace(std::vector<T>& list, int index, const T& value, PrimitiveType type);

    bool checkSlot(PrimitiveType type, int index) const;

    std::vector<Sphere> m_spheres;
    std::vector<Box> m_boxes;
    std::vector<Torus> m_tori;
    uint64_t m_revision = 0;
};

} // namespace glint
