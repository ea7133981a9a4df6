#pragma once

#include <glint/scene/object_id.h>
#include <glint/scene/primitive.h>

#include <glm/glm.hpp>

namespace glint
{

class SceneStore;

struct FieldSample
{
    float distance = 0.0f;
    SurfaceRef surface;
    glm::vec3 color{0.0f};
};

// How far a Smooth Union reaches into the primitives evaluated after it.
//   PreviousTerm: a smooth primitive blends with the accumulated field only;
//                 the result is independent of what follows it.
//   WithinRadius: after a smooth primitive with strength k, every later plain
//                 Union primitive whose distance lies within k of the
//                 accumulator is smooth-blended with that k as well. Results
//                 then depend on storage order (spheres, boxes, tori).
enum class SmoothPropagation
{
    PreviousTerm,
    WithinRadius
};

const char* toString(SmoothPropagation propagation);

namespace sdf
{

float plane(const glm::vec3& p);
float sphere(const glm::vec3& p, const glm::vec3& center, float radius);
float box(const glm::vec3& p, const glm::vec3& center, const glm::vec3& halfExtents);
float torus(const glm::vec3& p, const glm::vec3& center, float majorRadius, float minorRadius);

// CSG operators on the running sample `acc` and a new primitive `cand`
FieldSample opUnion(const FieldSample& acc, const FieldSample& cand);
FieldSample opSmoothUnion(const FieldSample& acc, const FieldSample& cand, float k);
FieldSample opSubtract(const FieldSample& acc, const FieldSample& cand);
FieldSample opIntersect(const FieldSample& acc, const FieldSample& cand);
FieldSample opXor(const FieldSample& acc, const FieldSample& cand);

FieldSample combine(BlendMode mode, const FieldSample& acc, const FieldSample& cand, float k);

} // namespace sdf

// Signed distance to the whole scene: the ground plane y = -1 combined with every
// active primitive in storage order. Holds a reference; the store must not be
// mutated while a pass evaluates it.
class DistanceField
{
public:
    static constexpr float GROUND_HEIGHT = -1.0f;
    static constexpr float MIN_BLEND_STRENGTH = 1e-4f;
    static constexpr float NORMAL_EPSILON = 0.001f;

    explicit DistanceField(const SceneStore& store,
                           SmoothPropagation propagation = SmoothPropagation::PreviousTerm);

    FieldSample evaluate(const glm::vec3& p) const;
    float distance(const glm::vec3& p) const { return evaluate(p).distance; }

    // Central-difference gradient; (0, 1, 0) where the gradient vanishes
    glm::vec3 normal(const glm::vec3& p, float eps = NORMAL_EPSILON) const;

    SmoothPropagation getPropagation() const { return m_propagation; }
    const SceneStore& getStore() const { return m_store; }

    static glm::vec3 groundAlbedo(const glm::vec3& p);

private:
    const SceneStore& m_store;
    SmoothPropagation m_propagation;
};

} // namespace glint
