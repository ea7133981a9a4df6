#include "demo_scene.h"

#include <glint/core/camera.h>
#include <glint/core/log.h>
#include <glint/scene/scene_store.h>

#include <string>

void buildDemoScene(glint::SceneStore& store)
{
    store.clear();

    glint::Sphere body;
    body.center = { 0.0f, -0.25f, 0.0f };
    body.radius = 0.75f;
    body.color  = { 0.85f, 0.35f, 0.25f };
    store.addSphere(body);

    glint::Sphere head;
    head.center        = { 0.0f, 0.65f, 0.0f };
    head.radius        = 0.45f;
    head.color         = { 0.95f, 0.75f, 0.3f };
    head.blendMode     = glint::BlendMode::SmoothUnion;
    head.blendStrength = 0.35f;
    store.addSphere(head);

    // Carves a bite out of the body; only affects what was evaluated before it
    glint::Sphere bite;
    bite.center    = { 0.55f, -0.2f, 0.55f };
    bite.radius    = 0.35f;
    bite.blendMode = glint::BlendMode::Subtract;
    store.addSphere(bite);

    glint::Box pedestal;
    pedestal.center      = { 1.9f, -0.5f, 0.0f };
    pedestal.halfExtents = { 0.5f, 0.5f, 0.5f };
    pedestal.color       = { 0.3f, 0.55f, 0.85f };
    store.addBox(pedestal);

    glint::Torus ring;
    ring.center      = { -1.9f, -0.75f, 0.0f };
    ring.majorRadius = 0.6f;
    ring.minorRadius = 0.22f;
    ring.color       = { 0.35f, 0.8f, 0.45f };
    store.addTorus(ring);

    glint::Log::info("Demo scene: " + std::to_string(store.totalCount()) + " primitives");
}

void frameDemoScene(glint::Camera& camera)
{
    camera.setOrbit(glm::vec3(0.0f, -0.25f, 0.0f), 6.0f, 0.35f, 0.3f);
}
