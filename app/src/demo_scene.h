#pragma once

namespace glint { class SceneStore; class Camera; }

// Starting content: one of each primitive type plus a smooth blend and a carve
void buildDemoScene(glint::SceneStore& store);
void frameDemoScene(glint::Camera& camera);
