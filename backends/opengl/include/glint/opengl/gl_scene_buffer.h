#pragma once

#include <cstdint>

namespace glint
{

class SceneStore;

// Shader storage buffer holding the packed GPUScene, re-uploaded only when
// the store's revision moves
class GLSceneBuffer
{
public:
    GLSceneBuffer() = default;
    ~GLSceneBuffer();

    GLSceneBuffer(const GLSceneBuffer&) = delete;
    GLSceneBuffer& operator=(const GLSceneBuffer&) = delete;

    bool init();
    void shutdown();

    void sync(const SceneStore& store);
    void bind(uint32_t binding) const;

    uint64_t getUploadCount() const { return m_uploadCount; }

private:
    uint32_t m_ssbo = 0;
    uint64_t m_uploadedRevision = 0;
    bool m_hasUpload = false;
    uint64_t m_uploadCount = 0;
};

} // namespace glint
