#include <glint/opengl/gl_scene_buffer.h>
#include <glint/core/log.h>
#include <glint/scene/scene_layout.h>
#include <glint/scene/scene_store.h>

#include <glad/glad.h>

namespace glint
{

GLSceneBuffer::~GLSceneBuffer()
{
    shutdown();
}

bool GLSceneBuffer::init()
{
    glGenBuffers(1, &m_ssbo);
    if (!m_ssbo)
    {
        Log::error("Failed to create scene buffer");
        return false;
    }

    GPUScene empty{};
    glBindBuffer(GL_SHADER_STORAGE_BUFFER, m_ssbo);
    glBufferData(GL_SHADER_STORAGE_BUFFER, sizeof(GPUScene), &empty, GL_DYNAMIC_DRAW);
    glBindBuffer(GL_SHADER_STORAGE_BUFFER, 0);
    return true;
}

void GLSceneBuffer::shutdown()
{
    if (m_ssbo)
    {
        glDeleteBuffers(1, &m_ssbo);
        m_ssbo = 0;
    }
    m_hasUpload = false;
}

void GLSceneBuffer::sync(const SceneStore& store)
{
    if (!m_ssbo || (m_hasUpload && m_uploadedRevision == store.revision()))
        return;

    GPUScene packed = packScene(store);
    glBindBuffer(GL_SHADER_STORAGE_BUFFER, m_ssbo);
    glBufferSubData(GL_SHADER_STORAGE_BUFFER, 0, sizeof(GPUScene), &packed);
    glBindBuffer(GL_SHADER_STORAGE_BUFFER, 0);

    m_uploadedRevision = store.revision();
    m_hasUpload = true;
    ++m_uploadCount;
}

void GLSceneBuffer::bind(uint32_t binding) const
{
    glBindBufferBase(GL_SHADER_STORAGE_BUFFER, binding, m_ssbo);
}

} // namespace glint
