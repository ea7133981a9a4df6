#include <glint/opengl/gl_compute_program.h>
#include <glint/core/log.h>

#include <glad/glad.h>

#include <fstream>
#include <sstream>

namespace glint
{

static constexpr const char* GLSL_VERSION_LINE = "#version 460 core\n";

GLComputeProgram::~GLComputeProgram()
{
    release();
}

void GLComputeProgram::release()
{
    if (m_program)
    {
        glDeleteProgram(m_program);
        m_program = 0;
    }
}

bool GLComputeProgram::readSources(std::string& source)
{
    source = GLSL_VERSION_LINE;
    for (size_t i = 0; i < m_paths.size(); ++i)
    {
        const std::string& path = m_paths[i];
        std::ifstream file(path);
        if (!file.is_open())
        {
            m_lastError = "Failed to open compute shader: " + path;
            return false;
        }

        std::stringstream ss;
        ss << file.rdbuf();
        // Diagnostics report "<file index>(<line>)"
        source += "#line 1 " + std::to_string(i) + "\n";
        source += ss.str();
        source += "\n";
    }
    return true;
}

bool GLComputeProgram::load(const std::vector<std::string>& paths)
{
    m_paths = paths;
    return reload();
}

bool GLComputeProgram::reload()
{
    // A failed build leaves no program behind, so nothing stale gets dispatched
    release();
    m_lastError.clear();

    std::string source;
    if (!readSources(source))
    {
        Log::error(m_lastError);
        return false;
    }

    uint32_t shader = glCreateShader(GL_COMPUTE_SHADER);
    const char* src = source.c_str();
    glShaderSource(shader, 1, &src, nullptr);
    glCompileShader(shader);

    GLint result;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &result);
    if (result == GL_FALSE)
    {
        GLint length = 0;
        glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &length);
        std::string infoLog(static_cast<size_t>(length), '\0');
        glGetShaderInfoLog(shader, length, &length, infoLog.data());
        infoLog.resize(static_cast<size_t>(length));

        m_lastError = "Compute shader compile error (" + m_paths.back() + "):\n" + infoLog;
        for (size_t i = 0; i < m_paths.size(); ++i)
            m_lastError += "\n  file " + std::to_string(i) + ": " + m_paths[i];
        Log::error(m_lastError);
        glDeleteShader(shader);
        return false;
    }

    m_program = glCreateProgram();
    glAttachShader(m_program, shader);
    glLinkProgram(m_program);
    glDeleteShader(shader);

    glGetProgramiv(m_program, GL_LINK_STATUS, &result);
    if (result == GL_FALSE)
    {
        GLint length = 0;
        glGetProgramiv(m_program, GL_INFO_LOG_LENGTH, &length);
        std::string infoLog(static_cast<size_t>(length), '\0');
        glGetProgramInfoLog(m_program, length, &length, infoLog.data());
        infoLog.resize(static_cast<size_t>(length));

        m_lastError = "Compute shader link error (" + m_paths.back() + "):\n" + infoLog;
        Log::error(m_lastError);
        release();
        return false;
    }

    Log::info("Compiled compute program " + m_paths.back());
    return true;
}

int32_t GLComputeProgram::uniformLocation(const char* name) const
{
    return m_program ? glGetUniformLocation(m_program, name) : -1;
}

} // namespace glint
