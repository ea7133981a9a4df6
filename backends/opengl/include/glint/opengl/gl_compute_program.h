#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace glint
{

// Compute program built from several source files concatenated after one
// #version line, so passes can share sdf_common.glsl.
class GLComputeProgram
{
public:
    GLComputeProgram() = default;
    ~GLComputeProgram();

    GLComputeProgram(const GLComputeProgram&) = delete;
    GLComputeProgram& operator=(const GLComputeProgram&) = delete;

    // On failure the program is released and lastError() holds the full info log
    bool load(const std::vector<std::string>& paths);
    bool reload();
    void release();

    bool isValid() const { return m_program != 0; }
    uint32_t getId() const { return m_program; }
    const std::string& lastError() const { return m_lastError; }

    int32_t uniformLocation(const char* name) const;

private:
    bool readSources(std::string& source);

    uint32_t m_program = 0;
    std::vector<std::string> m_paths;
    std::string m_lastError;
};

} // namespace glint
