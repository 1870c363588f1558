#ifndef SO_SHADER_H
#define SO_SHADER_H

#include <iostream>

#include <glad/glad.h>

const char* const water_vs_code = R"(
#version 410 core
layout(location = 0) in vec3 a_Pos;
layout(location = 1) in vec3 a_Normal;

layout(location = 0) out vec3 vs_Normal;
layout(location = 1) out vec3 vs_LightSourceDir;
layout(location = 2) out vec3 vs_CameraDir;
layout(location = 3) out float vs_Height;

uniform mat4 u_ViewProjection;
uniform mat4 u_Model;
uniform vec3 u_CameraPos;
uniform float u_HeightScale;

void main()
{
  vec3 lightPos = vec3(200.0, 300.0, -300.0);

  vec4 m_Pos = u_Model * vec4(a_Pos, 1.0);

  vs_Normal = normalize(a_Normal);
  vs_LightSourceDir = normalize(lightPos - m_Pos.xyz);
  vs_CameraDir = normalize(u_CameraPos - m_Pos.xyz);
  vs_Height = a_Pos.y / max(u_HeightScale, 1e-6);

  gl_Position = u_ViewProjection * m_Pos;
}
)";

const char* const water_fs_code = R"(
#version 410 core
out vec4 color;

layout(location = 0) in vec3 vs_Normal;
layout(location = 1) in vec3 vs_LightSourceDir;
layout(location = 2) in vec3 vs_CameraDir;
layout(location = 3) in float vs_Height;

void main() {
  const vec3 deep_color = vec3(0.02, 0.12, 0.25);
  const vec3 crest_color = vec3(0.35, 0.6, 0.7);
  const vec3 light_color = 0.4 * normalize(vec3(253, 251, 211));

  // Crests (positive height in metres) are lighter than troughs
  vec3 water_color = mix(deep_color, crest_color, clamp(0.5 + 0.25 * vs_Height, 0.0, 1.0));

  // Blinn-Phong illumination using half-way vector instead of reflection.
  vec3 halfwayDir = normalize(vs_LightSourceDir + vs_CameraDir);
  float specular = pow(max(dot(vs_Normal, halfwayDir), 0.0), 40.0);
  float diffuse = max(dot(vs_LightSourceDir, vs_Normal), 0.0);

  color = vec4(water_color * (0.3 + 0.7 * diffuse) + light_color * specular, 1.0);
}
)";

inline GLuint compile_shader(GLenum type, const char* code, const char* name) {
    int success;
    char info_log[512];

    GLuint shader = glCreateShader(type);
    glShaderSource(shader, 1, &code, NULL);
    glCompileShader(shader);
    glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (!success) {
        glGetShaderInfoLog(shader, sizeof(info_log), NULL, info_log);
        std::cout << "ERROR: " << name << " shader compilation failed\n" << info_log << std::endl;
    }
    return shader;
}

inline GLuint create_shader_program(const char* vs_code, const char* fs_code) {
    int success;
    char info_log[512];

    GLuint vs = compile_shader(GL_VERTEX_SHADER, vs_code, "Vertex");
    GLuint fs = compile_shader(GL_FRAGMENT_SHADER, fs_code, "Fragment");

    GLuint program = glCreateProgram();
    glAttachShader(program, vs);
    glAttachShader(program, fs);
    glLinkProgram(program);
    glGetProgramiv(program, GL_LINK_STATUS, &success);
    if (!success) {
        glGetProgramInfoLog(program, sizeof(info_log), NULL, info_log);
        std::cout << "ERROR: Shader program linkage failed\n" << info_log << std::endl;
    }
    glDeleteShader(vs);
    glDeleteShader(fs);
    return program;
}

#endif // SO_SHADER_H
