#include <cstdint>
#include <cstdlib>
#include <iostream>

// External
#include "imgui.h"
#include "backends/imgui_impl_glfw.h"
#include "backends/imgui_impl_opengl3.h"

#define GL_SILENCE_DEPRECATION
// GL
#include <glad/glad.h>
#include <GLFW/glfw3.h>
#include <glm/glm.hpp>

// Local
#include "camera.h"
#include "clock.h"
#include "parameters.h"
#include "shader.h"
#include "surface.h"

struct Window {
public:
  Window(uint32_t width, uint32_t height) {
    if (!glfwInit()) {
      std::cout << "Error: Could not initialize glfw" << std::endl;
      exit(EXIT_FAILURE);
    }

    glfwWindowHint(GLFW_SAMPLES, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 1);
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    this->window = glfwCreateWindow(width, height, "Spectral ocean", NULL, NULL);
    if (!this->window) {
      glfwTerminate();
      std::cout << "Could not create glfw window" << std::endl;
      exit(EXIT_FAILURE);
    }
    glfwMakeContextCurrent(this->window);

    if (!gladLoadGLLoader((GLADloadproc) glfwGetProcAddress)) {
      glfwTerminate();
      std::cerr << "Error: failed to initialize OpenGL context" << std::endl;
      exit(EXIT_FAILURE);
    }

    std::cout << "Using GL version: " << glGetString(GL_VERSION) << std::endl;
    std::cout << "Shading language version: " << glGetString(GL_SHADING_LANGUAGE_VERSION) << std::endl;
  }

  ~Window() {
    glfwTerminate();
  }

  inline bool should_close() { return glfwWindowShouldClose(this->window); }
  inline void poll_events() { glfwPollEvents(); }
  inline void swap_buffers() { glfwSwapBuffers(this->window); }
  inline GLFWwindow* get_native_window() { return this->window; }

  void resize(Camera& camera) {
    int display_w, display_h;
    glfwGetFramebufferSize(window, &display_w, &display_h);
    if (display_h > 0)
      camera.set_aspect(display_w / (float) display_h);
    glViewport(0, 0, display_w, display_h);
  }

  bool is_key_pressed(int keycode) const {
    return glfwGetKey(window, keycode) == GLFW_PRESS;
  }

private:
  GLFWwindow* window;
};

/** FUNCTIONS */
void update(const Window& window, double dt, Camera& camera);
bool settings_panel(OceanSettings& settings, Surface& surface, const Clock& clock);

int main(void)
{
  Window window(1600, 1000);
  Clock clock;

  /** ImGui setup begin */
  IMGUI_CHECKVERSION();
  ImGui::CreateContext();
  ImGui_ImplGlfw_InitForOpenGL(window.get_native_window(), true);
  ImGui_ImplOpenGL3_Init("#version 410");
  /** ImGui setup end */

  GLuint water_shader = create_shader_program(water_vs_code, water_fs_code);

  float rotation_speed = 30.0;
  float zoom_speed = 20.0;
  Camera camera(glm::vec3(0.0), 40.0,
    30.0, 25.0, 45.0f, 1600.0f / 1000.0f, 0.1, 2000.0,
    rotation_speed, zoom_speed
  );

  glEnable(GL_CULL_FACE);
  glEnable(GL_DEPTH_TEST);

  OceanSettings ocean_settings;
  Surface surface(ocean_settings);

  bool wire_frame = false;

  while (!window.should_close()) {
    glClearColor(0.8, 0.85, 1.0, 1.0);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
    glPolygonMode(GL_FRONT_AND_BACK, wire_frame ? GL_LINE : GL_FILL);

    double dt = clock.tick();
    update(window, dt, camera);

    double start = glfwGetTime();
    surface.update(dt);
    clock.record_update(glfwGetTime() - start);

    surface.draw(water_shader, camera);

    /** GUI RENDERING BEGIN **/
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();
    ImGui::Begin("Settings panel");
    ImGui::Checkbox("Wireframe", &wire_frame);
    if (settings_panel(ocean_settings, surface, clock))
      surface.reload_settings(ocean_settings);

    ImGui::Text("Camera");
    ImGui::Dummy(ImVec2(0.0, 5.0));
    ImGui::SliderFloat("Zoom speed", &zoom_speed, 1.0, 100.0);
    ImGui::SliderFloat("Rotation speed", &rotation_speed, 1.0, 200.0);
    ImGui::End();

    ImGui::Render();
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    /** GUI RENDERING END **/

    camera.set_zoom_speed(zoom_speed);
    camera.set_rotation_speed(rotation_speed);

    window.resize(camera);
    window.swap_buffers();
    window.poll_events();
  }

  glDeleteProgram(water_shader);

  ImGui_ImplOpenGL3_Shutdown();
  ImGui_ImplGlfw_Shutdown();
  ImGui::DestroyContext();

  return 0;
}

void update(const Window& window, double dt, Camera& camera) {
  if (window.is_key_pressed(GLFW_KEY_LEFT)) camera.rotate_yaw(-dt);
  if (window.is_key_pressed(GLFW_KEY_RIGHT)) camera.rotate_yaw(dt);
  if (window.is_key_pressed(GLFW_KEY_UP)) camera.rotate_pitch(dt);
  if (window.is_key_pressed(GLFW_KEY_DOWN)) camera.rotate_pitch(-dt);
  if (window.is_key_pressed(GLFW_KEY_W)) camera.zoom(dt);
  if (window.is_key_pressed(GLFW_KEY_S)) camera.zoom(-dt);
}

// Returns true when the reloadable parameters should be applied.
bool settings_panel(OceanSettings& settings, Surface& surface, const Clock& clock) {
  static const int resolutions[] = { 32, 64, 128, 256, 512 };
  static const char* resolution_names[] = { "32", "64", "128", "256", "512" };
  static const char* spectrum_names[] = { "JONSWAP", "TMA" };

  ImGui::Text("FPS: %f", 1.0 / clock.average_frame_time());
  ImGui::Text("Update-time: %f (ms)", clock.average_update_time() * 1000.0);
  ImGui::Text("Simulation time: %.2f (s)", surface.get_simulation_time());
  ImGui::Dummy(ImVec2(0.0, 15.0));

  ImGui::Text("Real-time parameters");
  ImGui::Dummy(ImVec2(0.0, 5.0));
  ImGui::SliderInt("Tile count", &surface.num_tiles, 1, 16);
  ImGui::SliderFloat("Vertex Distance", &surface.vertex_distance, 1.0, 64.0);
  ImGui::SliderFloat("Simulation speed", &surface.simulation_speed, 0.0, 10.0);
  ImGui::SliderFloat("Choppiness", &surface.choppiness, 0.0, 3.0);
  ImGui::Dummy(ImVec2(0.0, 15.0));

  ImGui::Text("Reloadable parameters");
  ImGui::Dummy(ImVec2(0.0, 5.0));

  int resolution_idx = 0;
  for (int n = 0; n < IM_ARRAYSIZE(resolutions); n++)
    if (resolutions[n] == settings.N) resolution_idx = n;
  if (ImGui::Combo("Resolution", &resolution_idx, resolution_names, IM_ARRAYSIZE(resolution_names)))
    settings.N = resolutions[resolution_idx];

  int spectrum_idx = static_cast<int>(settings.spectrum);
  if (ImGui::Combo("Spectrum", &spectrum_idx, spectrum_names, IM_ARRAYSIZE(spectrum_names)))
    settings.spectrum = static_cast<SpectrumKind>(spectrum_idx);

  PhysicalParameters& p = settings.parameters;
  ImGui::InputDouble("Domain size (m)", &p.domain_size);
  ImGui::InputDouble("Wind speed (m/s)", &p.wind_speed);
  ImGui::InputDouble("Fetch (m)", &p.fetch);
  ImGui::InputDouble("Water depth (m)", &p.water_depth);
  ImGui::InputDouble("Swell", &p.swell);
  ImGui::InputDouble("Gravity (m/s^2)", &p.gravity);

  int seed = static_cast<int>(settings.seed);
  if (ImGui::InputInt("Seed", &seed))
    settings.seed = static_cast<uint64_t>(seed);

  bool reload = ImGui::Button("Reload");
  ImGui::Dummy(ImVec2(0.0, 15.0));
  return reload;
}
