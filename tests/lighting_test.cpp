#include "Renderer/Shaders/Lighting.hpp"

#include <cstdlib>
#include <cstdio>
#include <cmath>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireNear(float a, float b, float eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %f, expected %f)\n", msg, a, b);
    std::exit(1);
  }
}

static void requireNear(const glm::vec3& a, const glm::vec3& b, float eps, const char* msg) {
  for (int i = 0; i < 3; ++i) {
    requireNear(a[i], b[i], eps, msg);
  }
}

int main() {
  // 1. Attenuation is exactly 1 at the light and falls off with distance
  {
    requireTrue(attenuation(0.0f) == 1.0f, "attenuation(0) == 1");
    requireNear(attenuation(5.0f), 1.0f / 2.25f, 1e-6f, "attenuation(5)");
    float previous = attenuation(0.0f);
    for (int i = 1; i <= 400; ++i) {
      float current = attenuation((float)i * 0.25f);
      requireTrue(current < previous, "attenuation strictly decreasing");
      requireTrue(current > 0.0f, "attenuation positive");
      previous = current;
    }
  }

  PointLight light;
  light.position = {0, 5, 0};
  light.ambient = {0.1f, 0.1f, 0.1f};
  light.diffuse = {1, 1, 1};
  light.specular = {1, 1, 1};

  // 2. Light above, camera in front, surface facing up
  {
    LightingTerms terms = computeLightingTerms({0, 1, 0}, {0, 0, 0}, light, {0, 0, 5});
    requireNear(terms.ambient, {0.1f, 0.1f, 0.1f}, 1e-6f, "ambient is Ia");
    requireNear(terms.diffuse, {1, 1, 1}, 1e-6f, "diffuse facing light");
    requireNear(terms.specular, {0, 0, 0}, 1e-6f, "no specular at grazing view");
    requireNear(terms.attenuation, 1.0f / 2.25f, 1e-6f, "attenuation at distance 5");
    requireNear(computeLighting({0, 1, 0}, {0, 0, 0}, light, {0, 0, 5}), glm::vec3(1.1f / 2.25f), 1e-6f,
                "combined lighting");
  }

  // 3. Light at the camera behind the surface clamps diffuse to exactly zero
  {
    LightingTerms terms = computeLightingTerms({0, -1, 0}, {0, 0, 0}, light, light.position);
    requireTrue(terms.diffuse == glm::vec3(0, 0, 0), "diffuse clamped to zero");
  }

  // 4. Diffuse uses the interpolated normal length, specular the unit normal
  {
    LightingTerms unit = computeLightingTerms({0, 1, 0}, {0, 0, 0}, light, light.position);
    LightingTerms shortened = computeLightingTerms({0, 0.5f, 0}, {0, 0, 0}, light, light.position);
    requireNear(unit.diffuse, {1, 1, 1}, 1e-6f, "unit normal diffuse");
    requireNear(shortened.diffuse, {0.5f, 0.5f, 0.5f}, 1e-6f, "short normal scales diffuse");
    requireNear(unit.specular, {1, 1, 1}, 1e-5f, "mirror specular");
    requireNear(shortened.specular, unit.specular, 1e-6f, "specular ignores normal length");
  }

  // 5. Specular exponent is 32
  {
    PointLight side = light;
    side.position = {1, 1, 0};
    LightingTerms terms = computeLightingTerms({0, 1, 0}, {0, 0, 0}, side, {0, 3, 0});
    float expected = std::pow(std::sqrt(0.5f), 32.0f);
    requireNear(terms.specular.x, expected, 1e-9f, "specular power");
    requireNear(terms.specular.x, 1.0f / 65536.0f, 1e-9f, "cos 45 to the 32nd");
  }

  // 6. Light colors scale their own terms
  {
    PointLight colored = light;
    colored.ambient = {0.2f, 0.0f, 0.0f};
    colored.diffuse = {0.0f, 0.5f, 0.0f};
    colored.specular = {0.0f, 0.0f, 0.25f};
    LightingTerms terms = computeLightingTerms({0, 1, 0}, {0, 0, 0}, colored, colored.position);
    requireNear(terms.ambient, {0.2f, 0, 0}, 1e-6f, "colored ambient");
    requireNear(terms.diffuse, {0, 0.5f, 0}, 1e-6f, "colored diffuse");
    requireNear(terms.specular, {0, 0, 0.25f}, 1e-5f, "colored specular");
    requireNear(terms.total(), (terms.ambient + terms.diffuse + terms.specular) * terms.attenuation, 1e-7f,
                "total is attenuated sum");
  }

  std::printf("lighting_test PASS\n");
  return 0;
}
