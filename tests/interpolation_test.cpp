#include "Renderer/Interpolation.hpp"

#include <cstdlib>
#include <cstdio>
#include <cmath>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireNear(const glm::vec3& a, const glm::vec3& b, float eps, const char* msg) {
  for (int i = 0; i < 3; ++i) {
    if (std::fabs(a[i] - b[i]) > eps) {
      std::fprintf(stderr, "ASSERT FAIL: %s (got %f %f %f, expected %f %f %f)\n",
                   msg, a.x, a.y, a.z, b.x, b.y, b.z);
      std::exit(1);
    }
  }
}

int main() {
  // 1. Linear barycentric combination
  {
    glm::vec3 values[3] = {{3, 0, 0}, {0, 6, 0}, {0, 0, 9}};
    requireNear(applyBarycentric(values, {1, 0, 0}), values[0], 0.0f, "first vertex");
    requireNear(applyBarycentric(values, {0, 0, 1}), values[2], 0.0f, "last vertex");
    requireNear(applyBarycentric(values, glm::vec3(1.0f / 3.0f)), {1, 2, 3}, 1e-6f, "centroid");
    glm::vec2 uvs[3] = {{0, 0}, {1, 0}, {0, 1}};
    glm::vec2 uv = applyBarycentric(uvs, {0.5f, 0.25f, 0.25f});
    requireTrue(std::fabs(uv.x - 0.25f) < 1e-6f && std::fabs(uv.y - 0.25f) < 1e-6f, "two component values");
  }

  // 2. Perspective weights
  {
    glm::vec4 flat[3] = {{0, 0, 0, 2}, {0, 0, 0, 2}, {0, 0, 0, 2}};
    requireNear(perspectiveWeights({0.2f, 0.3f, 0.5f}, flat), {0.2f, 0.3f, 0.5f}, 1e-6f, "equal depth unchanged");
    glm::vec4 deep[3] = {{0, 0, 0, 1}, {0, 0, 0, 2}, {0, 0, 0, 4}};
    glm::vec3 weights = perspectiveWeights(glm::vec3(1.0f / 3.0f), deep);
    requireNear(weights, glm::vec3(1.0f, 0.5f, 0.25f) / 1.75f, 1e-6f, "closer vertices weigh more");
    requireTrue(std::fabs(weights.x + weights.y + weights.z - 1.0f) < 1e-6f, "weights sum to one");
  }

  // 3. Interpolated normals are not renormalized
  {
    VertexOutput vertices[3]{};
    vertices[0].world_normal = {1, 0, 0};
    vertices[1].world_normal = {0, 1, 0};
    vertices[2].world_normal = {0, 0, 1};
    vertices[0].world_position = {0, 0, 0};
    vertices[1].world_position = {2, 0, 0};
    vertices[2].world_position = {0, 2, 0};
    vertices[1].tex = {1, 0};
    FragmentInput input = interpolate(vertices, {0.5f, 0.5f, 0.0f});
    requireTrue(std::fabs(glm::length(input.world_normal) - std::sqrt(0.5f)) < 1e-6f, "normal length kept");
    requireNear(input.world_position, {1, 0, 0}, 1e-6f, "interpolated position");
    requireTrue(std::fabs(input.tex.x - 0.5f) < 1e-6f, "interpolated uv");
  }

  // 4. Coverage test
  {
    glm::vec3 triangle[3] = {{0, 0, 0.1f}, {10, 0, 0.2f}, {0, 10, 0.3f}};
    float depth = 0;
    glm::vec3 uvw;
    requireTrue(inTriangle({1, 1}, triangle, depth, uvw), "inside");
    requireTrue(std::fabs(uvw.x + uvw.y + uvw.z - 1.0f) < 1e-6f, "barycentric sums to one");
    requireTrue(std::fabs(depth - (0.1f * uvw.x + 0.2f * uvw.y + 0.3f * uvw.z)) < 1e-6f, "depth interpolated");
    requireTrue(std::fabs(uvw.y - 0.1f) < 1e-6f && std::fabs(uvw.z - 0.1f) < 1e-6f, "barycentric values");
    requireTrue(!inTriangle({6, 6}, triangle, depth, uvw), "outside hypotenuse");
    requireTrue(!inTriangle({-1, 1}, triangle, depth, uvw), "outside left");

    glm::vec3 reversed[3] = {triangle[0], triangle[2], triangle[1]};
    requireTrue(inTriangle({1, 1}, reversed, depth, uvw), "either winding");

    glm::vec3 degenerate[3] = {{0, 0, 0}, {5, 5, 0}, {10, 10, 0}};
    requireTrue(!inTriangle({5, 5}, degenerate, depth, uvw), "zero area covers nothing");
  }

  std::printf("interpolation_test PASS\n");
  return 0;
}
