#pragma once
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <glm/glm.hpp>
#include <vector>

class MathUtils {
public:
  static double Distance(int x0, int y0, int x1, int y1) {
    double dx = static_cast<double>(x1 - x0);
    double dy = static_cast<double>(y1 - y0);
    return std::sqrt(dx * dx + dy * dy);
  }

  // Cell reached by walking `distance` from (cx, cy) along `angle`, floored
  static glm::ivec2 PolarOffset(int cx, int cy, double angle, double distance) {
    return glm::ivec2(
        static_cast<int>(std::floor(cx + std::cos(angle) * distance)),
        static_cast<int>(std::floor(cy + std::sin(angle) * distance)));
  }

  // Bresenham line, both endpoints included
  static std::vector<glm::ivec2> LinePoints(int x0, int y0, int x1, int y1) {
    std::vector<glm::ivec2> points;
    int dx = std::abs(x1 - x0);
    int dy = std::abs(y1 - y0);
    int sx = (x0 < x1) ? 1 : -1;
    int sy = (y0 < y1) ? 1 : -1;
    int err = dx - dy;

    int x = x0;
    int y = y0;
    points.reserve(static_cast<size_t>(std::max(dx, dy)) + 1);

    while (true) {
      points.emplace_back(x, y);
      if (x == x1 && y == y1)
        break;

      int e2 = 2 * err;
      if (e2 > -dy) {
        err -= dy;
        x += sx;
      }
      if (e2 < dx) {
        err += dx;
        y += sy;
      }
    }
    return points;
  }

  static double Clamp01(double v) { return v < 0.0 ? 0.0 : (v > 1.0 ? 1.0 : v); }
};
