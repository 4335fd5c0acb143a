#ifndef GRID_H
#define GRID_H

#include <cstddef>
#include <vector>

// Dense 2D array addressed as (x = column, y = row).
// Storage is row-major: index = y * width + x.
template <typename T> class Grid {
public:
  using reference = typename std::vector<T>::reference;
  using const_reference = typename std::vector<T>::const_reference;

  Grid() = default;
  Grid(int width, int height, const T &fill = T())
      : m_Width(width > 0 ? width : 0), m_Height(height > 0 ? height : 0),
        m_Cells(static_cast<size_t>(m_Width) * m_Height, fill) {}

  int GetWidth() const { return m_Width; }
  int GetHeight() const { return m_Height; }
  size_t Size() const { return m_Cells.size(); }
  bool Empty() const { return m_Cells.empty(); }

  bool InBounds(int x, int y) const {
    return x >= 0 && x < m_Width && y >= 0 && y < m_Height;
  }

  // Unchecked access, callers test InBounds first
  reference operator()(int x, int y) { return m_Cells[Index(x, y)]; }
  const_reference operator()(int x, int y) const {
    return m_Cells[Index(x, y)];
  }

  // Checked read, returns fallback outside the grid
  T Get(int x, int y, const T &fallback = T()) const {
    if (!InBounds(x, y))
      return fallback;
    return m_Cells[Index(x, y)];
  }

  // Checked write, ignored outside the grid
  bool Set(int x, int y, const T &value) {
    if (!InBounds(x, y))
      return false;
    m_Cells[Index(x, y)] = value;
    return true;
  }

  void Fill(const T &value) { m_Cells.assign(m_Cells.size(), value); }

  const std::vector<T> &Data() const { return m_Cells; }

  bool operator==(const Grid &other) const {
    return m_Width == other.m_Width && m_Height == other.m_Height &&
           m_Cells == other.m_Cells;
  }
  bool operator!=(const Grid &other) const { return !(*this == other); }

private:
  size_t Index(int x, int y) const {
    return static_cast<size_t>(y) * static_cast<size_t>(m_Width) +
           static_cast<size_t>(x);
  }

  int m_Width = 0;
  int m_Height = 0;
  std::vector<T> m_Cells;
};

#endif
