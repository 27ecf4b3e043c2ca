#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <vector>
#include "StlFixtures.hpp"
#include "stlquote/GeometryAccumulator.hpp"
#include "stlquote/STLReader.hpp"

using stlquote::BinaryStlReader;
using stlquote::GeometryAccumulator;
using stlquote::MeshGeometry;
using stlquote::Triangle;
using stlquote::Vertex;

static MeshGeometry accumulate(const std::vector<Triangle>& tris, uint32_t cap = 5000, int64_t declared = -1) {
  std::string buffer = fixtures::makeBinaryStl(tris, declared);
  auto stream = BinaryStlReader::open(buffer, cap);
  return GeometryAccumulator::accumulate(stream);
}

static bool test_heron_area() {
  double a = stlquote::heronArea({0, 0, 0}, {3, 0, 0}, {0, 4, 0});
  if (!fixtures::near(a, 6.0, 1e-9)) {
    std::cerr << "3-4-5 triangle area " << a << " != 6\n";
    return false;
  }

  // Identical and collinear vertices: zero area, never NaN.
  double same = stlquote::heronArea({1, 2, 3}, {1, 2, 3}, {1, 2, 3});
  double line = stlquote::heronArea({0, 0, 0}, {1e-3f, 1e-3f, 1e-3f}, {123.456f, 123.456f, 123.456f});
  if (same != 0.0 || !std::isfinite(line) || line < 0.0 || line > 1e-3) {
    std::cerr << "Degenerate areas: identical=" << same << " collinear=" << line << "\n";
    return false;
  }
  return true;
}

static bool test_tetrahedron_volume() {
  double v = stlquote::approximateUnsignedVolume({1, 0, 0}, {0, 1, 0}, {0, 0, 1});
  double flipped = stlquote::approximateUnsignedVolume({1, 0, 0}, {0, 0, 1}, {0, 1, 0});
  if (!fixtures::near(v, 1.0 / 6.0, 1e-12) || v != flipped) {
    std::cerr << "Unit tetrahedron volume " << v << " / flipped " << flipped << "\n";
    return false;
  }
  if (stlquote::approximateUnsignedVolume({2, 2, 2}, {2, 2, 2}, {2, 2, 2}) != 0.0) {
    std::cerr << "Degenerate tetrahedron has volume\n";
    return false;
  }
  return true;
}

static bool test_unit_cube() {
  MeshGeometry g = accumulate(fixtures::makeCube(10.0f));

  if (g.triangleCount != 12 || g.extrapolationFactor != 1.0) {
    std::cerr << "Cube triangle count " << g.triangleCount << "\n";
    return false;
  }
  if (!fixtures::nearRel(g.volumeCm3, 1.0, 0.01)) {
    std::cerr << "Cube volume " << g.volumeCm3 << " cm3, expected 1\n";
    return false;
  }
  if (!fixtures::nearRel(g.surfaceAreaCm2, 6.0, 0.01)) {
    std::cerr << "Cube area " << g.surfaceAreaCm2 << " cm2, expected 6\n";
    return false;
  }
  const auto& d = g.dimensionsCm;
  if (!fixtures::near(d.width, 1.0, 1e-9) || !fixtures::near(d.height, 1.0, 1e-9) ||
      !fixtures::near(d.depth, 1.0, 1e-9)) {
    std::cerr << "Cube dimensions " << d.width << " x " << d.height << " x " << d.depth << "\n";
    return false;
  }
  if (g.boundingBox.min.x != 0.0f || g.boundingBox.max.z != 10.0f) {
    std::cerr << "Cube bounding box not in millimetres\n";
    return false;
  }
  return true;
}

static bool test_box_extents_per_axis() {
  // Centred on the origin so every tetrahedron has the same orientation.
  MeshGeometry g = accumulate(fixtures::makeBox(-15, -5, -2.5f, 30, 10, 5));
  const auto& d = g.dimensionsCm;
  if (!fixtures::near(d.width, 3.0, 1e-9) || !fixtures::near(d.height, 1.0, 1e-9) ||
      !fixtures::near(d.depth, 0.5, 1e-9)) {
    std::cerr << "Box dimensions " << d.width << " x " << d.height << " x " << d.depth << "\n";
    return false;
  }
  if (!fixtures::nearRel(g.volumeCm3, 1.5, 1e-6)) {
    std::cerr << "Box volume " << g.volumeCm3 << ", expected 1.5\n";
    return false;
  }
  if (g.boundingBox.min.x != -15.0f || g.boundingBox.max.y != 5.0f) {
    std::cerr << "Box bounding box wrong\n";
    return false;
  }
  return true;
}

static bool test_degenerate_triangle_contributes_nothing() {
  auto tris = fixtures::makeCube(10.0f);
  MeshGeometry plain = accumulate(tris);
  tris.push_back({{5, 5, 5}, {5, 5, 5}, {5, 5, 5}});
  MeshGeometry withDegenerate = accumulate(tris);

  if (withDegenerate.triangleCount != 13 ||
      withDegenerate.volumeCm3 != plain.volumeCm3 ||
      withDegenerate.surfaceAreaCm2 != plain.surfaceAreaCm2 ||
      std::isnan(withDegenerate.volumeCm3)) {
    std::cerr << "Degenerate triangle changed totals\n";
    return false;
  }
  return true;
}

static bool test_empty_sentinel() {
  MeshGeometry g = accumulate({});
  if (!g.empty() || g.volumeCm3 != 0.0 || g.surfaceAreaCm2 != 0.0) {
    std::cerr << "Empty input did not give the empty sentinel\n";
    return false;
  }
  return true;
}

static bool test_capped_totals_extrapolated() {
  // Two identical cubes, only the first is read.
  auto tris = fixtures::makeCube(10.0f);
  auto second = fixtures::makeCube(10.0f);
  tris.insert(tris.end(), second.begin(), second.end());

  MeshGeometry g = accumulate(tris, 12);
  if (g.triangleCount != 12 || g.declaredTriangleCount != 24 || !fixtures::near(g.extrapolationFactor, 2.0, 1e-12)) {
    std::cerr << "Capped pass: count " << g.triangleCount << " factor " << g.extrapolationFactor << "\n";
    return false;
  }
  if (!fixtures::nearRel(g.volumeCm3, 2.0, 0.01) || !fixtures::nearRel(g.surfaceAreaCm2, 12.0, 0.01)) {
    std::cerr << "Extrapolated totals " << g.volumeCm3 << " cm3, " << g.surfaceAreaCm2 << " cm2\n";
    return false;
  }
  return true;
}

static bool test_extrapolation_ignores_skipped_records() {
  auto tris = fixtures::makeCube(10.0f);
  auto second = fixtures::makeCube(10.0f);
  tris.insert(tris.end(), second.begin(), second.end());
  tris[2].v1.x = std::numeric_limits<float>::quiet_NaN();
  tris[9].v3.y = std::numeric_limits<float>::infinity();

  // 12 records read, 2 of them dropped: 24 declared over 10 parsed.
  MeshGeometry g = accumulate(tris, 12);
  if (g.triangleCount != 10 || g.skippedTriangleCount != 2 || !fixtures::near(g.extrapolationFactor, 2.4, 1e-12)) {
    std::cerr << "Skipped records in capped pass: count " << g.triangleCount << " factor "
              << g.extrapolationFactor << "\n";
    return false;
  }
  return true;
}

static bool test_incremental_add() {
  GeometryAccumulator acc;
  for (const auto& t : fixtures::makeCube(20.0f)) acc.add(t);
  MeshGeometry g = acc.finish(12, 12, 0, false);
  if (!fixtures::nearRel(g.volumeCm3, 8.0, 0.01) || !fixtures::near(g.dimensionsCm.height, 2.0, 1e-9)) {
    std::cerr << "Incremental cube volume " << g.volumeCm3 << "\n";
    return false;
  }
  return true;
}

int main() {
  if (!test_heron_area()) return 1;
  if (!test_tetrahedron_volume()) return 1;
  if (!test_unit_cube()) return 1;
  if (!test_box_extents_per_axis()) return 1;
  if (!test_degenerate_triangle_contributes_nothing()) return 1;
  if (!test_empty_sentinel()) return 1;
  if (!test_capped_totals_extrapolated()) return 1;
  if (!test_extrapolation_ignores_skipped_records()) return 1;
  if (!test_incremental_add()) return 1;
  return 0;
}
