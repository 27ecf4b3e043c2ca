#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include "StlFixtures.hpp"
#include "stlquote/Errors.hpp"
#include "stlquote/STLReader.hpp"

using stlquote::BinaryStlReader;
using stlquote::ReadError;
using stlquote::Triangle;
using stlquote::Vertex;

static bool expect_read_error(const std::string& buffer, ReadError::Kind kind, const char* what) {
  try {
    BinaryStlReader::open(buffer, 5000);
  } catch (const ReadError& e) {
    if (e.kind() != kind) {
      std::cerr << what << ": wrong ReadError kind " << stlquote::toString(e.kind()) << "\n";
      return false;
    }
    return true;
  }
  std::cerr << what << ": expected ReadError " << stlquote::toString(kind) << "\n";
  return false;
}

static bool test_short_buffers() {
  if (!expect_read_error("", ReadError::Kind::Truncated, "empty buffer")) return false;
  if (!expect_read_error(std::string(83, '\0'), ReadError::Kind::Truncated, "83 byte buffer")) return false;

  // Header only, zero triangles: valid preamble, nothing to read.
  std::string headerOnly = fixtures::makeBinaryStl({});
  auto stream = BinaryStlReader::open(headerOnly, 5000);
  Triangle t;
  if (stream.next(t) || stream.declaredCount() != 0) {
    std::cerr << "Zero-triangle STL yielded a triangle\n";
    return false;
  }
  return true;
}

static bool test_truncated_records() {
  auto cube = fixtures::makeCube(10.0f);
  std::string buffer = fixtures::makeBinaryStl(cube);
  buffer.resize(buffer.size() - 30); // last record cut short
  if (!expect_read_error(buffer, ReadError::Kind::Truncated, "cut record")) return false;

  // Declares 12, ships 5.
  std::vector<Triangle> five(cube.begin(), cube.begin() + 5);
  return expect_read_error(fixtures::makeBinaryStl(five, 12), ReadError::Kind::Truncated, "short body");
}

static bool test_ascii_rejected() {
  std::string ascii =
    "solid cube\n"
    "  facet normal 0 0 -1\n"
    "    outer loop\n"
    "      vertex 0 0 0\n"
    "      vertex 10 10 0\n"
    "      vertex 10 0 0\n"
    "    endloop\n"
    "  endfacet\n"
    "endsolid cube\n";
  return expect_read_error(ascii, ReadError::Kind::UnsupportedFormat, "ASCII STL");
}

static bool test_foreign_formats_rejected() {
  // Wavefront OBJ, large enough that its text bytes read as a capped triangle count.
  std::string obj = "# cube exported as OBJ\n";
  while (obj.size() < 300 * 1024) {
    obj += "v 1.000000 -1.000000 -1.000000\n";
    obj += "vt 0.625000 0.500000\n";
    obj += "f 1/1/1 2/2/1 3/3/1\n";
  }
  if (!expect_read_error(obj, ReadError::Kind::UnsupportedFormat, "OBJ text")) return false;

  // 3MF is a ZIP container.
  std::string zip("PK\x03\x04", 4);
  zip += std::string(400, '\0');
  if (!expect_read_error(zip, ReadError::Kind::UnsupportedFormat, "ZIP archive")) return false;

  std::string notes(200, 'x');
  return expect_read_error(notes, ReadError::Kind::UnsupportedFormat, "plain text");
}

static bool test_binary_with_solid_header() {
  // Exporters often write "solid" into the binary header.
  std::string buffer = fixtures::makeBinaryStl(fixtures::makeCube(10.0f), -1, "solid exported by CAD facet");
  try {
    auto stream = BinaryStlReader::open(buffer, 5000);
    if (stream.parseLimit() != 12) {
      std::cerr << "Binary STL with solid header: parse limit " << stream.parseLimit() << "\n";
      return false;
    }
  } catch (const ReadError& e) {
    std::cerr << "Binary STL with solid header rejected: " << e.what() << "\n";
    return false;
  }
  return true;
}

static bool test_decodes_little_endian_vertices() {
  Triangle in{{1.5f, -2.25f, 1000.0f}, {0.125f, 7.0f, -0.5f}, {3.0f, 4.0f, 5.0f}};
  auto buffer = fixtures::makeBinaryStl({in});
  auto stream = BinaryStlReader::open(buffer, 5000);

  Triangle out;
  if (!stream.next(out)) {
    std::cerr << "No triangle decoded\n";
    return false;
  }
  auto same = [](const Vertex& a, const Vertex& b) { return a.x == b.x && a.y == b.y && a.z == b.z; };
  if (!same(in.v1, out.v1) || !same(in.v2, out.v2) || !same(in.v3, out.v3)) {
    std::cerr << "Decoded vertices differ: v1=(" << out.v1.x << ", " << out.v1.y << ", " << out.v1.z << ")\n";
    return false;
  }
  if (stream.next(out) || stream.parsedCount() != 1) {
    std::cerr << "Stream did not end after one triangle\n";
    return false;
  }
  return true;
}

static bool test_safety_cap() {
  std::vector<Triangle> tris;
  for (int i = 0; i < 20; ++i) {
    auto box = fixtures::makeBox(static_cast<float>(i), 0, 0, 1, 1, 1);
    tris.push_back(box[0]);
  }
  auto buffer = fixtures::makeBinaryStl(tris);
  auto stream = BinaryStlReader::open(buffer, 8);

  Triangle t;
  int n = 0;
  while (stream.next(t)) ++n;

  if (n != 8 || !stream.capped() || stream.declaredCount() != 20 || stream.consumedCount() != 8) {
    std::cerr << "Cap not applied: read " << n << ", declared " << stream.declaredCount() << "\n";
    return false;
  }

  // A hostile count is fine as long as the records under the cap exist.
  auto hostile = fixtures::makeBinaryStl(tris, 4000000000LL);
  auto capped = BinaryStlReader::open(hostile, 20);
  if (capped.parseLimit() != 20 || !capped.capped()) {
    std::cerr << "Hostile count not capped\n";
    return false;
  }
  return true;
}

static bool test_non_finite_records_skipped() {
  auto cube = fixtures::makeCube(10.0f);
  cube[3].v2.y = std::numeric_limits<float>::quiet_NaN();
  cube[7].v3.z = std::numeric_limits<float>::infinity();
  std::string buffer = fixtures::makeBinaryStl(cube);
  auto stream = BinaryStlReader::open(buffer, 5000);

  Triangle t;
  int n = 0;
  while (stream.next(t)) {
    if (!std::isfinite(t.v2.y) || !std::isfinite(t.v3.z)) {
      std::cerr << "Non-finite triangle delivered\n";
      return false;
    }
    ++n;
  }
  if (n != 10 || stream.skippedCount() != 2 || stream.consumedCount() != 12) {
    std::cerr << "Expected 10 delivered / 2 skipped, got " << n << " / " << stream.skippedCount() << "\n";
    return false;
  }
  return true;
}

int main() {
  if (!test_short_buffers()) return 1;
  if (!test_truncated_records()) return 1;
  if (!test_ascii_rejected()) return 1;
  if (!test_foreign_formats_rejected()) return 1;
  if (!test_binary_with_solid_header()) return 1;
  if (!test_decodes_little_endian_vertices()) return 1;
  if (!test_safety_cap()) return 1;
  if (!test_non_finite_records_skipped()) return 1;
  return 0;
}
