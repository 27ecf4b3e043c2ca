#include <cmath>
#include <cstring>
#include <iostream>
#include <limits>
#include <string>
#include <vector>
#include "StlFixtures.hpp"
#include "stlquote/Analyzer.hpp"
#include "stlquote/Errors.hpp"

using stlquote::AnalysisError;
using stlquote::Analyzer;
using stlquote::MaterialType;
using stlquote::PrintQuality;
using stlquote::PrintSettings;
using stlquote::PrinterProfile;
using stlquote::ReadError;
using stlquote::STLAnalysis;

static PrintSettings reference_settings() {
  PrintSettings s;
  s.layerHeightMm = 0.2;
  s.infillPercentage = 20;
  s.wallThicknessMm = 0.4;
  s.supportDensity = 20;
  s.materialType = MaterialType::PLA;
  s.printQuality = PrintQuality::Normal;
  return s;
}

static bool finite_analysis(const STLAnalysis& a) {
  const double values[] = {a.volume, a.surfaceArea, a.dimensions.width, a.dimensions.height, a.dimensions.depth,
                           a.boundingBox.min.x, a.boundingBox.max.z, a.estimatedPrintTimeHours,
                           a.materialUsageGrams};
  for (double v : values) if (!std::isfinite(v)) return false;
  return a.volume >= 0.0 && a.surfaceArea >= 0.0 && a.printabilityScore <= 100;
}

static bool test_reference_cube() {
  Analyzer analyzer(PrinterProfile::defaults());
  std::string buffer = fixtures::makeBinaryStl(fixtures::makeCube(20.0f));
  STLAnalysis a = analyzer.analyze(buffer, reference_settings());

  if (!fixtures::near(a.dimensions.width, 2.0, 1e-6) || !fixtures::near(a.dimensions.height, 2.0, 1e-6) ||
      !fixtures::near(a.dimensions.depth, 2.0, 1e-6)) {
    std::cerr << "Cube dimensions " << a.dimensions.width << " x " << a.dimensions.height << " x "
              << a.dimensions.depth << " cm\n";
    return false;
  }
  if (!fixtures::nearRel(a.volume, 8.0, 0.01) || !fixtures::nearRel(a.surfaceArea, 24.0, 0.01)) {
    std::cerr << "Cube volume " << a.volume << " cm3, area " << a.surfaceArea << " cm2\n";
    return false;
  }
  if (!(a.materialUsageGrams > 0.0) || !(a.estimatedPrintTimeHours > 0.0) || a.supportRequired) {
    std::cerr << "Cube estimate: " << a.materialUsageGrams << " g, " << a.estimatedPrintTimeHours
              << " h, support " << a.supportRequired << "\n";
    return false;
  }
  if (a.triangleCount != 12 || a.printabilityScore != 100) {
    std::cerr << "Cube triangles " << a.triangleCount << ", score " << int(a.printabilityScore) << "\n";
    return false;
  }
  if (!fixtures::near(a.boundingBox.max.x, 2.0, 1e-6) || !fixtures::near(a.boundingBox.min.y, 0.0, 1e-9)) {
    std::cerr << "Bounding box not converted to cm\n";
    return false;
  }
  return true;
}

static bool test_idempotent() {
  Analyzer analyzer(PrinterProfile::defaults());
  std::string buffer = fixtures::makeBinaryStl(fixtures::makeBox(-3, 1, 7, 35, 12, 48));
  STLAnalysis first = analyzer.analyze(buffer, reference_settings());
  STLAnalysis second = analyzer.analyze(buffer, reference_settings());

  auto bits_equal = [](double a, double b) { return std::memcmp(&a, &b, sizeof(double)) == 0; };
  if (!bits_equal(first.volume, second.volume) || !bits_equal(first.surfaceArea, second.surfaceArea) ||
      !bits_equal(first.materialUsageGrams, second.materialUsageGrams) ||
      !bits_equal(first.estimatedPrintTimeHours, second.estimatedPrintTimeHours) ||
      first.supportRequired != second.supportRequired ||
      first.printabilityScore != second.printabilityScore) {
    std::cerr << "Repeated analysis differs\n";
    return false;
  }
  return true;
}

static bool test_errors() {
  Analyzer analyzer(PrinterProfile::defaults());

  try {
    analyzer.analyze(std::string(40, 'x'), reference_settings());
    std::cerr << "Short buffer accepted\n";
    return false;
  } catch (const ReadError& e) {
    if (e.kind() != ReadError::Kind::Truncated) {
      std::cerr << "Short buffer: " << stlquote::toString(e.kind()) << "\n";
      return false;
    }
  }

  try {
    analyzer.analyze(fixtures::makeBinaryStl({}), reference_settings());
    std::cerr << "Zero-triangle STL accepted\n";
    return false;
  } catch (const AnalysisError& e) {
    if (e.kind() != AnalysisError::Kind::EmptyOrUnparsableMesh) return false;
  }

  // Every record unusable.
  auto bad = fixtures::makeCube(10.0f);
  for (auto& t : bad) t.v1.x = std::numeric_limits<float>::quiet_NaN();
  try {
    analyzer.analyze(fixtures::makeBinaryStl(bad), reference_settings());
    std::cerr << "All-NaN STL accepted\n";
    return false;
  } catch (const AnalysisError& e) {
    if (e.kind() != AnalysisError::Kind::EmptyOrUnparsableMesh) return false;
  }
  return true;
}

static bool test_triangle_cap() {
  PrinterProfile profile = PrinterProfile::defaults();
  profile.triangleCap = 10;
  Analyzer analyzer(profile);
  STLAnalysis a = analyzer.analyze(fixtures::makeBinaryStl(fixtures::makeCube(10.0f)), reference_settings());
  if (a.triangleCount != 10 || !finite_analysis(a)) {
    std::cerr << "Capped analysis read " << a.triangleCount << " triangles\n";
    return false;
  }
  return true;
}

static bool test_oversized_and_degenerate() {
  Analyzer analyzer(PrinterProfile::defaults());

  STLAnalysis big = analyzer.analyze(fixtures::makeBinaryStl(fixtures::makeBox(0, 0, 0, 300, 40, 40)),
                                     reference_settings());
  if (big.printabilityScore > 50 || !finite_analysis(big)) {
    std::cerr << "Oversized box scored " << int(big.printabilityScore) << "\n";
    return false;
  }

  auto tris = fixtures::makeCube(20.0f);
  tris.push_back({{4, 4, 4}, {4, 4, 4}, {4, 4, 4}});
  STLAnalysis withDegenerate = analyzer.analyze(fixtures::makeBinaryStl(tris), reference_settings());
  if (!finite_analysis(withDegenerate) || !fixtures::nearRel(withDegenerate.volume, 8.0, 0.01)) {
    std::cerr << "Degenerate triangle disturbed the analysis\n";
    return false;
  }

  // A lone degenerate triangle is still a mesh; it must not produce NaN.
  std::vector<stlquote::Triangle> lone{stlquote::Triangle{{1, 1, 1}, {1, 1, 1}, {1, 1, 1}}};
  STLAnalysis point = analyzer.analyze(fixtures::makeBinaryStl(lone), reference_settings());
  if (!finite_analysis(point) || point.volume != 0.0 || point.surfaceArea != 0.0) {
    std::cerr << "Single degenerate triangle produced " << point.volume << " cm3\n";
    return false;
  }
  return true;
}

int main() {
  if (!test_reference_cube()) return 1;
  if (!test_idempotent()) return 1;
  if (!test_errors()) return 1;
  if (!test_triangle_cap()) return 1;
  if (!test_oversized_and_degenerate()) return 1;
  return 0;
}
