#include "rc/recipe/RadarRecipe.hpp"
#include "rc/chart/RadarChart.hpp"
#include "rc/math/Angle.hpp"
#include "rc/radar/WebGridPlanner.hpp"

#include <cmath>
#include <cstdio>
#include <string>

namespace rc {

namespace {

void pushPoint(std::vector<float>& out, const Point& p) {
  out.push_back(static_cast<float>(p.x));
  out.push_back(static_cast<float>(p.y));
}

void pushSegment(std::vector<float>& out, const Point& a, const Point& b) {
  pushPoint(out, a);
  pushPoint(out, b);
}

std::string styleCommand(Id drawItemId, double r, double g, double b, double a,
                         double lineWidth) {
  char buf[256];
  std::snprintf(buf, sizeof(buf),
    R"({"cmd":"setDrawItemStyle","drawItemId":%s,"r":%.9g,"g":%.9g,"b":%.9g,"a":%.9g,"lineWidth":%.9g})",
    std::to_string(drawItemId).c_str(), r, g, b, a, lineWidth);
  return buf;
}

std::string styleCommand(Id drawItemId, const float color[4], float lineWidth) {
  return styleCommand(drawItemId, color[0], color[1], color[2], color[3], lineWidth);
}

constexpr int kBulletSegments = 12;

} // namespace

RadarRecipe::RadarRecipe(Id idBase, const RadarRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

std::vector<Id> RadarRecipe::drawItemIds() const {
  return {webDrawItemId(), holeDrawItemId(), fillDrawItemId(),
          outlineDrawItemId(), highlightDrawItemId(), innerWebDrawItemId()};
}

RecipeBuildResult RadarRecipe::build() const {
  RecipeBuildResult result;
  auto idStr = [](Id id) { return std::to_string(id); };

  struct Group {
    Id buffer, geometry, drawItem;
    const char* format;
    const char* pipeline;
    const char* suffix;
  };
  const Group groups[] = {
    {webBufferId(), webGeometryId(), webDrawItemId(), "pos2_clip", "line2d@1", "_web"},
    {holeBufferId(), holeGeometryId(), holeDrawItemId(), "pos2_clip", "triSolid@1", "_hole"},
    {fillBufferId(), fillGeometryId(), fillDrawItemId(), "pos2_clip", "triSolid@1", "_fill"},
    {outlineBufferId(), outlineGeometryId(), outlineDrawItemId(), "pos2_clip", "line2d@1", "_outline"},
    {highlightBufferId(), highlightGeometryId(), highlightDrawItemId(), "rect4", "instancedRect@1", "_highlight"},
    {innerWebBufferId(), innerWebGeometryId(), innerWebDrawItemId(), "pos2_clip", "line2d@1", "_innerWeb"},
  };

  for (const Group& g : groups) {
    result.createCommands.push_back(
      R"({"cmd":"createBuffer","id":)" + idStr(g.buffer) + R"(,"byteLength":0})");
    result.createCommands.push_back(
      R"({"cmd":"createGeometry","id":)" + idStr(g.geometry) +
      R"(,"vertexBufferId":)" + idStr(g.buffer) +
      R"(,"format":")" + g.format + R"(","vertexCount":1})");
    result.createCommands.push_back(
      R"({"cmd":"createDrawItem","id":)" + idStr(g.drawItem) +
      R"(,"layerId":)" + idStr(config_.layerId) +
      R"(,"name":")" + config_.name + g.suffix + R"("})");
    result.createCommands.push_back(
      R"({"cmd":"bindDrawItem","drawItemId":)" + idStr(g.drawItem) +
      R"(,"pipeline":")" + g.pipeline + R"(","geometryId":)" + idStr(g.geometry) + "}");
  }

  result.createCommands.push_back(styleCommand(holeDrawItemId(), config_.holeColor, 1.0f));
  result.createCommands.push_back(styleCommand(fillDrawItemId(), config_.fillColor, 1.0f));
  result.createCommands.push_back(styleCommand(outlineDrawItemId(), config_.outlineColor, config_.outlineWidth));
  result.createCommands.push_back(styleCommand(highlightDrawItemId(), config_.highlightColor, 1.0f));

  // Dispose (reverse)
  for (int i = 5; i >= 0; i--) {
    const Group& g = groups[i];
    result.disposeCommands.push_back(R"({"cmd":"delete","id":)" + idStr(g.drawItem) + "}");
    result.disposeCommands.push_back(R"({"cmd":"delete","id":)" + idStr(g.geometry) + "}");
    result.disposeCommands.push_back(R"({"cmd":"delete","id":)" + idStr(g.buffer) + "}");
  }

  return result;
}

const RadarFrame& RadarRecipe::computeFrame(const RadarChart& chart) {
  frame_ = RadarFrame{};
  chart.draw(*this);

  const RadarLayout& layout = chart.layout();
  if (chart.hasDrawableData() && layout.xAxisEnabled && layout.xAxisLabelsEnabled) {
    for (int i = 0; i < chart.entryCount(); i++) {
      pushPoint(frame_.labelAnchors, chart.labelAnchor(i));
    }
  }
  return frame_;
}

std::vector<CmdString> RadarRecipe::webStyleCommands(const RadarChart& chart) const {
  const RadarConfig& cfg = chart.config();
  return {
    styleCommand(webDrawItemId(), config_.webColor[0], config_.webColor[1],
                 config_.webColor[2], cfg.webAlpha, cfg.webLineWidth),
    styleCommand(innerWebDrawItemId(), config_.innerWebColor[0], config_.innerWebColor[1],
                 config_.innerWebColor[2], cfg.webAlpha, cfg.innerWebLineWidth),
  };
}

std::vector<CmdString> RadarRecipe::vertexCountCommands() const {
  auto cmd = [](Id geometryId, std::uint32_t vertexCount) {
    if (vertexCount < 1) vertexCount = 1; // min for geometry validation
    return R"({"cmd":"setGeometryVertexCount","geometryId":)" + std::to_string(geometryId) +
           R"(,"vertexCount":)" + std::to_string(vertexCount) + "}";
  };

  return {
    cmd(webGeometryId(), RadarFrame::vertexCount(frame_.webSegments)),
    cmd(holeGeometryId(), RadarFrame::vertexCount(frame_.holeTriangles)),
    cmd(fillGeometryId(), RadarFrame::vertexCount(frame_.fillTriangles)),
    cmd(outlineGeometryId(), RadarFrame::vertexCount(frame_.outlineSegments)),
    cmd(highlightGeometryId(), frame_.highlightCount),
    cmd(innerWebGeometryId(), RadarFrame::vertexCount(frame_.innerWebSegments)),
  };
}

void RadarRecipe::drawExtras(const RadarChart& chart) {
  drawWeb(chart);
  drawHole(chart);
}

void RadarRecipe::drawWeb(const RadarChart& chart) {
  const double slice = chart.sliceAngle();
  const double factor = chart.factor();
  const double rotation = chart.rotationDegrees();
  const Point c = chart.center();
  const int count = chart.entryCount();
  const double bullet = chart.webLineHoleRadius();

  // Spokes from center, each ending in a small bullet ring
  for (int i : eligibleSpokes(count, chart.skipWebLineCount())) {
    double angle = slice * i + rotation;
    Point end = movePoint(c, chart.yRange() * factor, angle);
    pushSegment(frame_.webSegments, c, end);

    for (int k = 0; k < kBulletSegments; k++) {
      double a0 = 360.0 * k / kBulletSegments;
      double a1 = 360.0 * (k + 1) / kBulletSegments;
      pushSegment(frame_.webSegments, movePoint(end, bullet, a0), movePoint(end, bullet, a1));
    }
  }

  // Concentric rings at the radial-axis levels
  for (double level : chart.ringLevels()) {
    double r = (level - chart.chartYMin()) * factor;
    if (r <= 0.0) continue;
    for (int i = 0; i < count; i++) {
      Point p1 = movePoint(c, r, slice * i + rotation);
      Point p2 = movePoint(c, r, slice * (i + 1) + rotation);
      pushSegment(frame_.innerWebSegments, p1, p2);
    }
  }
}

void RadarRecipe::drawHole(const RadarChart& chart) {
  if (!chart.config().drawHoleEnabled) return;
  double r = chart.holeRadius();
  if (!(r > 0.0)) return;

  int segments = config_.holeSegments < 3 ? 3 : config_.holeSegments;
  Point c = chart.center();
  for (int k = 0; k < segments; k++) {
    double a0 = 360.0 * k / segments;
    double a1 = 360.0 * (k + 1) / segments;
    pushPoint(frame_.holeTriangles, c);
    pushPoint(frame_.holeTriangles, movePoint(c, r, a0));
    pushPoint(frame_.holeTriangles, movePoint(c, r, a1));
  }
}

void RadarRecipe::drawData(const RadarChart& chart) {
  const RadarData& data = chart.data();
  const Point c = chart.center();

  for (const RadarSeries& s : data.allSeries()) {
    if (!s.visible) continue;

    std::vector<Point> verts;
    for (std::size_t j = 0; j < s.values.size(); j++) {
      if (!std::isfinite(s.values[j])) continue;
      verts.push_back(chart.pointForEntry(static_cast<int>(j), s.values[j]));
    }
    if (verts.size() < 2) continue;

    for (std::size_t j = 0; j < verts.size(); j++) {
      const Point& a = verts[j];
      const Point& b = verts[(j + 1) % verts.size()];
      pushPoint(frame_.fillTriangles, c);
      pushPoint(frame_.fillTriangles, a);
      pushPoint(frame_.fillTriangles, b);
      pushSegment(frame_.outlineSegments, a, b);
    }
  }
}

void RadarRecipe::drawHighlighted(const RadarChart& chart,
                                  const std::vector<Highlight>& highlights) {
  double sz = chart.webLineHoleRadius();

  for (const Highlight& h : highlights) {
    if (h.entryIndex < 0 || h.entryIndex >= chart.entryCount()) continue;

    // Position from the current layout, not the one at pick time
    Point p = chart.pointForEntry(h.entryIndex, h.value);
    frame_.highlightRects.push_back(static_cast<float>(p.x - sz));
    frame_.highlightRects.push_back(static_cast<float>(p.y - sz));
    frame_.highlightRects.push_back(static_cast<float>(p.x + sz));
    frame_.highlightRects.push_back(static_cast<float>(p.y + sz));
    frame_.highlightCount++;
  }
}

} // namespace rc
