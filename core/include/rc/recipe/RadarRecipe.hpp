#pragma once
#include "rc/chart/RadarRenderer.hpp"
#include "rc/recipe/Recipe.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace rc {

class RadarChart;

struct RadarRecipeConfig {
  Id layerId{0};
  std::string name;
  // Web colors are RGB; alpha and line widths come from the chart's RadarConfig.
  float webColor[3] = {122.0f / 255.0f, 122.0f / 255.0f, 122.0f / 255.0f};
  float innerWebColor[3] = {122.0f / 255.0f, 122.0f / 255.0f, 122.0f / 255.0f};
  float fillColor[4] = {0.3f, 0.5f, 1.0f, 0.35f};
  float outlineColor[4] = {0.3f, 0.5f, 1.0f, 1.0f};
  float outlineWidth{1.0f};
  float highlightColor[4] = {1.0f, 1.0f, 0.3f, 0.8f};
  float holeColor[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  int holeSegments{48};
};

// Vertex data for one frame. Positions are in the chart's pixel space.
struct RadarFrame {
  std::vector<float> webSegments;      // line2d: x0,y0,x1,y1 per segment
  std::vector<float> innerWebSegments; // line2d, concentric rings
  std::vector<float> holeTriangles;    // triSolid: 3 pos2 per triangle
  std::vector<float> fillTriangles;    // triSolid
  std::vector<float> outlineSegments;  // line2d
  std::vector<float> highlightRects;   // rect4 instances
  std::uint32_t highlightCount{0};
  std::vector<float> labelAnchors;     // pos2 per category, empty when labels are off

  static std::uint32_t vertexCount(const std::vector<float>& pos2) {
    return static_cast<std::uint32_t>(pos2.size() / 2);
  }
};

// Radar chart as engine draw items, and the renderer that fills them.
// ID layout (18 slots), each group buffer/geometry/drawItem:
//    0-2:  web spokes       line2d@1
//    3-5:  center hole      triSolid@1
//    6-8:  series fills     triSolid@1
//    9-11: series outlines  line2d@1
//   12-14: highlights       instancedRect@1
//   15-17: web rings        line2d@1
class RadarRecipe : public Recipe, public RadarRenderer {
public:
  RadarRecipe(Id idBase, const RadarRecipeConfig& config);

  RecipeBuildResult build() const override;
  std::vector<Id> drawItemIds() const override;

  Id webBufferId() const          { return rid(0); }
  Id webGeometryId() const        { return rid(1); }
  Id webDrawItemId() const        { return rid(2); }
  Id holeBufferId() const         { return rid(3); }
  Id holeGeometryId() const       { return rid(4); }
  Id holeDrawItemId() const       { return rid(5); }
  Id fillBufferId() const         { return rid(6); }
  Id fillGeometryId() const       { return rid(7); }
  Id fillDrawItemId() const       { return rid(8); }
  Id outlineBufferId() const      { return rid(9); }
  Id outlineGeometryId() const    { return rid(10); }
  Id outlineDrawItemId() const    { return rid(11); }
  Id highlightBufferId() const    { return rid(12); }
  Id highlightGeometryId() const  { return rid(13); }
  Id highlightDrawItemId() const  { return rid(14); }
  Id innerWebBufferId() const     { return rid(15); }
  Id innerWebGeometryId() const   { return rid(16); }
  Id innerWebDrawItemId() const   { return rid(17); }

  static constexpr std::uint32_t ID_SLOTS = 18;

  // Clear the frame, let the chart dispatch to this renderer, return the result.
  const RadarFrame& computeFrame(const RadarChart& chart);
  const RadarFrame& frame() const { return frame_; }

  // setGeometryVertexCount commands matching the current frame.
  std::vector<CmdString> vertexCountCommands() const;

  // setDrawItemStyle for the spoke and ring draw items from the chart's web
  // options. Emit after build() and whenever those options change.
  std::vector<CmdString> webStyleCommands(const RadarChart& chart) const;

  // RadarRenderer
  void drawExtras(const RadarChart& chart) override;
  void drawData(const RadarChart& chart) override;
  void drawHighlighted(const RadarChart& chart,
                       const std::vector<Highlight>& highlights) override;

  const RadarRecipeConfig& config() const { return config_; }

private:
  RadarRecipeConfig config_;
  RadarFrame frame_;

  void drawWeb(const RadarChart& chart);
  void drawHole(const RadarChart& chart);
};

} // namespace rc
