// D4.1 — RadarRecipe
// Tests: build emits create/style/dispose commands with deterministic IDs,
// frame vertex counts for spokes / rings / hole / series / highlights, skip
// count and hole toggles, vertex positions, vertexCount commands, web styles
// from the chart config, label anchors, hidden series drop their markers.

#include "rc/chart/RadarChart.hpp"
#include "rc/recipe/RadarRecipe.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static bool approxf(float a, float b, float eps = 1e-3f) {
  return std::fabs(a - b) < eps;
}

int main() {
  rc::RadarRecipeConfig rcfg;
  rcfg.layerId = 10;
  rcfg.name = "radar";
  rcfg.holeSegments = 48;
  rc::RadarRecipe recipe(100, rcfg);

  // --- Test 1: build ---
  {
    auto br = recipe.build();
    // 6 groups x 4 create commands + 4 static style commands
    requireTrue(br.createCommands.size() == 28, "28 create commands");
    requireTrue(br.disposeCommands.size() == 18, "18 dispose commands");
    requireTrue(br.createCommands[0] == R"({"cmd":"createBuffer","id":100,"byteLength":0})",
                "first command creates web buffer");
    requireTrue(br.createCommands[3].find("line2d@1") != std::string::npos, "web uses line2d");
    requireTrue(br.createCommands[19].find("instancedRect@1") != std::string::npos,
                "highlights use instancedRect");
    requireTrue(br.createCommands[23].find("_innerWeb") == std::string::npos &&
                br.createCommands[22].find("_innerWeb") != std::string::npos,
                "ring draw item created last");
    requireTrue(br.disposeCommands[0] == R"({"cmd":"delete","id":117})",
                "dispose starts with ring drawItem");
    for (const auto& c : br.createCommands) {
      requireTrue(c.find(R"("drawItemId":102,"r")") == std::string::npos,
                  "spoke style not fixed at build time");
    }
    requireTrue(recipe.drawItemIds().size() == 6, "6 draw items");
    requireTrue(recipe.highlightDrawItemId() == 114, "deterministic ids");
    requireTrue(recipe.innerWebDrawItemId() == 117, "ring draw item id");
    std::printf("  Test 1 (build) PASS\n");
  }

  rc::RadarChart chart;
  chart.setContentRect(rc::Rect{0, 0, 200, 200});
  rc::RadarData data;
  rc::RadarSeries a;
  a.values = {100.0, 50.0, 80.0, 20.0};
  rc::RadarSeries b;
  b.values = {40.0, 90.0, 30.0, 60.0};
  data.addSeries(a);
  data.addSeries(b);
  chart.setData(data);
  chart.setAxisMinimum(0.0);

  // --- Test 2: full frame ---
  {
    chart.setSkipWebLineCount(1);
    rc::Highlight h;
    h.entryIndex = 1;
    h.dataSetIndex = 0;
    h.value = 50.0;
    chart.highlightValues({h});

    const rc::RadarFrame& f = recipe.computeFrame(chart);

    // Spokes 0 and 2: 1 spoke segment + 12 bullet segments each.
    // Rings 20, 40, 60, 80, 100: 4 segments each.
    requireTrue(rc::RadarFrame::vertexCount(f.webSegments) == 2 * 13 * 2, "spoke vertices");
    requireTrue(rc::RadarFrame::vertexCount(f.innerWebSegments) == 5 * 4 * 2, "ring vertices");
    requireTrue(rc::RadarFrame::vertexCount(f.holeTriangles) == 48 * 3, "hole fan");
    requireTrue(rc::RadarFrame::vertexCount(f.fillTriangles) == 2 * 4 * 3, "2 series x 4 tris");
    requireTrue(rc::RadarFrame::vertexCount(f.outlineSegments) == 2 * 4 * 2, "2 series x 4 segs");
    requireTrue(f.highlightCount == 1 && f.highlightRects.size() == 4, "1 highlight rect");

    // First spoke: center -> top (rotation 270)
    requireTrue(approxf(f.webSegments[0], 100.0f) && approxf(f.webSegments[1], 100.0f), "spoke from center");
    requireTrue(approxf(f.webSegments[2], 100.0f) && approxf(f.webSegments[3], 0.0f), "spoke to top");

    // Highlight marker centered on A[1] = (150, 100), half-size 1.5 * 3
    requireTrue(approxf(f.highlightRects[0], 145.5f) && approxf(f.highlightRects[2], 154.5f), "marker x");
    requireTrue(approxf(f.highlightRects[1], 95.5f) && approxf(f.highlightRects[3], 104.5f), "marker y");

    // First fill triangle: center, A[0] (top), A[1] (right)
    requireTrue(approxf(f.fillTriangles[2], 100.0f) && approxf(f.fillTriangles[3], 0.0f), "A[0] at top");
    requireTrue(approxf(f.fillTriangles[4], 150.0f) && approxf(f.fillTriangles[5], 100.0f), "A[1] at right");
    std::printf("  Test 2 (full frame) PASS\n");
  }

  // --- Test 3: vertexCount commands follow the frame ---
  {
    auto cmds = recipe.vertexCountCommands();
    requireTrue(cmds.size() == 6, "6 geometries");
    requireTrue(cmds[0] == R"({"cmd":"setGeometryVertexCount","geometryId":101,"vertexCount":52})",
                "spoke geometry count");
    requireTrue(cmds[5] == R"({"cmd":"setGeometryVertexCount","geometryId":116,"vertexCount":40})",
                "ring geometry count");
    requireTrue(cmds[4] == R"({"cmd":"setGeometryVertexCount","geometryId":113,"vertexCount":1})",
                "highlight instance count");
    std::printf("  Test 3 (vertex counts) PASS\n");
  }

  // --- Test 4: toggles ---
  {
    chart.setDrawHoleEnabled(false);
    chart.clearHighlights();
    chart.setSeriesVisible(1, false);
    const rc::RadarFrame& f = recipe.computeFrame(chart);
    requireTrue(f.holeTriangles.empty(), "no hole");
    requireTrue(f.highlightCount == 0, "no highlights");
    requireTrue(rc::RadarFrame::vertexCount(f.fillTriangles) == 4 * 3, "1 series");

    chart.setDrawWeb(false);
    const rc::RadarFrame& g = recipe.computeFrame(chart);
    requireTrue(g.webSegments.empty() && g.innerWebSegments.empty(), "no web");
    requireTrue(!g.fillTriangles.empty(), "data still drawn");
    std::printf("  Test 4 (toggles) PASS\n");
  }

  // --- Test 5: degenerate chart produces an empty frame ---
  {
    rc::RadarChart empty;
    empty.setContentRect(rc::Rect{0, 0, 200, 200});
    const rc::RadarFrame& f = recipe.computeFrame(empty);
    requireTrue(f.webSegments.empty() && f.fillTriangles.empty() && f.holeTriangles.empty(),
                "empty frame");
    auto cmds = recipe.vertexCountCommands();
    requireTrue(cmds[2] == R"({"cmd":"setGeometryVertexCount","geometryId":107,"vertexCount":1})",
                "min vertex count 1");
    std::printf("  Test 5 (degenerate) PASS\n");
  }

  // --- Test 6: web styles follow the chart config ---
  {
    rc::RadarConfig cfg;
    cfg.webAlpha = 0.5;
    rc::RadarChart styled(cfg);
    auto styles = recipe.webStyleCommands(styled);
    requireTrue(styles.size() == 2, "spoke and ring styles");
    requireTrue(styles[0].find(R"("drawItemId":102,)") != std::string::npos, "spoke draw item");
    requireTrue(styles[0].find(R"("a":0.5,)") != std::string::npos, "spoke alpha from webAlpha");
    requireTrue(styles[0].find(R"("lineWidth":1.5})") != std::string::npos, "default spoke width");
    requireTrue(styles[1].find(R"("drawItemId":117,)") != std::string::npos, "ring draw item");
    requireTrue(styles[1].find(R"("a":0.5,)") != std::string::npos, "ring alpha from webAlpha");
    requireTrue(styles[1].find(R"("lineWidth":0.75})") != std::string::npos, "inner width");

    styled.setWebLineWidth(2.5);
    styles = recipe.webStyleCommands(styled);
    requireTrue(styles[0].find(R"("lineWidth":2.5})") != std::string::npos,
                "setWebLineWidth changes the drawn width");
    requireTrue(styles[1].find(R"("lineWidth":0.75})") != std::string::npos,
                "ring width unchanged");
    std::printf("  Test 6 (web styles) PASS\n");
  }

  // --- Test 7: label anchors ---
  {
    rc::RadarChart labeled;
    rc::RadarLayout layout;
    layout.contentRect = rc::Rect{0, 0, 200, 200};
    layout.xAxisLabelRotatedWidth = 20.0;
    labeled.setLayout(layout);
    labeled.setData(data);
    labeled.setAxisMinimum(0.0);

    const rc::RadarFrame& f = recipe.computeFrame(labeled);
    requireTrue(f.labelAnchors.size() == 4 * 2, "one anchor per category");
    // Category 0 at the top, outer radius 100 plus half the label width
    requireTrue(approxf(f.labelAnchors[0], 100.0f) && approxf(f.labelAnchors[1], -10.0f),
                "anchor 0 above the web");
    requireTrue(approxf(f.labelAnchors[2], 210.0f) && approxf(f.labelAnchors[3], 100.0f),
                "anchor 1 right of the web");

    layout.xAxisLabelsEnabled = false;
    labeled.setLayout(layout);
    requireTrue(recipe.computeFrame(labeled).labelAnchors.empty(), "labels off -> no anchors");
    std::printf("  Test 7 (label anchors) PASS\n");
  }

  // --- Test 8: hiding a series drops its highlight marker ---
  {
    rc::RadarChart chart2;
    chart2.setContentRect(rc::Rect{0, 0, 200, 200});
    chart2.setData(data);
    chart2.setAxisMinimum(0.0);
    rc::Highlight h0;
    h0.entryIndex = 0;
    h0.dataSetIndex = 0;
    h0.value = 100.0;
    rc::Highlight h1;
    h1.entryIndex = 1;
    h1.dataSetIndex = 1;
    h1.value = 90.0;
    chart2.highlightValues({h0, h1});

    chart2.setSeriesVisible(1, false);
    const rc::RadarFrame& f = recipe.computeFrame(chart2);
    requireTrue(f.highlightCount == 1, "only the visible series marker");
    requireTrue(approxf(f.highlightRects[0], 95.5f) && approxf(f.highlightRects[1], -4.5f),
                "marker on series 0 entry 0");
    std::printf("  Test 8 (hidden series highlight) PASS\n");
  }

  std::printf("D4.1 radar recipe: ALL PASS\n");
  return 0;
}
