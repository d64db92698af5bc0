// Radar Chart Demo
// Builds a 6-category radar chart with two series, applies a few JSON option
// commands, emits the recipe's engine commands and the frame's vertex counts,
// then resolves a handful of pointer positions to highlighted vertices.

#include "rc/chart/RadarChart.hpp"
#include "rc/chart/RadarHighlighter.hpp"
#include "rc/commands/CommandProcessor.hpp"
#include "rc/recipe/RadarRecipe.hpp"
#include "rc/session/RadarConfig.hpp"

#include <cstdio>
#include <cstdlib>

static void requireOk(const rc::CmdResult& r, const char* ctx) {
  if (!r.ok) {
    std::fprintf(stderr, "FAIL [%s]: code=%s msg=%s\n",
                 ctx, r.err.code.c_str(), r.err.message.c_str());
    std::exit(1);
  }
}

int main() {
  rc::RadarData data({"Speed", "Power", "Range", "Armor", "Agility", "Cost"});

  rc::RadarSeries scout;
  scout.name = "Scout";
  scout.values = {92.0, 35.0, 70.0, 25.0, 88.0, 40.0};
  data.addSeries(scout);

  rc::RadarSeries tank;
  tank.name = "Tank";
  tank.values = {30.0, 85.0, 45.0, 95.0, 20.0, 75.0};
  data.addSeries(tank);

  rc::RadarChart chart;
  chart.setData(data);

  rc::CommandProcessor cp(chart);
  requireOk(cp.applyJsonText(R"({"cmd":"setContentRect","x":20,"y":20,"width":360,"height":360})"),
            "setContentRect");
  requireOk(cp.applyJsonText(R"({"cmd":"setAxisMinimum","value":0})"), "setAxisMinimum");
  requireOk(cp.applyJsonText(R"({"cmd":"setHoleRadiusPercent","value":0.1})"), "setHoleRadiusPercent");

  std::printf("config: %s\n", rc::serializeRadarConfig(chart.config()).c_str());
  std::printf("entries=%d slice=%.1f factor=%.3f radius=%.1f axis=[%g, %g]\n",
              chart.entryCount(), chart.sliceAngle(), chart.factor(), chart.radius(),
              chart.chartYMin(), chart.chartYMax());

  rc::RadarRecipeConfig rcfg;
  rcfg.layerId = 10;
  rcfg.name = "radar";
  rc::RadarRecipe recipe(100, rcfg);

  auto br = recipe.build();
  for (const auto& c : br.createCommands) std::printf("%s\n", c.c_str());
  for (const auto& c : recipe.webStyleCommands(chart)) std::printf("%s\n", c.c_str());

  const double pointers[][2] = {
    {200.0, 60.0},   // up, near Scout's Speed
    {330.0, 150.0},  // upper right
    {200.0, 330.0},  // down
    {600.0, 600.0},  // outside
  };

  rc::RadarHighlighter highlighter(chart);
  for (const auto& p : pointers) {
    rc::RadarHit hit = highlighter.pick(p[0], p[1]);
    if (!hit.hit) {
      std::printf("pointer (%.0f, %.0f): no hit\n", p[0], p[1]);
      continue;
    }
    const auto& h = hit.highlight;
    std::printf("pointer (%.0f, %.0f): %s / %s = %g\n", p[0], p[1],
                chart.data().series(h.dataSetIndex).name.c_str(),
                chart.data().categoryLabels()[static_cast<std::size_t>(h.entryIndex)].c_str(),
                h.value);
    chart.highlightValues({h});
  }

  const rc::RadarFrame& f = recipe.computeFrame(chart);
  std::printf("spokes=%u rings=%u hole=%u fill=%u outline=%u highlights=%u labels=%u\n",
              rc::RadarFrame::vertexCount(f.webSegments),
              rc::RadarFrame::vertexCount(f.innerWebSegments),
              rc::RadarFrame::vertexCount(f.holeTriangles),
              rc::RadarFrame::vertexCount(f.fillTriangles),
              rc::RadarFrame::vertexCount(f.outlineSegments),
              f.highlightCount,
              rc::RadarFrame::vertexCount(f.labelAnchors));
  for (const auto& c : recipe.vertexCountCommands()) std::printf("%s\n", c.c_str());

  return 0;
}
