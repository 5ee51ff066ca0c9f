#include "chart.hpp"
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

// {"meta": {...}, "timing": [{"t": ms, "bpm": 120, "meter": 4}],
//  "notes": [{"t": ms, "lane": 0, "len": ms}]}
std::optional<Chart> loadChartJson(const fs::path& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  json j = json::parse(f, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return std::nullopt;
  Chart c;
  if (j.contains("meta") && j["meta"].is_object()) {
    auto m = j["meta"];
    if (m.contains("title")   && m["title"].is_string())   c.title = m["title"].get<std::string>();
    if (m.contains("artist")  && m["artist"].is_string())  c.artist = m["artist"].get<std::string>();
    if (m.contains("creator") && m["creator"].is_string()) c.creator = m["creator"].get<std::string>();
    if (m.contains("version") && m["version"].is_string()) c.version = m["version"].get<std::string>();
    if (m.contains("audio")   && m["audio"].is_string())   c.audioFilename = m["audio"].get<std::string>();
    if (m.contains("keys") && m["keys"].is_number_integer())
      c.keyCount = (int)std::clamp<std::int64_t>(m["keys"].get<std::int64_t>(), 0, kMaxKeyCount);
  }
  if (c.keyCount < 1) c.keyCount = 4;

  if (j.contains("timing") && j["timing"].is_array()) {
    for (auto& tj : j["timing"]) {
      if (!tj.is_object() || !tj.contains("t") || !tj["t"].is_number()) continue;
      if (!tj.contains("bpm") || !tj["bpm"].is_number()) continue;
      TimingPoint p{};
      p.time = tj["t"].get<double>() / 1000.0;
      p.bpm = tj["bpm"].get<double>();
      if (tj.contains("meter") && tj["meter"].is_number_integer()) {
        std::int64_t meter = tj["meter"].get<std::int64_t>();
        if (meter >= 1 && meter <= kMaxMeter) p.meter = (int)meter;
      }
      c.timingPoints.push_back(p);
    }
  }

  if (j.contains("notes") && j["notes"].is_array()) {
    for (auto& n : j["notes"]) {
      if (!n.is_object() || !n.contains("t") || !n["t"].is_number()) continue;
      double t = n["t"].get<double>();
      double len = (n.contains("len") && n["len"].is_number()) ? n["len"].get<double>() : 0.0;
      std::int64_t lane = (n.contains("lane") && n["lane"].is_number_integer()) ? n["lane"].get<std::int64_t>() : 0;
      lane = std::clamp<std::int64_t>(lane, 0, c.keyCount - 1);
      c.notes.push_back(makeNote(t / 1000.0, (t + len) / 1000.0, (int)lane));
    }
  }
  finalizeChart(c);
  return c;
}
