#include "chart.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace fs = std::filesystem;

RhythmNote makeNote(double time, double endTime, int lane) {
  RhythmNote n{};
  n.time = time;
  n.endTime = std::max(time, endTime);
  n.duration = n.endTime - n.time;
  n.lane = lane;
  n.kind = n.duration > 0.0 ? NoteKind::Long : NoteKind::Short;
  return n;
}

void finalizeChart(Chart& c) {
  if (c.keyCount < 1) c.keyCount = 4;
  std::stable_sort(c.notes.begin(), c.notes.end(),
    [](const RhythmNote& a, const RhythmNote& b){ return a.time < b.time; });
  std::stable_sort(c.timingPoints.begin(), c.timingPoints.end(),
    [](const TimingPoint& a, const TimingPoint& b){ return a.time < b.time; });
  c.totalDuration = 0.0;
  for (const auto& n : c.notes) c.totalDuration = std::max(c.totalDuration, n.endTime);
}

double bpmAtTime(const std::vector<TimingPoint>& points, double time) {
  if (points.empty()) return 0.0;
  const TimingPoint* current = &points.front();
  for (const auto& p : points) {
    if (p.time > time) break;
    current = &p;
  }
  return current->bpm;
}

std::optional<Chart> loadChart(const fs::path& path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char ch){ return (char)std::tolower(ch); });
  if (ext == ".osu")  return loadChartOsu(path);
  if (ext == ".json") return loadChartJson(path);
  std::cerr << "Unknown chart format: " << path << "\n";
  return std::nullopt;
}
