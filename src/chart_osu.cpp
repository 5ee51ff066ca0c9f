#include "chart.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <map>
#include <sstream>

namespace fs = std::filesystem;

// osu! playfield width in osu!pixels; mania columns split it evenly.
static constexpr double kPlayfieldWidth = 512.0;
static constexpr int    kHoldBit = 128;

namespace {

using Section = std::vector<std::string>;

std::string_view trim(std::string_view s) {
  const char* ws = " \t\r\n";
  size_t b = s.find_first_not_of(ws);
  if (b == std::string_view::npos) return {};
  size_t e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

bool skipLine(std::string_view trimmed) {
  return trimmed.empty() || trimmed.substr(0, 2) == "//";
}

std::optional<double> parseNumber(std::string_view s) {
  std::string tmp(trim(s));
  if (tmp.empty()) return std::nullopt;
  char* end = nullptr;
  double v = std::strtod(tmp.c_str(), &end);
  if (end != tmp.c_str() + tmp.size() || !std::isfinite(v)) return std::nullopt;
  return v;
}

std::vector<std::string_view> split(std::string_view s, char sep) {
  std::vector<std::string_view> out;
  size_t start = 0;
  for (;;) {
    size_t pos = s.find(sep, start);
    if (pos == std::string_view::npos) { out.push_back(s.substr(start)); break; }
    out.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
  return out;
}

std::map<std::string, Section> splitSections(std::string_view content) {
  std::map<std::string, Section> sections;
  Section* current = nullptr;
  std::istringstream in{std::string(content)};
  std::string line;
  while (std::getline(in, line)) {
    std::string_view t = trim(line);
    if (t.size() > 2 && t.front() == '[' && t.back() == ']') {
      current = &sections[std::string(t.substr(1, t.size() - 2))];
      current->clear();
      continue;
    }
    if (current) current->push_back(line);
  }
  return sections;
}

std::map<std::string, std::string> parseKeyValues(const Section& lines) {
  std::map<std::string, std::string> kv;
  for (const auto& line : lines) {
    std::string_view t = trim(line);
    if (skipLine(t)) continue;
    size_t colon = t.find(':');
    if (colon == std::string_view::npos) continue;
    std::string_view key = trim(t.substr(0, colon));
    if (key.empty()) continue;
    kv[std::string(key)] = std::string(trim(t.substr(colon + 1)));
  }
  return kv;
}

std::vector<TimingPoint> parseTimingPoints(const Section& lines) {
  std::vector<TimingPoint> points;
  for (const auto& line : lines) {
    std::string_view t = trim(line);
    if (skipLine(t)) continue;
    auto parts = split(t, ',');
    if (parts.size() < 2) continue;
    auto timeMs = parseNumber(parts[0]);
    auto beatLength = parseNumber(parts[1]);
    if (!timeMs || !beatLength) continue;
    // negative beat length marks an inherited (slider velocity) point
    if (*beatLength < 0.0) continue;
    std::optional<double> meter = parts.size() > 2 ? parseNumber(parts[2]) : std::optional<double>(4.0);
    TimingPoint p{};
    p.time = *timeMs / 1000.0;
    p.bpm = *beatLength != 0.0 ? 60000.0 / *beatLength : 0.0;
    p.meter = (meter && *meter >= 1.0 && *meter <= kMaxMeter) ? (int)*meter : 4;
    points.push_back(p);
  }
  return points;
}

std::vector<RhythmNote> parseHitObjects(const Section& lines, int keyCount) {
  std::vector<RhythmNote> notes;
  const double laneWidth = kPlayfieldWidth / keyCount;
  for (const auto& line : lines) {
    std::string_view t = trim(line);
    if (skipLine(t)) continue;
    auto parts = split(t, ',');
    if (parts.size() < 5) continue;
    auto x = parseNumber(parts[0]);
    auto timeMs = parseNumber(parts[2]);
    auto type = parseNumber(parts[3]);
    if (!x || !timeMs || !type) continue;

    double endTimeMs = *timeMs;
    // type is a bit field; anything outside int range is not a hold
    bool hold = *type >= 0.0 && *type < 2147483648.0 &&
                (static_cast<long long>(*type) & kHoldBit) == kHoldBit;
    if (hold && parts.size() > 5) {
      auto endField = split(parts[5], ':');
      if (auto parsedEnd = parseNumber(endField[0])) endTimeMs = *parsedEnd;
    }
    int lane = (int)std::clamp(std::floor(*x / laneWidth), 0.0, double(keyCount - 1));
    notes.push_back(makeNote(*timeMs / 1000.0, endTimeMs / 1000.0, lane));
  }
  return notes;
}

std::string valueOr(const std::map<std::string, std::string>& kv, const char* key, const char* fallback) {
  auto it = kv.find(key);
  return (it != kv.end() && !it->second.empty()) ? it->second : fallback;
}

} // namespace

Chart parseChartOsu(std::string_view content) {
  auto sections = splitSections(content);
  const Section empty;
  auto section = [&](const char* name) -> const Section& {
    auto it = sections.find(name);
    return it != sections.end() ? it->second : empty;
  };

  auto metadata = parseKeyValues(section("Metadata"));
  auto general = parseKeyValues(section("General"));
  auto difficulty = parseKeyValues(section("Difficulty"));

  Chart c;
  c.title = valueOr(metadata, "Title", "Unknown Title");
  c.artist = valueOr(metadata, "Artist", "Unknown Artist");
  c.creator = valueOr(metadata, "Creator", "Unknown Mapper");
  c.version = valueOr(metadata, "Version", "");
  c.audioFilename = valueOr(general, "AudioFilename", "");

  auto cs = difficulty.count("CircleSize") ? parseNumber(difficulty["CircleSize"]) : std::nullopt;
  c.keyCount = (cs && *cs >= 1.0) ? (int)std::min(*cs, double(kMaxKeyCount)) : 4;

  c.timingPoints = parseTimingPoints(section("TimingPoints"));
  c.notes = parseHitObjects(section("HitObjects"), c.keyCount);
  finalizeChart(c);
  return c;
}

std::optional<Chart> loadChartOsu(const fs::path& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return std::nullopt;
  std::stringstream ss;
  ss << f.rdbuf();
  return parseChartOsu(ss.str());
}
