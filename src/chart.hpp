#pragma once
#include <vector>
#include <string>
#include <string_view>
#include <optional>
#include <filesystem>

enum class NoteKind { Short, Long };

// osu!mania tops out at 18 columns.
constexpr int kMaxKeyCount = 18;
constexpr int kMaxMeter = 64;

struct RhythmNote {
  double   time = 0.0;     // seconds from song start
  double   endTime = 0.0;  // == time for short notes
  double   duration = 0.0; // endTime - time
  int      lane = 0;       // 0 = leftmost column
  NoteKind kind = NoteKind::Short;
};

struct TimingPoint {
  double time = 0.0; // seconds
  double bpm = 0.0;
  int    meter = 4;
};

struct Chart {
  std::string title = "Unknown Title";
  std::string artist = "Unknown Artist";
  std::string creator = "Unknown Mapper";
  std::string version;
  std::string audioFilename;
  int keyCount = 4;
  std::vector<RhythmNote> notes;          // ascending by time
  std::vector<TimingPoint> timingPoints;  // ascending by time
  double totalDuration = 0.0;             // max endTime, 0 when empty
};

// Builds a note with endTime clamped to >= time and kind derived from duration.
RhythmNote makeNote(double time, double endTime, int lane);

// Sorts notes and timing points (stable) and recomputes totalDuration.
void finalizeChart(Chart& c);

// BPM of the last timing point at or before `time`; first point if none precede it,
// 0 when the list is empty.
double bpmAtTime(const std::vector<TimingPoint>& points, double time);

// Loaders for different chart formats
Chart parseChartOsu(std::string_view content);
std::optional<Chart> loadChartOsu(const std::filesystem::path& path);
std::optional<Chart> loadChartJson(const std::filesystem::path& path);
// Picks a loader from the file extension (.osu or .json).
std::optional<Chart> loadChart(const std::filesystem::path& path);
