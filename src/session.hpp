#pragma once
#include <optional>
#include <set>
#include <string>
#include "chart.hpp"
#include "course.hpp"
#include "runner.hpp"
#include "settings.hpp"

enum class Side { Left, Right };
enum class ActionResult { Ignored, Whiff, Hit };

struct ScoreState {
  std::set<int> hitNotes;
  std::set<int> missedNotes;
  int combo = 0;
  int bestCombo = 0;
  size_t nextRailIndex = 0; // only moves forward within a run
};

// Ties a chart, the course builder, the runner and the rail scoring together and
// takes the commands the front-end issues. Single caller; each call runs to completion.
class Session {
public:
  Session(VoxelWorld& world, AvatarBody& avatar, const Settings& settings,
          WallClock wallClock = steadyWallClock());

  void setChart(Chart chart);
  const std::optional<Chart>& chart() const { return chart_; }
  void setAudio(AudioClock* audio) { runner_.setAudio(audio); }

  void setMode(CourseMode m) { mode_ = m; }
  CourseMode mode() const { return mode_; }

  // Builds a course for the current chart at baseCell and applies it.
  bool buildCourse(CourseMode mode, const Coords3& baseCell);
  bool startRun();
  void clearCourse();

  // Frame tick: runner first, then the rail miss sweep.
  void update(double dt);

  ActionResult handleAction(Side side);
  void resolveRailMisses();

  const Runner& runner() const { return runner_; }
  Runner& runner() { return runner_; }
  const ScoreState& score() const { return score_; }
  const std::string& status() const { return status_; }
  // "Combo: c / Best: b | Hit: h | Miss: m"
  std::string scoreLine() const;
  bool courseBuilt() const { return runner_.activeCourse() != nullptr; }

private:
  BuilderOptions builderOptions(CourseMode mode, const Coords3& baseCell) const;
  void resetScore();
  void advanceRailPointer();
  void clearCell(const Coords3& cell);
  void setStatus(std::string s);

  VoxelWorld& world_;
  Settings settings_;
  Runner runner_;
  std::optional<Chart> chart_;
  CourseMode mode_ = CourseMode::Platform;
  ScoreState score_;
  std::string status_;
};
