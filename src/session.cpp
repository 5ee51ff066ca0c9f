#include "session.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <utility>

Session::Session(VoxelWorld& world, AvatarBody& avatar, const Settings& settings, WallClock wallClock)
  : world_(world), settings_(settings),
    runner_(world, avatar, settings.timing, std::move(wallClock)) {
  runner_.onFinish([this]{
    if (runner_.courseMode() == CourseMode::Rail) setStatus("Run finished. " + scoreLine());
    else setStatus("Run finished.");
  });
  setStatus("Load a chart and an audio source to begin.");
}

void Session::setChart(Chart chart) {
  std::ostringstream msg;
  msg << "Loaded chart: " << chart.title << " - " << chart.artist
      << " (" << chart.notes.size() << " notes, " << chart.keyCount << "K)";
  chart_ = std::move(chart);
  setStatus(msg.str());
}

BuilderOptions Session::builderOptions(CourseMode mode, const Coords3& baseCell) const {
  const CourseTuning& t = mode == CourseMode::Rail ? settings_.rail : settings_.platform;
  BuilderOptions o;
  o.baseCell = baseCell;
  o.moveSpeed = t.moveSpeed;
  o.laneSpacing = t.laneSpacing;
  o.jumpHeight = settings_.jumpHeight;
  o.gapThreshold = settings_.gapThreshold;
  o.fillerInset = settings_.fillerInset;
  o.railMargin = settings_.railMargin;
  o.materials = settings_.materials;
  return o;
}

bool Session::buildCourse(CourseMode mode, const Coords3& baseCell) {
  if (!chart_) {
    setStatus("No chart loaded.");
    return false;
  }
  try {
    CourseBuilder builder(world_, builderOptions(mode, baseCell));
    runner_.applyCourse(builder.build(*chart_, mode));
  } catch (const MissingMaterialError& e) {
    std::cerr << "Session: " << e.what() << "\n";
    setStatus("Cannot build course: world has no '" + e.material() + "' material.");
    return false;
  }
  mode_ = mode;
  resetScore();
  score_.bestCombo = 0;

  std::ostringstream msg;
  msg << "Built " << courseModeName(mode) << " course at ("
      << baseCell.x << ", " << baseCell.y << ", " << baseCell.z << "). Press start to play.";
  setStatus(msg.str());
  return true;
}

bool Session::startRun() {
  const Course* active = runner_.activeCourse();
  if (!active) {
    setStatus("No course built.");
    return false;
  }
  if (runner_.state() == RunnerState::Running) {
    setStatus("A run is already in progress.");
    return false;
  }
  if (runner_.state() == RunnerState::Finished) {
    // restores markers cleared by the previous run
    Course again = *active;
    runner_.applyCourse(std::move(again));
  }
  if (!runner_.start()) {
    setStatus("Could not start playback. Check the audio device.");
    return false;
  }
  resetScore();
  setStatus("Running...");
  return true;
}

void Session::clearCourse() {
  runner_.clearCourse();
  resetScore();
  setStatus("Course cleared.");
}

void Session::update(double dt) {
  runner_.update(dt);
  if (runner_.courseMode() == CourseMode::Rail && runner_.state() == RunnerState::Running)
    resolveRailMisses();
}

ActionResult Session::handleAction(Side side) {
  if (runner_.courseMode() != CourseMode::Rail) return ActionResult::Ignored;
  if (runner_.state() != RunnerState::Running) return ActionResult::Ignored;

  const double now = runner_.currentAudioTime();
  const Behaviour wanted = side == Side::Left ? Behaviour::RailLeft : Behaviour::RailRight;

  std::vector<const NotePlacement*> candidates;
  for (const NotePlacement* p : runner_.getActivePlacements(settings_.hitWindow)) {
    if (p->behaviour != wanted) continue;
    if (score_.hitNotes.count(p->index) || score_.missedNotes.count(p->index)) continue;
    candidates.push_back(p);
  }
  std::stable_sort(candidates.begin(), candidates.end(),
    [now](const NotePlacement* a, const NotePlacement* b){
      return std::abs(a->note.time - now) < std::abs(b->note.time - now);
    });

  if (candidates.empty()) {
    score_.combo = 0;
    return ActionResult::Whiff;
  }

  const NotePlacement* target = candidates.front();
  score_.hitNotes.insert(target->index);
  score_.combo += 1;
  score_.bestCombo = std::max(score_.bestCombo, score_.combo);
  clearCell(target->cell);
  advanceRailPointer();
  return ActionResult::Hit;
}

void Session::resolveRailMisses() {
  const Course* course = runner_.activeCourse();
  if (!course) return;

  const auto& placements = course->placements;
  const double now = runner_.currentAudioTime();

  while (score_.nextRailIndex < placements.size()) {
    const NotePlacement& p = placements[score_.nextRailIndex];
    if (!isRailBehaviour(p.behaviour) ||
        score_.hitNotes.count(p.index) || score_.missedNotes.count(p.index)) {
      ++score_.nextRailIndex;
      continue;
    }
    // still inside its window: later notes cannot have expired before it
    if (p.note.time + settings_.hitWindow >= now) break;

    score_.missedNotes.insert(p.index);
    score_.combo = 0;
    clearCell(p.cell);
    ++score_.nextRailIndex;
  }
}

void Session::advanceRailPointer() {
  const Course* course = runner_.activeCourse();
  if (!course) return;

  const auto& placements = course->placements;
  while (score_.nextRailIndex < placements.size()) {
    const NotePlacement& p = placements[score_.nextRailIndex];
    if (isRailBehaviour(p.behaviour) &&
        !score_.hitNotes.count(p.index) && !score_.missedNotes.count(p.index))
      break;
    ++score_.nextRailIndex;
  }
}

std::string Session::scoreLine() const {
  std::ostringstream line;
  line << "Combo: " << score_.combo << " / Best: " << score_.bestCombo
       << " | Hit: " << score_.hitNotes.size() << " | Miss: " << score_.missedNotes.size();
  return line.str();
}

void Session::resetScore() {
  score_.hitNotes.clear();
  score_.missedNotes.clear();
  score_.combo = 0;
  score_.nextRailIndex = 0;
}

void Session::clearCell(const Coords3& cell) {
  world_.writeCells({CellWrite{cell, world_.clearMaterial()}});
}

void Session::setStatus(std::string s) {
  status_ = std::move(s);
  std::cout << "Session: " << status_ << "\n";
}
