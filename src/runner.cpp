#include "runner.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>

static constexpr double kPi = 3.14159265358979323846;

const char* runnerStateName(RunnerState s) {
  switch (s) {
    case RunnerState::Idle:     return "idle";
    case RunnerState::Ready:    return "ready";
    case RunnerState::Running:  return "running";
    case RunnerState::Finished: return "finished";
  }
  return "?";
}

WallClock steadyWallClock() {
  return []{
    using namespace std::chrono;
    return duration<double>(steady_clock::now().time_since_epoch()).count();
  };
}

Runner::Runner(VoxelWorld& world, AvatarBody& avatar, RunnerTiming timing, WallClock wallClock)
  : world_(world), avatar_(avatar), timing_(timing), wallClock_(std::move(wallClock)) {}

std::optional<CourseMode> Runner::courseMode() const {
  if (!course_) return std::nullopt;
  return course_->mode;
}

void Runner::applyCourse(Course course) {
  clearCourse();
  course_ = std::move(course);
  staged_ = dedupeWrites(course_->writes);
  if (!staged_.empty()) world_.writeCells(staged_);
  state_ = RunnerState::Ready;
}

void Runner::clearCourse() {
  if (!staged_.empty()) {
    std::vector<CellWrite> removals;
    removals.reserve(staged_.size());
    const int air = world_.clearMaterial();
    for (const auto& w : staged_) removals.push_back({w.cell, air});
    world_.writeCells(removals);
  }
  staged_.clear();
  course_.reset();
  stop();
  state_ = RunnerState::Idle;
}

bool Runner::start() {
  if (!course_ || !audio_) return false;
  if (state_ != RunnerState::Ready) return false;

  resetPlayerPosition(0.0);
  avatar_.resetMovements();

  if (!audio_->seek(0.0))
    std::cerr << "Runner: audio seek to 0 failed, continuing from current position\n";

  startTimestamp_ = wallClock_();
  lastAudioTime_ = 0.0;
  audioStarted_ = audio_->play();
  if (!audioStarted_)
    std::cerr << "Runner: audio playback refused, timing falls back to wall clock\n";

  state_ = RunnerState::Running;
  return true;
}

void Runner::stop() {
  if (audio_ && !audio_->paused()) audio_->pause();
  audioStarted_ = false;
  if (state_ != RunnerState::Finished)
    state_ = course_ ? RunnerState::Ready : RunnerState::Idle;
}

double Runner::readTime() const {
  if (audio_ && audioStarted_ && !audio_->paused()) {
    double t = audio_->currentTime();
    if (std::isfinite(t)) return t;
  }
  return wallClock_() - startTimestamp_;
}

void Runner::update(double) {
  if (state_ != RunnerState::Running || !course_) return;

  double audioTime = readTime();
  if (audioTime + timing_.epsilon < lastAudioTime_) {
    // seek-back or driver jitter: re-anchor the fallback clock and hold position
    startTimestamp_ = wallClock_() - audioTime;
    audioTime = lastAudioTime_;
  }
  lastAudioTime_ = audioTime;

  const double courseDuration = course_->duration + timing_.endPadding;
  const double clamped = std::clamp(audioTime, 0.0, courseDuration);

  resetPlayerPosition(clamped);

  if (clamped + timing_.epsilon >= courseDuration) finish();
}

std::vector<const NotePlacement*> Runner::getActivePlacements(double window) const {
  std::vector<const NotePlacement*> active;
  if (!course_) return active;
  for (const auto& p : course_->placements) {
    if (std::abs(p.note.time - lastAudioTime_) <= window) active.push_back(&p);
  }
  return active;
}

void Runner::finish() {
  if (state_ != RunnerState::Running) return;
  stop();
  state_ = RunnerState::Finished;
  // callbacks may register more callbacks; those wait for the next run
  const size_t n = finishCallbacks_.size();
  for (size_t i = 0; i < n; ++i) finishCallbacks_[i]();
}

void Runner::resetPlayerPosition(double time) {
  if (!course_) return;
  const Course& c = *course_;

  double feetY = c.restFeetY;
  const double z = c.origin.z + time * c.moveSpeed;
  const double x = c.origin.x;

  if (c.mode == CourseMode::Platform) {
    for (const auto& p : c.placements) {
      if (p.behaviour != Behaviour::Jump) continue;
      double diff = std::abs(time - p.note.time);
      if (diff > timing_.jumpWindow) continue;
      double t = 1.0 - diff / timing_.jumpWindow;
      feetY = std::max(feetY, p.contactFeetY + std::sin(t * kPi) * p.jumpHeight);
    }
  }

  const double centerY = feetY + avatar_.bodyHeight() / 2.0;
  avatar_.setPosition(Vec3{x, centerY, z});
  avatar_.zeroMotion();
  avatar_.lookAt(Vec3{x, centerY, z + timing_.lookAhead});
}
