#pragma once
#include <functional>
#include <optional>
#include <vector>
#include "course.hpp"
#include "world.hpp"

enum class RunnerState { Idle, Ready, Running, Finished };

const char* runnerStateName(RunnerState s);

struct RunnerTiming {
  double endPadding = 2.5;  // seconds after the last note before finishing
  double jumpWindow = 0.35; // half-width of the hop arc around a jump note
  double epsilon = 1e-3;    // backward jumps below this are treated as jitter
  double lookAhead = 5.0;   // look-at target distance along +z
};

// Seconds from an arbitrary monotonic origin.
using WallClock = std::function<double()>;
WallClock steadyWallClock();

class Runner {
public:
  Runner(VoxelWorld& world, AvatarBody& avatar, RunnerTiming timing = {},
         WallClock wallClock = steadyWallClock());

  RunnerState state() const { return state_; }
  double currentAudioTime() const { return lastAudioTime_; }
  std::optional<CourseMode> courseMode() const;
  const Course* activeCourse() const { return course_ ? &*course_ : nullptr; }
  const RunnerTiming& timing() const { return timing_; }

  // Not owned; null detaches.
  void setAudio(AudioClock* audio) { audio_ = audio; }
  void onFinish(std::function<void()> cb) { finishCallbacks_.push_back(std::move(cb)); }

  void applyCourse(Course course);
  void clearCourse();
  bool start();
  void stop();
  void update(double dt);

  std::vector<const NotePlacement*> getActivePlacements(double window = 0.2) const;

  void resetPlayerPosition(double time);

private:
  double readTime() const;
  void finish();

  VoxelWorld& world_;
  AvatarBody& avatar_;
  RunnerTiming timing_;
  WallClock wallClock_;
  AudioClock* audio_ = nullptr;

  RunnerState state_ = RunnerState::Idle;
  std::optional<Course> course_;
  std::vector<CellWrite> staged_;
  double startTimestamp_ = 0.0;
  double lastAudioTime_ = 0.0;
  bool audioStarted_ = false;
  std::vector<std::function<void()>> finishCallbacks_;
};
