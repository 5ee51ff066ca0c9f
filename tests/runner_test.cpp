#include "../src/runner.hpp"
#include "../src/sandbox.hpp"
#include "test_helpers.hpp"
#include <cassert>
#include <limits>
#include <vector>

static Course buildCourse(const MemoryWorld& world, const Chart& chart, CourseMode mode,
                          Coords3 base = Coords3{0, 5, 0}) {
  BuilderOptions o;
  o.baseCell = base;
  o.moveSpeed = 6.0;
  o.jumpHeight = 1.6;
  return CourseBuilder(world, o).build(chart, mode);
}

int main() {
  // state machine and preconditions
  {
    MemoryWorld world; registerMaterials(world);
    KinematicAvatar avatar;
    FakeAudio audio;
    ManualClock clock;
    Runner r(world, avatar, RunnerTiming{}, clock.fn());

    assert(r.state() == RunnerState::Idle);
    assert(!r.start());
    assert(!r.courseMode());

    Course c = buildCourse(world, makeChart({{2.0, 0}}), CourseMode::Platform);
    size_t cells = c.writes.size();
    r.applyCourse(c);
    assert(r.state() == RunnerState::Ready);
    assert(r.courseMode() == CourseMode::Platform);
    assert(world.solidCount() == cells);

    assert(!r.start()); // no audio attached
    assert(r.state() == RunnerState::Ready);

    r.setAudio(&audio);
    audio.time = 7.0;
    assert(r.start());
    assert(r.state() == RunnerState::Running);
    assert(audio.seeks == 1 && audio.time == 0.0);
    assert(audio.playing);
    assert(avatar.movementResets == 1);
    assert(near(avatar.position.z, 0.5));
    assert(near(avatar.position.x, 0.5));
    assert(near(avatar.target.z, 5.5));
    assert(!r.start()); // already running

    r.stop();
    assert(r.state() == RunnerState::Ready);
    assert(!audio.playing);

    r.clearCourse();
    assert(r.state() == RunnerState::Idle);
    assert(world.solidCount() == 0);
    r.stop();
    assert(r.state() == RunnerState::Idle);
  }

  // update is a no-op unless running
  {
    MemoryWorld world; registerMaterials(world);
    KinematicAvatar avatar;
    FakeAudio audio;
    Runner r(world, avatar);
    r.setAudio(&audio);
    r.applyCourse(buildCourse(world, makeChart({{2.0, 0}}), CourseMode::Platform));
    audio.time = 1.0;
    r.update(0.016);
    assert(r.currentAudioTime() == 0.0);
    assert(r.state() == RunnerState::Ready);
  }

  // avatar follows the clock; hop arc peaks half a window away from a jump note
  {
    MemoryWorld world; registerMaterials(world);
    KinematicAvatar avatar(1.8);
    FakeAudio audio;
    ManualClock clock;
    Runner r(world, avatar, RunnerTiming{}, clock.fn());
    r.setAudio(&audio);
    r.applyCourse(buildCourse(world, makeChart({{2.0, 0}, {5.0, 1, 6.0}}), CourseMode::Platform));
    assert(r.start());

    audio.time = 1.0;
    r.update(0.016);
    assert(near(avatar.position.z, 0.5 + 6.0));
    assert(near(avatar.position.y, 6.0 + 0.9));

    audio.time = 2.0 - 0.175;
    r.update(0.016);
    assert(near(avatar.position.y, 6.0 + 1.6 + 0.9, 1e-6));

    audio.time = 2.0 + 0.1;
    r.update(0.016);
    double expected = 6.0 + std::sin(3.14159265358979323846 * (1.0 - 0.1 / 0.35)) * 1.6 + 0.9;
    assert(near(avatar.position.y, expected, 1e-6));
    assert(avatar.velocity.x == 0.0 && avatar.velocity.y == 0.0 && avatar.velocity.z == 0.0);

    // long notes do not hop
    audio.time = 5.5;
    r.update(0.016);
    assert(near(avatar.position.y, 6.9));
  }

  // rail: feet ride two rows above the base, no arcs
  {
    MemoryWorld world; registerMaterials(world);
    KinematicAvatar avatar(2.0);
    FakeAudio audio;
    Runner r(world, avatar);
    r.setAudio(&audio);
    r.applyCourse(buildCourse(world, makeChart({{1.0, 0}}), CourseMode::Rail));
    assert(r.start());
    audio.time = 1.0;
    r.update(0.016);
    assert(near(avatar.position.y, 7.0 + 1.0));
  }

  // backward jumps never rewind the reported time; the wall clock is re-anchored
  {
    MemoryWorld world; registerMaterials(world);
    KinematicAvatar avatar;
    FakeAudio audio;
    ManualClock clock;
    Runner r(world, avatar, RunnerTiming{}, clock.fn());
    r.setAudio(&audio);
    r.applyCourse(buildCourse(world, makeChart({{10.0, 0}}), CourseMode::Platform));
    assert(r.start());

    std::vector<double> samples = {0.5, 1.0, 1.5, 2.0, 1.2, 2.1};
    double last = r.currentAudioTime();
    for (double s : samples) {
      audio.time = s;
      r.update(0.016);
      assert(r.currentAudioTime() + 1e-3 >= last);
      last = r.currentAudioTime();
    }
    assert(near(r.currentAudioTime(), 2.1));

    // jitter below the epsilon is taken as is
    audio.time = 2.0995;
    r.update(0.016);
    assert(near(r.currentAudioTime(), 2.0995));

    // device loses its position after a seek back: fallback continues from the re-anchor
    audio.time = 1.0;
    r.update(0.016);
    assert(near(r.currentAudioTime(), 2.0995));
    audio.time = std::numeric_limits<double>::quiet_NaN();
    clock.now += 0.5;
    r.update(0.016);
    assert(near(r.currentAudioTime(), 2.0995)); // 1.5 < held time
    clock.now += 1.0;
    r.update(0.016);
    assert(near(r.currentAudioTime(), 2.5));
  }

  // refused playback: the run still starts and follows the wall clock
  {
    MemoryWorld world; registerMaterials(world);
    KinematicAvatar avatar;
    FakeAudio audio;
    audio.playAccepted = false;
    audio.seekAccepted = false;
    ManualClock clock;
    Runner r(world, avatar, RunnerTiming{}, clock.fn());
    r.setAudio(&audio);
    r.applyCourse(buildCourse(world, makeChart({{3.0, 0}}), CourseMode::Platform));
    audio.time = 9.0;
    assert(r.start());
    assert(r.state() == RunnerState::Running);
    clock.now += 0.75;
    r.update(0.016);
    assert(near(r.currentAudioTime(), 0.75));
    assert(near(avatar.position.z, 0.5 + 0.75 * 6.0));
  }

  // finish fires once per run, callbacks in registration order
  {
    MemoryWorld world; registerMaterials(world);
    KinematicAvatar avatar;
    FakeAudio audio;
    Runner r(world, avatar);
    r.setAudio(&audio);
    std::vector<int> calls;
    r.onFinish([&]{ calls.push_back(1); });
    r.onFinish([&]{ calls.push_back(2); });
    r.applyCourse(buildCourse(world, makeChart({{1.0, 0}}), CourseMode::Platform));
    assert(r.start());

    audio.time = 3.4;
    r.update(0.016);
    assert(calls.empty());
    audio.time = 3.6;
    for (int i = 0; i < 5; ++i) r.update(0.016);
    assert(r.state() == RunnerState::Finished);
    assert(calls == (std::vector<int>{1, 2}));
    assert(!audio.playing);
    // position clamped at duration + padding
    assert(near(avatar.position.z, 0.5 + 3.5 * 6.0));

    r.stop();
    assert(r.state() == RunnerState::Finished);
    assert(!r.start());

    // a fresh apply allows another run, which finishes once more
    Course again = *r.activeCourse();
    r.applyCourse(again);
    assert(r.state() == RunnerState::Ready);
    assert(r.start());
    audio.time = 4.0;
    r.update(0.016);
    r.update(0.016);
    assert(calls.size() == 4);

    r.clearCourse();
    assert(r.state() == RunnerState::Idle);
  }

  // active placements are those within the window of the current time
  {
    MemoryWorld world; registerMaterials(world);
    KinematicAvatar avatar;
    FakeAudio audio;
    Runner r(world, avatar);
    assert(r.getActivePlacements().empty());
    r.setAudio(&audio);
    r.applyCourse(buildCourse(world, makeChart({{1.0, 0}, {1.25, 1}, {2.0, 2}}), CourseMode::Rail));
    assert(r.start());
    audio.time = 1.1;
    r.update(0.016);
    auto active = r.getActivePlacements();
    assert(active.size() == 2);
    assert(active[0]->index == 0 && active[1]->index == 1);
    assert(r.getActivePlacements(0.12).size() == 1);
  }

  // applying a second course fully reverts the first before writing
  {
    MemoryWorld world; registerMaterials(world);
    KinematicAvatar avatar;
    Runner r(world, avatar);
    Course a = buildCourse(world, makeChart({{1.0, 0}, {2.0, 1, 3.0}, {5.0, 2}}), CourseMode::Platform);
    Course b = buildCourse(world, makeChart({{1.0, 0}}), CourseMode::Rail, Coords3{20, 8, 4});
    r.applyCourse(a);
    assert(world.batches() == 1);
    r.applyCourse(b);
    assert(world.batches() == 3); // clear, then write
    assert(world.solidCount() == b.writes.size());
    for (const auto& w : a.writes) assert(world.at(w.cell) == world.clearMaterial());
    for (const auto& w : b.writes) assert(world.at(w.cell) == w.material);

    // clearing is idempotent
    r.clearCourse();
    size_t batches = world.batches();
    r.clearCourse();
    r.clearCourse();
    assert(world.batches() == batches);
    assert(world.solidCount() == 0);
    assert(r.state() == RunnerState::Idle);
  }
  return 0;
}
