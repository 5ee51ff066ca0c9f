#include "../src/course.hpp"
#include "../src/sandbox.hpp"
#include "test_helpers.hpp"
#include <cassert>
#include <cmath>
#include <set>
#include <tuple>

static BuilderOptions platformOptions() {
  BuilderOptions o;
  o.baseCell = Coords3{0, 5, 0};
  o.moveSpeed = 6.0;
  o.jumpHeight = 1.6;
  return o;
}

static size_t countAt(const Course& c, int y) {
  size_t n = 0;
  for (const auto& w : c.writes) if (w.cell.y == y) ++n;
  return n;
}

static bool uniqueCells(const Course& c) {
  std::set<std::tuple<int,int,int>> seen;
  for (const auto& w : c.writes)
    if (!seen.insert({w.cell.x, w.cell.y, w.cell.z}).second) return false;
  return true;
}

int main() {
  MemoryWorld world;
  registerMaterials(world);
  const int platformId = *world.resolveMaterial("White Concrete");
  const int jumpId = *world.resolveMaterial("Yellow Concrete");
  const int leftId = *world.resolveMaterial("Blue Concrete");
  const int rightId = *world.resolveMaterial("Red Concrete");
  const int trackId = *world.resolveMaterial("Black Concrete");

  // single short note at 2.0s: marker over platform at round(origin.z + 12 - 0.5)
  {
    CourseBuilder b(world, platformOptions());
    Course c = b.buildPlatformCourse(makeChart({{2.0, 0}}));
    assert(c.mode == CourseMode::Platform);
    assert(near(c.origin.z, 0.5));
    assert(c.placements.size() == 1);
    const NotePlacement& p = c.placements[0];
    const int z = toCell(c.origin.z + 12.0);
    assert(z == 12);
    assert(p.behaviour == Behaviour::Jump);
    assert(near(p.contactFeetY, 6.0));
    assert(near(p.jumpHeight, 1.6));
    assert(p.cell == (Coords3{0, 6, z}));
    assert(c.writes.size() == 2);
    assert(c.writes[0].cell == (Coords3{0, 6, z}) && c.writes[0].material == jumpId);
    assert(c.writes[1].cell == (Coords3{0, 5, z}) && c.writes[1].material == platformId);
    assert(near(c.duration, 2.0));
  }

  // gap of 6 units between two short notes -> floor(6 - 0.5) = 5 fillers one row down
  {
    CourseBuilder b(world, platformOptions());
    Course c = b.buildPlatformCourse(makeChart({{0.0, 0}, {1.0, 1}}));
    assert(countAt(c, 4) == 5);
    for (const auto& w : c.writes) {
      if (w.cell.y != 4) continue;
      assert(w.material == platformId);
      assert(w.cell.z > 0 && w.cell.z < 6);
    }
  }

  // gap under the threshold gets no fillers
  {
    CourseBuilder b(world, platformOptions());
    Course c = b.buildPlatformCourse(makeChart({{0.0, 0}, {0.15, 1}}));
    assert(countAt(c, 4) == 0);
  }

  // threshold and inset are tunable
  {
    BuilderOptions o = platformOptions();
    o.gapThreshold = 10.0;
    Course c = CourseBuilder(world, o).buildPlatformCourse(makeChart({{0.0, 0}, {1.0, 1}}));
    assert(countAt(c, 4) == 0);
    o.gapThreshold = 1.2;
    o.fillerInset = 2.5;
    c = CourseBuilder(world, o).buildPlatformCourse(makeChart({{0.0, 0}, {1.0, 1}}));
    assert(countAt(c, 4) == 3);
  }

  // long note: contiguous platform run, no arc
  {
    CourseBuilder b(world, platformOptions());
    Course c = b.buildPlatformCourse(makeChart({{1.0, 2, 2.0}}));
    const NotePlacement& p = c.placements[0];
    assert(p.behaviour == Behaviour::Run);
    assert(p.jumpHeight == 0.0);
    assert(p.cell == (Coords3{0, 5, 6}));
    assert(near(p.startZ, 6.5) && near(p.endZ, 12.5));
    assert(c.writes.size() == 7);
    for (int i = 0; i < 7; ++i) {
      assert(c.writes[i].cell == (Coords3{0, 5, 6 + i}));
      assert(c.writes[i].material == platformId);
    }
  }

  // overlapping writes are collapsed to one per cell
  {
    CourseBuilder b(world, platformOptions());
    Course c = b.buildPlatformCourse(makeChart({{1.0, 0, 2.0}, {2.0, 1}, {2.05, 2}, {4.0, 3, 4.5}}));
    assert(uniqueCells(c));
    // short note on top of the hold's last cell: marker above, platform below
    bool marker = false;
    for (const auto& w : c.writes) if (w.cell == (Coords3{0, 6, 12})) marker = w.material == jumpId;
    assert(marker);
  }

  // dedupe keeps first position and last material
  {
    std::vector<CellWrite> raw = {
      {Coords3{0,0,0}, 1}, {Coords3{0,0,1}, 2}, {Coords3{0,0,0}, 3}, {Coords3{0,0,2}, 4}, {Coords3{0,0,1}, 5},
    };
    auto out = dedupeWrites(raw);
    assert(out.size() == 3);
    assert(out[0].cell == (Coords3{0,0,0}) && out[0].material == 3);
    assert(out[1].cell == (Coords3{0,0,1}) && out[1].material == 5);
    assert(out[2].cell == (Coords3{0,0,2}) && out[2].material == 4);
  }

  // rail: lane < keyCount/2 goes left at origin.x - spacing, otherwise right
  {
    BuilderOptions o;
    o.baseCell = Coords3{0, 5, 0};
    o.moveSpeed = 8.0;
    o.laneSpacing = 3.0;
    CourseBuilder b(world, o);
    Course c = b.buildRailCourse(makeChart({{1.0, 0}, {2.0, 1}, {3.0, 2}, {4.0, 3}}));
    assert(c.mode == CourseMode::Rail);
    assert(c.placements.size() == 4);
    for (const auto& p : c.placements) {
      bool left = p.note.lane < 2;
      assert(p.behaviour == (left ? Behaviour::RailLeft : Behaviour::RailRight));
      assert(near(p.laneX, left ? c.origin.x - 3.0 : c.origin.x + 3.0));
      assert(p.cell.x == (left ? -3 : 3));
      assert(p.cell.y == 6);
      assert(near(p.contactFeetY, 7.0));
      assert(p.jumpHeight == 0.0);
      assert(near(p.startZ, p.endZ));
    }
    // track covers duration * speed + margin: cells 0..42 at the base row
    size_t track = 0;
    for (const auto& w : c.writes) {
      if (w.material == trackId) {
        ++track;
        assert(w.cell.x == 0 && w.cell.y == 5);
      } else {
        assert(w.material == leftId || w.material == rightId);
      }
    }
    assert(track == 43);
    assert(countAt(c, 4) == 0);
    assert(uniqueCells(c));

    // odd key count: the middle lane is below keyCount/2 and goes left
    Course odd = b.buildRailCourse(makeChart({{1.0, 2}}, 5));
    assert(odd.placements[0].behaviour == Behaviour::RailLeft);
  }

  // same chart and options -> same course
  {
    Chart chart = makeChart({{0.5, 0}, {1.0, 1, 1.75}, {3.0, 3}, {3.1, 2}, {6.0, 0}});
    CourseBuilder b(world, platformOptions());
    for (CourseMode mode : {CourseMode::Platform, CourseMode::Rail}) {
      Course a = b.build(chart, mode);
      Course c = b.build(chart, mode);
      assert(a.placements.size() == c.placements.size());
      for (size_t i = 0; i < a.placements.size(); ++i) {
        assert(a.placements[i].index == (int)i);
        assert(a.placements[i].cell == c.placements[i].cell);
        assert(a.placements[i].behaviour == c.placements[i].behaviour);
        assert(a.placements[i].startZ == c.placements[i].startZ);
      }
      assert(a.writes.size() == c.writes.size());
      for (size_t i = 0; i < a.writes.size(); ++i) {
        assert(a.writes[i].cell == c.writes[i].cell);
        assert(a.writes[i].material == c.writes[i].material);
      }
    }
  }

  // empty chart: no placements, rail still gets its margin of track
  {
    CourseBuilder b(world, platformOptions());
    Chart none = makeChart({});
    assert(b.buildPlatformCourse(none).writes.empty());
    assert(b.buildRailCourse(none).writes.size() == 11);
  }

  // unresolved material aborts construction
  {
    MemoryWorld partial;
    partial.registerMaterial("White Concrete");
    partial.registerMaterial("Yellow Concrete");
    partial.registerMaterial("Blue Concrete");
    bool threw = false;
    try {
      CourseBuilder b(partial, platformOptions());
    } catch (const MissingMaterialError& e) {
      threw = true;
      assert(e.material() == "Red Concrete");
    }
    assert(threw);
  }

  // courses placed ahead of the player
  assert(baseCellAhead(Vec3{0.5, 0.0, 0.5}) == (Coords3{3, 5, 5}));
  assert(baseCellAhead(Vec3{10.2, 7.0, -3.5}) == (Coords3{13, 12, 1}));
  assert(baseCellAhead(Vec3{-2.5, -10.0, 0.0}) == (Coords3{0, 5, 5}));
  assert(!baseCellAhead(Vec3{std::nan(""), 0.0, 0.0}));
  assert(!baseCellAhead(Vec3{0.0, 0.0, 1e12}));

  assert(toCell(-0.5) == -1);
  assert(toCell(0.0) == 0);
  assert(toCell(0.99) == 0);
  assert(toCell(1.0) == 1);
  return 0;
}
