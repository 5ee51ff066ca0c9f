#include "course.hpp"
#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <unordered_map>
#include <utility>

const char* courseModeName(CourseMode m) {
  return m == CourseMode::Rail ? "rail" : "platform";
}

// half-way cases go toward +inf on both sides of zero
static int roundHalfUp(double v) {
  return (int)std::floor(v + 0.5);
}

int toCell(double continuous) {
  return roundHalfUp(continuous - 0.5);
}

std::optional<Coords3> baseCellAhead(const Vec3& feet) {
  constexpr double kLimit = 1e8;
  for (double v : {feet.x, feet.y, feet.z})
    if (!std::isfinite(v) || std::abs(v) > kLimit) return std::nullopt;
  const int vx = (int)std::floor(feet.x);
  const int vy = (int)std::floor(feet.y);
  const int vz = (int)std::floor(feet.z);
  return Coords3{vx + 3, std::max(5, vy + 5), vz + 5};
}

std::vector<CellWrite> dedupeWrites(const std::vector<CellWrite>& writes) {
  std::vector<CellWrite> out;
  out.reserve(writes.size());
  std::unordered_map<Coords3, size_t, Coords3Hash> slot;
  for (const auto& w : writes) {
    auto it = slot.find(w.cell);
    if (it == slot.end()) {
      slot.emplace(w.cell, out.size());
      out.push_back(w);
    } else {
      out[it->second].material = w.material;
    }
  }
  return out;
}

static int resolveOrThrow(const VoxelWorld& world, const std::string& name) {
  auto id = world.resolveMaterial(name);
  if (!id) throw MissingMaterialError(name);
  return *id;
}

CourseBuilder::CourseBuilder(const VoxelWorld& world, BuilderOptions options)
  : opts_(std::move(options)) {
  origin_ = Vec3{opts_.baseCell.x + 0.5, opts_.baseCell.y + 0.5, opts_.baseCell.z + 0.5};
  platformId_  = resolveOrThrow(world, opts_.materials.platform);
  jumpId_      = resolveOrThrow(world, opts_.materials.jump);
  railLeftId_  = resolveOrThrow(world, opts_.materials.railLeft);
  railRightId_ = resolveOrThrow(world, opts_.materials.railRight);
  railTrackId_ = resolveOrThrow(world, opts_.materials.railTrack);
}

Course CourseBuilder::build(const Chart& chart, CourseMode mode) const {
  return mode == CourseMode::Rail ? buildRailCourse(chart) : buildPlatformCourse(chart);
}

Course CourseBuilder::makeCourse(CourseMode mode, const Chart& chart) const {
  Course c;
  c.mode = mode;
  c.origin = origin_;
  c.baseCell = opts_.baseCell;
  c.moveSpeed = opts_.moveSpeed;
  c.laneSpacing = opts_.laneSpacing;
  c.duration = chart.totalDuration;
  c.placements.reserve(chart.notes.size());
  return c;
}

Course CourseBuilder::buildPlatformCourse(const Chart& chart) const {
  Course c = makeCourse(CourseMode::Platform, chart);
  std::vector<CellWrite> writes;

  const int bx = opts_.baseCell.x;
  const int by = opts_.baseCell.y;
  // feet rest on top of the platform row
  const double feetY = by + 1;
  c.restFeetY = feetY;

  for (size_t i = 0; i < chart.notes.size(); ++i) {
    const RhythmNote& note = chart.notes[i];
    double startZ = origin_.z + note.time * opts_.moveSpeed;
    double endZ = origin_.z + note.endTime * opts_.moveSpeed;
    int zs = toCell(startZ);
    int ze = toCell(endZ);
    bool isShort = note.kind == NoteKind::Short;

    if (isShort) {
      writes.push_back({Coords3{bx, by + 1, zs}, jumpId_});
      writes.push_back({Coords3{bx, by, zs}, platformId_});
    } else {
      for (int z = std::min(zs, ze); z <= std::max(zs, ze); ++z)
        writes.push_back({Coords3{bx, by, z}, platformId_});
    }

    NotePlacement p{};
    p.index = (int)i;
    p.note = note;
    p.laneIndex = note.lane;
    p.laneX = origin_.x;
    p.startZ = startZ;
    p.endZ = endZ;
    p.contactFeetY = feetY;
    p.jumpHeight = isShort ? opts_.jumpHeight : 0.0;
    p.behaviour = isShort ? Behaviour::Jump : Behaviour::Run;
    p.cell = Coords3{bx, isShort ? by + 1 : by, zs};
    c.placements.push_back(p);

    // bridge long voids one row below so the run never faces an open drop
    if (i + 1 < chart.notes.size()) {
      double nextStartZ = origin_.z + chart.notes[i + 1].time * opts_.moveSpeed;
      double gap = nextStartZ - endZ;
      if (gap > opts_.gapThreshold) {
        int fillers = (int)std::floor(gap - opts_.fillerInset);
        for (int k = 1; k <= fillers; ++k)
          writes.push_back({Coords3{bx, by - 1, toCell(endZ + k)}, platformId_});
      }
    }
  }

  c.writes = dedupeWrites(writes);
  return c;
}

Course CourseBuilder::buildRailCourse(const Chart& chart) const {
  Course c = makeCourse(CourseMode::Rail, chart);
  std::vector<CellWrite> writes;

  const int bx = opts_.baseCell.x;
  const int railY = opts_.baseCell.y;
  const double contactFeetY = railY + 2;
  c.restFeetY = contactFeetY;

  const double leftX = origin_.x - opts_.laneSpacing;
  const double rightX = origin_.x + opts_.laneSpacing;
  const int leftCellX = toCell(leftX);
  const int rightCellX = toCell(rightX);

  const double totalLength = chart.totalDuration * opts_.moveSpeed + opts_.railMargin;
  const int trackStart = toCell(origin_.z);
  const int trackEnd = toCell(origin_.z + totalLength);
  for (int z = trackStart; z <= trackEnd; ++z)
    writes.push_back({Coords3{bx, railY, z}, railTrackId_});

  for (size_t i = 0; i < chart.notes.size(); ++i) {
    const RhythmNote& note = chart.notes[i];
    double noteZ = origin_.z + note.time * opts_.moveSpeed;
    int cellZ = toCell(noteZ);
    bool left = note.lane < chart.keyCount / 2.0;
    int cellX = left ? leftCellX : rightCellX;

    writes.push_back({Coords3{cellX, railY + 1, cellZ}, left ? railLeftId_ : railRightId_});

    NotePlacement p{};
    p.index = (int)i;
    p.note = note;
    p.laneIndex = note.lane;
    p.laneX = left ? leftX : rightX;
    p.startZ = noteZ;
    p.endZ = noteZ;
    p.contactFeetY = contactFeetY;
    p.jumpHeight = 0.0;
    p.behaviour = left ? Behaviour::RailLeft : Behaviour::RailRight;
    p.cell = Coords3{cellX, railY + 1, cellZ};
    c.placements.push_back(p);
  }

  c.writes = dedupeWrites(writes);
  return c;
}
