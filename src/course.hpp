#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "chart.hpp"
#include "world.hpp"

enum class CourseMode { Platform, Rail };
enum class Behaviour { Jump, Run, RailLeft, RailRight };

const char* courseModeName(CourseMode m);

struct NotePlacement {
  int        index = 0;       // position in chart.notes
  RhythmNote note;
  int        laneIndex = 0;
  double     laneX = 0.0;
  double     startZ = 0.0;
  double     endZ = 0.0;
  double     contactFeetY = 0.0; // feet height when touching the surface
  double     jumpHeight = 0.0;   // arc apex offset, jump placements only
  Behaviour  behaviour = Behaviour::Run;
  Coords3    cell;               // highlighted / removed for this note
};

inline bool isRailBehaviour(Behaviour b) {
  return b == Behaviour::RailLeft || b == Behaviour::RailRight;
}

struct Course {
  CourseMode mode = CourseMode::Platform;
  Vec3       origin;
  Coords3    baseCell;
  double     moveSpeed = 6.0;
  double     laneSpacing = 2.0;
  double     restFeetY = 0.0;
  std::vector<NotePlacement> placements; // ascending by note time
  std::vector<CellWrite>     writes;     // one entry per coordinate
  double     duration = 0.0;
};

struct MaterialNames {
  std::string platform  = "White Concrete";
  std::string jump      = "Yellow Concrete";
  std::string railLeft  = "Blue Concrete";
  std::string railRight = "Red Concrete";
  std::string railTrack = "Black Concrete";
};

struct BuilderOptions {
  Coords3 baseCell;
  double moveSpeed = 6.0;     // world units per second along +z
  double laneSpacing = 2.0;   // rail offset from the centre lane
  double jumpHeight = 1.25;   // apex of the hop over a short note
  double gapThreshold = 1.2;  // longer voids between notes get filler cells
  double fillerInset = 0.5;   // filler count = floor(gap - fillerInset)
  double railMargin = 10.0;   // track extends this far past the last note
  MaterialNames materials;
};

class MissingMaterialError : public std::runtime_error {
public:
  explicit MissingMaterialError(const std::string& name)
    : std::runtime_error("CourseBuilder: missing material '" + name + "' in world"), material_(name) {}
  const std::string& material() const { return material_; }
private:
  std::string material_;
};

// Continuous coordinate -> cell index, centering a unit cell under the position.
int toCell(double continuous);

// Base cell for a course placed ahead of a player standing at `feet`: three cells
// right, five ahead and five up, never below y = 5. nullopt for positions that do
// not fit a cell index.
std::optional<Coords3> baseCellAhead(const Vec3& feet);

// Keeps the first position of every coordinate with the value of its last write.
std::vector<CellWrite> dedupeWrites(const std::vector<CellWrite>& writes);

class CourseBuilder {
public:
  // Throws MissingMaterialError when any material name cannot be resolved.
  CourseBuilder(const VoxelWorld& world, BuilderOptions options);

  Course build(const Chart& chart, CourseMode mode) const;
  Course buildPlatformCourse(const Chart& chart) const;
  Course buildRailCourse(const Chart& chart) const;

  const BuilderOptions& options() const { return opts_; }

private:
  Course makeCourse(CourseMode mode, const Chart& chart) const;

  BuilderOptions opts_;
  Vec3 origin_;
  int platformId_ = 0;
  int jumpId_ = 0;
  int railLeftId_ = 0;
  int railRightId_ = 0;
  int railTrackId_ = 0;
};
