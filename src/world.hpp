#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

// Interfaces of the collaborators the engine drives: the voxel grid, the player body
// and the audio device. Implementations live outside the core (see sandbox.hpp and
// click_track.hpp for the ones shipped with the front-end).

struct Vec3 {
  double x = 0.0, y = 0.0, z = 0.0;
};

struct Coords3 {
  int x = 0, y = 0, z = 0;
  bool operator==(const Coords3& o) const { return x == o.x && y == o.y && z == o.z; }
  bool operator!=(const Coords3& o) const { return !(*this == o); }
};

struct Coords3Hash {
  size_t operator()(const Coords3& c) const {
    size_t h = std::hash<int>{}(c.x);
    h ^= std::hash<int>{}(c.y) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<int>{}(c.z) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
  }
};

struct CellWrite {
  Coords3 cell;
  int material = 0;
};

class VoxelWorld {
public:
  virtual ~VoxelWorld() = default;
  virtual std::optional<int> resolveMaterial(std::string_view name) const = 0;
  // Batch write; entries are unique per coordinate.
  virtual void writeCells(const std::vector<CellWrite>& writes) = 0;
  // Material id that represents empty space.
  virtual int clearMaterial() const = 0;
};

class AvatarBody {
public:
  virtual ~AvatarBody() = default;
  virtual void setPosition(const Vec3& p) = 0;
  virtual void lookAt(const Vec3& target) = 0;
  // velocity, forces, impulses and resting contacts
  virtual void zeroMotion() = 0;
  // input-driven movement state (held keys, pending jumps)
  virtual void resetMovements() = 0;
  virtual double bodyHeight() const = 0;
};

class AudioClock {
public:
  virtual ~AudioClock() = default;
  // Playback position in seconds; NaN when the device cannot report one.
  virtual double currentTime() const = 0;
  virtual bool seek(double seconds) = 0;
  // Requests playback. false means the device refused; callers keep going.
  virtual bool play() = 0;
  virtual void pause() = 0;
  virtual bool paused() const = 0;
};
