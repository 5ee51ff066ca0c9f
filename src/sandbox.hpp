#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include "course.hpp"
#include "world.hpp"

// Sparse in-memory voxel grid with a name -> id material registry. Id 0 is air.
class MemoryWorld : public VoxelWorld {
public:
  MemoryWorld();

  // Returns the id of `name`, registering it if needed.
  int registerMaterial(const std::string& name);
  const std::string& materialName(int id) const;

  std::optional<int> resolveMaterial(std::string_view name) const override;
  void writeCells(const std::vector<CellWrite>& writes) override;
  int clearMaterial() const override { return 0; }

  int at(const Coords3& c) const;
  size_t solidCount() const { return cells_.size(); }
  const std::unordered_map<Coords3, int, Coords3Hash>& cells() const { return cells_; }
  // number of writeCells calls so far
  size_t batches() const { return batches_; }

private:
  std::vector<std::string> names_;
  std::unordered_map<std::string, int> ids_;
  std::unordered_map<Coords3, int, Coords3Hash> cells_;
  size_t batches_ = 0;
};

// Registers the five materials a course palette needs.
void registerMaterials(MemoryWorld& world, const MaterialNames& names = {});

// Scripted body: position is set directly each frame, nothing integrates.
class KinematicAvatar : public AvatarBody {
public:
  explicit KinematicAvatar(double height = 1.8) : height_(height) {}

  void setPosition(const Vec3& p) override { position = p; }
  void lookAt(const Vec3& t) override { target = t; }
  void zeroMotion() override { velocity = forces = impulses = Vec3{}; resting = false; }
  void resetMovements() override { jumpQueued = false; movementResets++; }
  double bodyHeight() const override { return height_; }

  Vec3 position;
  Vec3 target;
  Vec3 velocity;
  Vec3 forces;
  Vec3 impulses;
  bool resting = false;
  bool jumpQueued = false;
  int  movementResets = 0;

private:
  double height_;
};
