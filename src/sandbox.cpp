#include "sandbox.hpp"
#include <initializer_list>
#include <stdexcept>

MemoryWorld::MemoryWorld() {
  names_.push_back("Air");
  ids_.emplace("Air", 0);
}

int MemoryWorld::registerMaterial(const std::string& name) {
  auto it = ids_.find(name);
  if (it != ids_.end()) return it->second;
  int id = (int)names_.size();
  names_.push_back(name);
  ids_.emplace(name, id);
  return id;
}

const std::string& MemoryWorld::materialName(int id) const {
  if (id < 0 || id >= (int)names_.size()) throw std::out_of_range("MemoryWorld: unknown material id");
  return names_[id];
}

std::optional<int> MemoryWorld::resolveMaterial(std::string_view name) const {
  auto it = ids_.find(std::string(name));
  if (it == ids_.end()) return std::nullopt;
  return it->second;
}

void MemoryWorld::writeCells(const std::vector<CellWrite>& writes) {
  ++batches_;
  for (const auto& w : writes) {
    if (w.material == clearMaterial()) cells_.erase(w.cell);
    else cells_[w.cell] = w.material;
  }
}

int MemoryWorld::at(const Coords3& c) const {
  auto it = cells_.find(c);
  return it == cells_.end() ? clearMaterial() : it->second;
}

void registerMaterials(MemoryWorld& world, const MaterialNames& names) {
  for (const std::string* n : {&names.platform, &names.jump, &names.railLeft,
                               &names.railRight, &names.railTrack})
    world.registerMaterial(*n);
}
