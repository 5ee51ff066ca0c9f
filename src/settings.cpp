#include "settings.hpp"
#include <fstream>
#include <iostream>
#include <type_traits>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

template <class T>
void read(const json& j, const char* key, T& out) {
  if (!j.contains(key)) return;
  const json& v = j[key];
  if constexpr (std::is_same_v<T, bool>) {
    if (v.is_boolean()) out = v.get<bool>();
  } else if constexpr (std::is_same_v<T, std::string>) {
    if (v.is_string()) out = v.get<std::string>();
  } else if constexpr (std::is_integral_v<T>) {
    if (v.is_number_integer()) out = v.get<T>();
  } else {
    if (v.is_number()) out = v.get<T>();
  }
}

json tuningToJson(const CourseTuning& t) {
  return json{{"moveSpeed", t.moveSpeed}, {"laneSpacing", t.laneSpacing}};
}

void tuningFromJson(const json& j, CourseTuning& t) {
  if (!j.is_object()) return;
  read(j, "moveSpeed", t.moveSpeed);
  read(j, "laneSpacing", t.laneSpacing);
}

} // namespace

bool saveConfig(const std::string& path, const Settings& s) {
  json j;
  j["window"] = {{"width", s.width}, {"height", s.height}, {"vsync", s.vsync}};
  j["audio"] = {
    {"deviceIndex", s.audioDeviceIndex},
    {"bufferSize", s.bufferSize},
    {"latencyOffset", s.latencyOffset},
    {"clickVolume", s.clickVolume},
  };
  j["course"] = {
    {"platform", tuningToJson(s.platform)},
    {"rail", tuningToJson(s.rail)},
    {"jumpHeight", s.jumpHeight},
    {"gapThreshold", s.gapThreshold},
    {"fillerInset", s.fillerInset},
    {"railMargin", s.railMargin},
    {"materials", {
      {"platform", s.materials.platform},
      {"jump", s.materials.jump},
      {"railLeft", s.materials.railLeft},
      {"railRight", s.materials.railRight},
      {"railTrack", s.materials.railTrack},
    }},
  };
  j["play"] = {
    {"hitWindow", s.hitWindow},
    {"endPadding", s.timing.endPadding},
    {"jumpWindow", s.timing.jumpWindow},
    {"epsilon", s.timing.epsilon},
    {"lookAhead", s.timing.lookAhead},
    {"baseCell", {s.baseCell.x, s.baseCell.y, s.baseCell.z}},
  };

  std::ofstream f(path);
  if (!f) {
    std::cerr << "Config: cannot write " << path << "\n";
    return false;
  }
  f << j.dump(2);
  return (bool)f;
}

bool loadConfig(const std::string& path, Settings& s) {
  std::ifstream f(path);
  if (!f) return false;
  json j = json::parse(f, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    std::cerr << "Config: " << path << " is not valid JSON, keeping defaults\n";
    return false;
  }

  if (j.contains("window") && j["window"].is_object()) {
    const json& w = j["window"];
    read(w, "width", s.width);
    read(w, "height", s.height);
    read(w, "vsync", s.vsync);
  }
  if (j.contains("audio") && j["audio"].is_object()) {
    const json& a = j["audio"];
    read(a, "deviceIndex", s.audioDeviceIndex);
    read(a, "bufferSize", s.bufferSize);
    read(a, "latencyOffset", s.latencyOffset);
    read(a, "clickVolume", s.clickVolume);
  }
  if (j.contains("course") && j["course"].is_object()) {
    const json& c = j["course"];
    if (c.contains("platform")) tuningFromJson(c["platform"], s.platform);
    if (c.contains("rail")) tuningFromJson(c["rail"], s.rail);
    read(c, "jumpHeight", s.jumpHeight);
    read(c, "gapThreshold", s.gapThreshold);
    read(c, "fillerInset", s.fillerInset);
    read(c, "railMargin", s.railMargin);
    if (c.contains("materials") && c["materials"].is_object()) {
      const json& m = c["materials"];
      read(m, "platform", s.materials.platform);
      read(m, "jump", s.materials.jump);
      read(m, "railLeft", s.materials.railLeft);
      read(m, "railRight", s.materials.railRight);
      read(m, "railTrack", s.materials.railTrack);
    }
  }
  if (j.contains("play") && j["play"].is_object()) {
    const json& p = j["play"];
    read(p, "hitWindow", s.hitWindow);
    read(p, "endPadding", s.timing.endPadding);
    read(p, "jumpWindow", s.timing.jumpWindow);
    read(p, "epsilon", s.timing.epsilon);
    read(p, "lookAhead", s.timing.lookAhead);
    if (p.contains("baseCell") && p["baseCell"].is_array() && p["baseCell"].size() == 3) {
      const json& b = p["baseCell"];
      if (b[0].is_number_integer() && b[1].is_number_integer() && b[2].is_number_integer())
        s.baseCell = Coords3{b[0].get<int>(), b[1].get<int>(), b[2].get<int>()};
    }
  }
  return true;
}
