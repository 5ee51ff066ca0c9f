#pragma once
#include <string>
#include "course.hpp"
#include "runner.hpp"

struct CourseTuning {
  double moveSpeed = 6.0;
  double laneSpacing = 2.0;
};

struct Settings {
  // window
  int  width = 1280;
  int  height = 720;
  bool vsync = true;

  // audio
  int    audioDeviceIndex = -1; // -1 = default output device
  int    bufferSize = 256;      // frames per PortAudio callback
  int    latencyOffset = 0;     // ms added to the reported playback time
  double clickVolume = 0.3;

  // course generation
  CourseTuning platform{6.0, 2.0};
  CourseTuning rail{8.0, 3.0};
  double jumpHeight = 1.6;
  double gapThreshold = 1.2;
  double fillerInset = 0.5;
  double railMargin = 10.0;
  MaterialNames materials;

  // playback
  double       hitWindow = 0.2;
  RunnerTiming timing;
  Coords3      baseCell{0, 5, 0};
};

// Missing keys keep the values already in `s`.
bool loadConfig(const std::string& path, Settings& s);
bool saveConfig(const std::string& path, const Settings& s);
