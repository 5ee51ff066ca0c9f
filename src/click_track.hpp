#pragma once
#include <atomic>
#include <cstdint>
#include <vector>
#include <portaudio.h>
#include "world.hpp"

struct ClickTrackOptions {
  int    deviceIndex = -1;     // -1 = default output
  double sampleRate = 48000.0;
  unsigned long bufferFrames = 256;
  double volume = 0.3;
  double latencyOffset = 0.0;  // seconds added to the reported time
};

// Plays a short tick at every click time through PortAudio. The count of frames
// rendered by the callback is the playback clock, so the runner follows exactly
// what the device has consumed.
class ClickTrackClock : public AudioClock {
public:
  explicit ClickTrackClock(ClickTrackOptions opts = {});
  ~ClickTrackClock() override;

  ClickTrackClock(const ClickTrackClock&) = delete;
  ClickTrackClock& operator=(const ClickTrackClock&) = delete;

  // Initializes PortAudio and opens the output stream. false (logged) on failure;
  // the clock then reports NaN and refuses to play.
  bool open();
  void close();

  // Click times in seconds; call while paused.
  void setClicks(const std::vector<double>& times);

  double currentTime() const override;
  bool seek(double seconds) override;
  bool play() override;
  void pause() override;
  bool paused() const override { return !playing_.load(std::memory_order_acquire); }

private:
  static int streamCb(const void* input, void* output, unsigned long frameCount,
                      const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags, void* userData);
  void render(float* out, unsigned long frameCount);

  ClickTrackOptions opts_;
  PaStream* stream_ = nullptr;
  bool paInitialized_ = false;
  std::vector<int64_t> clickFrames_;   // ascending
  std::atomic<int64_t> frame_{0};
  std::atomic<bool> playing_{false};
};
