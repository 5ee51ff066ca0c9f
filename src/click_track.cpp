#include "click_track.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <iostream>
#include <limits>

static constexpr double kClickHz = 1000.0;
static constexpr double kClickSeconds = 0.03;
static constexpr double kClickDecay = 120.0; // 1/s
static constexpr double kTwoPi = 6.28318530717958647692;

ClickTrackClock::ClickTrackClock(ClickTrackOptions opts) : opts_(opts) {}

ClickTrackClock::~ClickTrackClock() { close(); }

bool ClickTrackClock::open() {
  if (stream_) return true;
  PaError err = Pa_Initialize();
  if (err != paNoError) {
    std::cerr << "Pa_Initialize: " << Pa_GetErrorText(err) << "\n";
    return false;
  }
  paInitialized_ = true;

  PaDeviceIndex device = opts_.deviceIndex >= 0 ? opts_.deviceIndex : Pa_GetDefaultOutputDevice();
  const PaDeviceInfo* info = device != paNoDevice ? Pa_GetDeviceInfo(device) : nullptr;
  if (!info || info->maxOutputChannels < 1) {
    std::cerr << "No output device found.\n";
    close();
    return false;
  }
  std::cout << "Using output: " << (info->name ? info->name : "?") << "\n";

  PaStreamParameters out{};
  out.device = device;
  out.channelCount = 1;
  out.sampleFormat = paFloat32;
  out.suggestedLatency = info->defaultLowOutputLatency;
  out.hostApiSpecificStreamInfo = nullptr;

  err = Pa_OpenStream(&stream_, nullptr, &out, opts_.sampleRate, opts_.bufferFrames,
                      paNoFlag, &ClickTrackClock::streamCb, this);
  if (err != paNoError) {
    std::cerr << "Pa_OpenStream: " << Pa_GetErrorText(err) << "\n";
    stream_ = nullptr;
    close();
    return false;
  }
  return true;
}

void ClickTrackClock::close() {
  if (stream_) {
    pause();
    Pa_CloseStream(stream_);
    stream_ = nullptr;
  }
  if (paInitialized_) {
    Pa_Terminate();
    paInitialized_ = false;
  }
}

void ClickTrackClock::setClicks(const std::vector<double>& times) {
  clickFrames_.clear();
  clickFrames_.reserve(times.size());
  for (double t : times) clickFrames_.push_back((int64_t)std::llround(t * opts_.sampleRate));
  std::sort(clickFrames_.begin(), clickFrames_.end());
  clickFrames_.erase(std::unique(clickFrames_.begin(), clickFrames_.end()), clickFrames_.end());
}

double ClickTrackClock::currentTime() const {
  if (!stream_) return std::numeric_limits<double>::quiet_NaN();
  return (double)frame_.load(std::memory_order_acquire) / opts_.sampleRate + opts_.latencyOffset;
}

bool ClickTrackClock::seek(double seconds) {
  if (!stream_) return false;
  frame_.store((int64_t)std::llround(std::max(0.0, seconds) * opts_.sampleRate),
               std::memory_order_release);
  return true;
}

bool ClickTrackClock::play() {
  if (!stream_) return false;
  if (playing_.load(std::memory_order_acquire)) return true;
  PaError err = Pa_StartStream(stream_);
  if (err != paNoError) {
    std::cerr << "Pa_StartStream: " << Pa_GetErrorText(err) << "\n";
    return false;
  }
  playing_.store(true, std::memory_order_release);
  return true;
}

void ClickTrackClock::pause() {
  if (!stream_ || !playing_.load(std::memory_order_acquire)) return;
  PaError err = Pa_StopStream(stream_);
  if (err != paNoError) std::cerr << "Pa_StopStream: " << Pa_GetErrorText(err) << "\n";
  playing_.store(false, std::memory_order_release);
}

int ClickTrackClock::streamCb(const void*, void* output, unsigned long frameCount,
                              const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags, void* userData) {
  auto* self = reinterpret_cast<ClickTrackClock*>(userData);
  if (!output) return paContinue;
  self->render(static_cast<float*>(output), frameCount);
  return paContinue;
}

void ClickTrackClock::render(float* out, unsigned long frameCount) {
  int64_t start = frame_.load(std::memory_order_acquire);
  const int64_t clickLen = (int64_t)(kClickSeconds * opts_.sampleRate);

  // last click at or before the first frame of this buffer
  auto it = std::upper_bound(clickFrames_.begin(), clickFrames_.end(), start);
  auto active = it == clickFrames_.begin() ? clickFrames_.end() : std::prev(it);

  for (unsigned long i = 0; i < frameCount; ++i) {
    int64_t f = start + (int64_t)i;
    while (it != clickFrames_.end() && *it <= f) active = it++;
    float sample = 0.f;
    if (active != clickFrames_.end() && f - *active < clickLen) {
      double t = (double)(f - *active) / opts_.sampleRate;
      sample = (float)(opts_.volume * std::exp(-kClickDecay * t) * std::sin(kTwoPi * kClickHz * t));
    }
    out[i] = sample;
  }

  // a seek from the game thread wins over this advance
  frame_.compare_exchange_strong(start, start + (int64_t)frameCount, std::memory_order_acq_rel);
}
