#include <cmath>
#include <string>
#include <vector>
#include <array>
#include <algorithm>
#include <iostream>
#include <filesystem>

#include <SDL.h>

#include "chart.hpp"
#include "click_track.hpp"
#include "course.hpp"
#include "runner.hpp"
#include "sandbox.hpp"
#include "session.hpp"
#include "settings.hpp"

namespace fs = std::filesystem;

// --------- Config ---------
static constexpr int    kFrameHistory = 120;
static constexpr double kPixelsPerUnit = 18.0;
static constexpr double kCameraLead = 0.25;  // avatar sits this far across the screen
static constexpr int    kMaxComboPips = 40;

// --------- SDL2 Render ---------
struct RenderState {
  SDL_Window* window = nullptr;
  SDL_Renderer* r = nullptr;
  int w = 1280, h = 720;
};

// --------- App ---------
struct App {
  RenderState rs;
  Settings settings;
  MemoryWorld world;
  KinematicAvatar avatar;
  Session session;
  bool running = true;
  std::array<float, kFrameHistory> frameTimes{};
  int frameTimeIdx = 0;
  bool frameTimesFull = false;
  bool showFrameGraph = false;

  explicit App(const Settings& s = {})
    : settings(s), session(world, avatar, settings) {
    registerMaterials(world, settings.materials);
    rs.w = settings.width;
    rs.h = settings.height;
  }
};

bool initSDL(RenderState& rs, bool vsync) {
  SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "1");
  if (SDL_Init(SDL_INIT_VIDEO|SDL_INIT_EVENTS|SDL_INIT_TIMER) != 0) {
    std::cerr << "SDL_Init: " << SDL_GetError() << "\n"; return false;
  }
  rs.window = SDL_CreateWindow("beatrun",
                               SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                               rs.w, rs.h, SDL_WINDOW_SHOWN);
  if (!rs.window) { std::cerr << "SDL_CreateWindow failed\n"; return false; }
  Uint32 flags = SDL_RENDERER_ACCELERATED | (vsync ? SDL_RENDERER_PRESENTVSYNC : 0);
  rs.r = SDL_CreateRenderer(rs.window, -1, flags);
  if (!rs.r) { std::cerr << "SDL_CreateRenderer failed\n"; return false; }
  SDL_SetRenderDrawBlendMode(rs.r, SDL_BLENDMODE_BLEND);
  return true;
}

SDL_Color materialColor(const App& app, int id) {
  const std::string& name = app.world.materialName(id);
  const MaterialNames& m = app.settings.materials;
  if (name == m.platform)  return SDL_Color{235,235,235,255};
  if (name == m.jump)      return SDL_Color{240,200,40,255};
  if (name == m.railLeft)  return SDL_Color{40,90,230,255};
  if (name == m.railRight) return SDL_Color{220,50,50,255};
  if (name == m.railTrack) return SDL_Color{70,70,80,255};
  return SDL_Color{150,150,150,255};
}

void renderFrameGraph(App& app) {
  SDL_Renderer* r = app.rs.r;
  const int w = kFrameHistory;
  const int h = 60;
  const int x0 = 10;
  const int y0 = 10;

  SDL_SetRenderDrawColor(r, 0, 0, 0, 160);
  SDL_Rect bg{ x0-1, y0-1, w+2, h+2 };
  SDL_RenderFillRect(r, &bg);

  SDL_SetRenderDrawColor(r, 100, 100, 100, 255);
  SDL_RenderDrawLine(r, x0, y0 + h/2, x0 + w, y0 + h/2);

  SDL_SetRenderDrawColor(r, 0, 255, 0, 255);
  float scale = h / (16.7f * 2.f);
  int count = app.frameTimesFull ? kFrameHistory : app.frameTimeIdx;
  int start = app.frameTimesFull ? app.frameTimeIdx : 0;
  for (int i = 1; i < count; ++i) {
    int idx0 = (start + i - 1) % kFrameHistory;
    int idx1 = (start + i) % kFrameHistory;
    float t0 = std::min(app.frameTimes[idx0], 33.4f);
    float t1 = std::min(app.frameTimes[idx1], 33.4f);
    SDL_RenderDrawLine(r, x0 + i - 1, y0 + h - int(t0 * scale), x0 + i, y0 + h - int(t1 * scale));
  }
}

// Side view (z right, y up) on the top half, top view (z right, x down) on the bottom.
void renderCourse(App& app) {
  RenderState& rs = app.rs;
  const Course* course = app.session.runner().activeCourse();
  const Vec3& pos = app.avatar.position;
  const double camZ = course ? pos.z : 0.0;
  const double camY = course ? course->baseCell.y + 2.0 : app.settings.baseCell.y + 2.0;
  const double camX = course ? course->origin.x : app.settings.baseCell.x + 0.5;
  const int cell = (int)kPixelsPerUnit;
  const int sideMid = rs.h / 4;
  const int topMid = rs.h * 3 / 4;

  auto screenZ = [&](double z){ return (int)std::lround(rs.w * kCameraLead + (z - camZ) * kPixelsPerUnit); };

  SDL_SetRenderDrawColor(rs.r, 40, 40, 50, 255);
  SDL_RenderDrawLine(rs.r, 0, rs.h/2, rs.w, rs.h/2);

  for (const auto& [c, id] : app.world.cells()) {
    int sx = screenZ(c.z);
    if (sx < -cell || sx > rs.w) continue;
    SDL_Color col = materialColor(app, id);
    SDL_SetRenderDrawColor(rs.r, col.r, col.g, col.b, 255);
    SDL_Rect side{ sx, sideMid - (int)std::lround((c.y + 1 - camY) * kPixelsPerUnit), cell - 1, cell - 1 };
    SDL_RenderFillRect(rs.r, &side);
    SDL_SetRenderDrawColor(rs.r, col.r, col.g, col.b, 160);
    SDL_Rect top{ sx, topMid + (int)std::lround((c.x - camX) * kPixelsPerUnit), cell - 1, cell - 1 };
    SDL_RenderFillRect(rs.r, &top);
  }

  // hit line
  SDL_SetRenderDrawColor(rs.r, 255, 255, 255, 90);
  int hx = (int)(rs.w * kCameraLead);
  SDL_RenderDrawLine(rs.r, hx, 0, hx, rs.h);

  if (course) {
    int bodyW = cell / 2;
    int bodyH = (int)(app.avatar.bodyHeight() * kPixelsPerUnit);
    int cy = sideMid - (int)std::lround((pos.y - camY) * kPixelsPerUnit);
    SDL_SetRenderDrawColor(rs.r, 0, 255, 200, 255);
    SDL_Rect body{ hx - bodyW/2, cy - bodyH/2, bodyW, bodyH };
    SDL_RenderFillRect(rs.r, &body);
    SDL_Rect dot{ hx - bodyW/2, topMid + (int)std::lround((pos.x - camX) * kPixelsPerUnit) - bodyW/2, bodyW, bodyW };
    SDL_RenderFillRect(rs.r, &dot);
  }
}

void renderHud(App& app) {
  RenderState& rs = app.rs;
  const ScoreState& s = app.session.score();
  int pips = std::min(s.combo, kMaxComboPips);
  for (int i = 0; i < pips; ++i) {
    SDL_SetRenderDrawColor(rs.r, 0, 255, 200, 220);
    SDL_Rect pip{ rs.w - 20 - i*12, 20, 8, 8 };
    SDL_RenderFillRect(rs.r, &pip);
  }
  int best = std::min(s.bestCombo, kMaxComboPips);
  SDL_SetRenderDrawColor(rs.r, 255, 255, 255, 80);
  SDL_Rect bestBar{ rs.w - 20 - (best-1)*12, 32, best > 0 ? best*12 - 4 : 0, 3 };
  SDL_RenderFillRect(rs.r, &bestBar);

  // hit / miss split: green share of resolved rail notes over red
  size_t resolved = s.hitNotes.size() + s.missedNotes.size();
  if (resolved > 0) {
    const int barW = 160;
    int hitW = (int)(barW * s.hitNotes.size() / resolved);
    SDL_SetRenderDrawColor(rs.r, 60, 220, 90, 220);
    SDL_Rect hits{ rs.w - 20 - barW, 42, hitW, 6 };
    SDL_RenderFillRect(rs.r, &hits);
    SDL_SetRenderDrawColor(rs.r, 220, 60, 60, 220);
    SDL_Rect misses{ rs.w - 20 - barW + hitW, 42, barW - hitW, 6 };
    SDL_RenderFillRect(rs.r, &misses);
  }

  // mode swatch: platform white, rail blue
  bool rail = app.session.mode() == CourseMode::Rail;
  SDL_SetRenderDrawColor(rs.r, rail ? 40 : 235, rail ? 90 : 235, rail ? 230 : 235, 255);
  SDL_Rect swatch{ rs.w - 20, rs.h - 20, 10, 10 };
  SDL_RenderFillRect(rs.r, &swatch);
}

void renderFrame(App& app) {
  SDL_SetRenderDrawColor(app.rs.r, 12,12,16,255);
  SDL_RenderClear(app.rs.r);
  renderCourse(app);
  renderHud(app);
  if (app.showFrameGraph) renderFrameGraph(app);
  SDL_RenderPresent(app.rs.r);
}

// Ahead of the player once a run has placed the avatar, the configured cell before that.
Coords3 courseBase(const App& app) {
  if (app.avatar.movementResets == 0) return app.settings.baseCell;
  Vec3 feet = app.avatar.position;
  feet.y -= app.avatar.bodyHeight() / 2.0;
  return baseCellAhead(feet).value_or(app.settings.baseCell);
}

// B build, Enter start, Backspace clear, M toggle mode, J/L slash, Esc quit.
void handleEvent(App& app, const SDL_Event& e) {
  if (e.type == SDL_QUIT) { app.running = false; return; }
  if (e.type != SDL_KEYDOWN || e.key.repeat) return;
  switch (e.key.keysym.sym) {
    case SDLK_ESCAPE: app.running = false; break;
    case SDLK_F3: app.showFrameGraph = !app.showFrameGraph; break;
    case SDLK_m:
      app.session.setMode(app.session.mode() == CourseMode::Rail ? CourseMode::Platform : CourseMode::Rail);
      std::cout << "Mode: " << courseModeName(app.session.mode()) << "\n";
      break;
    case SDLK_b: app.session.buildCourse(app.session.mode(), courseBase(app)); break;
    case SDLK_RETURN:
      app.session.startRun();
      std::cout << "Runner: " << runnerStateName(app.session.runner().state()) << "\n";
      break;
    case SDLK_BACKSPACE: app.session.clearCourse(); break;
    case SDLK_j: app.session.handleAction(Side::Left); break;
    case SDLK_l: app.session.handleAction(Side::Right); break;
    default: break;
  }
}

// --------- Main ---------
#ifndef BEATRUN_NO_MAIN
int main(int argc, char** argv) {
  fs::path exeDir;
  try {
    exeDir = fs::canonical(fs::path(argv[0])).parent_path();
  } catch (const fs::filesystem_error&) {
    exeDir = fs::current_path();
  }
  fs::path dataRoot = exeDir;
  if (!fs::exists(dataRoot / "charts")) {
    dataRoot = exeDir.parent_path();
  }

  fs::path chartPath = (argc > 1) ? fs::path(argv[1]) : fs::path("charts") / "example.osu";
  if (!chartPath.is_absolute() && !fs::exists(chartPath)) {
    chartPath = dataRoot / chartPath;
  }
  if (!fs::exists(chartPath)) {
    std::cerr << "Chart file not found: " << chartPath << "\n";
    return 1;
  }

  fs::path configPath = (argc > 2) ? fs::path(argv[2]) : dataRoot / "config.json";
  Settings settings{};
  if (fs::exists(configPath) && !loadConfig(configPath.string(), settings)) {
    std::cerr << "Using default settings\n";
  }

  auto chart = loadChart(chartPath);
  if (!chart) {
    std::cerr << "Could not read chart: " << chartPath << "\n";
    return 1;
  }

  App app(settings);
  std::vector<double> clickTimes;
  for (const auto& n : chart->notes) clickTimes.push_back(n.time);
  app.session.setChart(std::move(*chart));

  ClickTrackOptions audioOpts{};
  audioOpts.deviceIndex = settings.audioDeviceIndex;
  audioOpts.bufferFrames = (unsigned long)std::max(settings.bufferSize, 16);
  audioOpts.volume = settings.clickVolume;
  audioOpts.latencyOffset = settings.latencyOffset / 1000.0;
  ClickTrackClock clock(audioOpts);
  if (!clock.open()) {
    std::cerr << "Audio unavailable, runs will be timed by the wall clock\n";
  }
  clock.setClicks(clickTimes);
  // attached even when closed: its refusals exercise the wall-clock fallback
  app.session.setAudio(&clock);

  if (!initSDL(app.rs, settings.vsync)) { std::cerr << "SDL init failed\n"; return 1; }

  const double freq = (double)SDL_GetPerformanceFrequency();
  Uint64 lastCounter = SDL_GetPerformanceCounter();

  while (app.running) {
    Uint64 nowCounter = SDL_GetPerformanceCounter();
    float dt_ms = float((nowCounter - lastCounter) * 1000.0 / freq);
    lastCounter = nowCounter;
    app.frameTimes[app.frameTimeIdx] = dt_ms;
    app.frameTimeIdx = (app.frameTimeIdx + 1) % kFrameHistory;
    if (app.frameTimeIdx == 0) app.frameTimesFull = true;

    app.session.update(dt_ms / 1000.0);

    SDL_Event e;
    while (SDL_PollEvent(&e)) handleEvent(app, e);

    renderFrame(app);
    if (!settings.vsync) SDL_Delay(16); // ~60fps
  }

  app.session.clearCourse();
  app.session.setAudio(nullptr);
  clock.close();

  if (app.rs.r) SDL_DestroyRenderer(app.rs.r);
  if (app.rs.window) SDL_DestroyWindow(app.rs.window);
  SDL_Quit();

  return 0;
}
#endif // BEATRUN_NO_MAIN
