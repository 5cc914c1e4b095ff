/**
 * @file main_desktop.cpp
 * @brief Настольная "Змейка на сетке" (Qt6 Widgets)
 */

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <QApplication>
#include <QElapsedTimer>
#include <QTimer>

#include "gs_controller.hpp"
#include "qt_view.hpp"

extern "C" {
#include "gs_game_cmn.h"
}

namespace {

constexpr int kFps = 60;
constexpr int kCellPx = 24;
constexpr int kMargin = 12;

gsnake::ControllerLayout make_layout(const GameConfig_t& config) {
  const int field_w = config.arena_width * kCellPx;
  const int field_h = config.arena_height * kCellPx;
  const int side_x = kMargin * 2 + field_w;

  gsnake::ControllerLayout layout;
  layout.field = {kMargin, kMargin, field_w, field_h};
  layout.length = {side_x, kMargin, 80, 24};
  layout.best = {side_x, kMargin + 40, 80, 24};
  layout.resets = {side_x, kMargin + 80, 80, 24};
  layout.status = {kMargin, kMargin * 2 + field_h, field_w + 120, 48};
  return layout;
}

}  // namespace

int main(int argc, char** argv) {
  QApplication app(argc, argv);
  spdlog::cfg::load_env_levels();

  const GameConfig_t config = gsnake_default_config();
  gsnake::Controller controller(qt_view, config, kFps, make_layout(config));
  if (!controller.start()) {
    spdlog::critical("[grid_snake_desktop] failed to start");
    return 1;
  }

  QElapsedTimer clock;
  clock.start();
  QTimer timer;
  QObject::connect(&timer, &QTimer::timeout, [&]() {
    if (!controller.step(static_cast<int>(clock.restart()))) {
      timer.stop();
      app.quit();
    }
  });
  timer.start(1000 / kFps);

  return app.exec();
}
