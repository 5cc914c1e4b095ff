/**
 * @file main_cli.cpp
 * @brief Терминальная "Змейка на сетке" (ncurses)
 *
 * Журнал пишется в файл, поскольку терминал занят ncurses. Уровень
 * журнала задаётся переменной окружения SPDLOG_LEVEL.
 */

#include <getopt.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>

#include "gs_controller.hpp"

extern "C" {
#include "cli.h"
#include "gs_config.h"
#include "gs_game_cmn.h"
}

namespace {

constexpr int kFps = 60;

struct CliOptions {
  GameConfig_t config = gsnake_default_config();
  std::string log_path = "grid_snake.log";
};

void print_usage(const char* prog) {
  std::printf(
      "Usage: %s [options]\n"
      "  -W, --width N     arena width in cells (%d..%d)\n"
      "  -H, --height N    arena height in cells (%d..%d)\n"
      "  -t, --tick MS     movement period in milliseconds\n"
      "  -f, --food MS     food spawn period in milliseconds\n"
      "  -m, --max-food N  food limit, 0 for unlimited\n"
      "  -s, --seed N      food generator seed, 0 for random\n"
      "  -l, --log PATH    log file (default grid_snake.log)\n"
      "  -h, --help        show this help\n",
      prog, GSNAKE_ARENA_MIN_SIDE, GSNAKE_ARENA_MAX_SIDE,
      GSNAKE_ARENA_MIN_SIDE, GSNAKE_ARENA_MAX_SIDE);
}

bool parse_int(const char* text, long min, long max, long& out) {
  char* end = nullptr;
  long value = std::strtol(text, &end, 10);
  if (end == text || *end != '\0' || value < min || value > max) return false;
  out = value;
  return true;
}

// 0 - продолжить, 1 - ошибка, 2 - показана справка
int parse_options(int argc, char** argv, CliOptions& opts) {
  static const option kLongOptions[] = {
      {"width", required_argument, nullptr, 'W'},
      {"height", required_argument, nullptr, 'H'},
      {"tick", required_argument, nullptr, 't'},
      {"food", required_argument, nullptr, 'f'},
      {"max-food", required_argument, nullptr, 'm'},
      {"seed", required_argument, nullptr, 's'},
      {"log", required_argument, nullptr, 'l'},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0},
  };

  int c;
  long value = 0;
  while ((c = getopt_long(argc, argv, "W:H:t:f:m:s:l:h", kLongOptions,
                          nullptr)) != -1) {
    bool ok = true;
    switch (c) {
      case 'W':
        ok = parse_int(optarg, GSNAKE_ARENA_MIN_SIDE, GSNAKE_ARENA_MAX_SIDE,
                       value);
        opts.config.arena_width = static_cast<int>(value);
        break;
      case 'H':
        ok = parse_int(optarg, GSNAKE_ARENA_MIN_SIDE, GSNAKE_ARENA_MAX_SIDE,
                       value);
        opts.config.arena_height = static_cast<int>(value);
        break;
      case 't':
        ok = parse_int(optarg, 1, 60000, value);
        opts.config.tick_period_ms = static_cast<int>(value);
        break;
      case 'f':
        ok = parse_int(optarg, 1, 600000, value);
        opts.config.food_period_ms = static_cast<int>(value);
        break;
      case 'm':
        ok = parse_int(optarg, 0, GSNAKE_ARENA_MAX_SIDE * GSNAKE_ARENA_MAX_SIDE,
                       value);
        opts.config.max_food = static_cast<int>(value);
        break;
      case 's':
        ok = parse_int(optarg, 0, 0x7fffffffL, value);
        opts.config.seed = static_cast<unsigned>(value);
        break;
      case 'l':
        opts.log_path = optarg;
        break;
      case 'h':
        print_usage(argv[0]);
        return 2;
      default:
        print_usage(argv[0]);
        return 1;
    }
    if (!ok) {
      std::fprintf(stderr, "%s: invalid value '%s' for -%c\n", argv[0],
                   optarg, c);
      return 1;
    }
  }

  if (!gsnake_is_valid_config(&opts.config)) {
    std::fprintf(stderr,
                 "%s: start cell (%d, %d) does not fit a %dx%d arena\n",
                 argv[0], opts.config.start.x, opts.config.start.y,
                 opts.config.arena_width, opts.config.arena_height);
    return 1;
  }
  return 0;
}

gsnake::ControllerLayout make_layout(const GameConfig_t& config) {
  // Поле в рамке: 2 символа на клетку + 2 на рамку
  const int field_w = config.arena_width * 2 + 2;
  const int field_h = config.arena_height + 2;
  const int side_x = field_w + 3;

  gsnake::ControllerLayout layout;
  layout.field = {0, 0, field_w, field_h};
  layout.length = {side_x, 1, 6, 1};
  layout.best = {side_x, 3, 6, 1};
  layout.resets = {side_x, 5, 6, 1};
  layout.status = {0, field_h + 1, 48, 2};
  return layout;
}

}  // namespace

int main(int argc, char** argv) {
  CliOptions opts;
  int rc = parse_options(argc, argv, opts);
  if (rc != 0) return rc == 2 ? EXIT_SUCCESS : EXIT_FAILURE;

  try {
    auto logger = spdlog::basic_logger_mt("grid_snake", opts.log_path);
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::warn);
  } catch (const spdlog::spdlog_ex& ex) {
    std::fprintf(stderr, "%s: cannot open log '%s': %s\n", argv[0],
                 opts.log_path.c_str(), ex.what());
    return EXIT_FAILURE;
  }
  spdlog::cfg::load_env_levels();

  spdlog::info("[grid_snake_cli] arena {}x{}, tick {} ms, food {} ms, seed {}",
               opts.config.arena_width, opts.config.arena_height,
               opts.config.tick_period_ms, opts.config.food_period_ms,
               opts.config.seed);

  gsnake::Controller controller(cli_view, opts.config, kFps,
                                make_layout(opts.config));
  if (!controller.start()) {
    std::fprintf(stderr, "%s: failed to start, see %s\n", argv[0],
                 opts.log_path.c_str());
    return EXIT_FAILURE;
  }

  using clock = std::chrono::steady_clock;
  const auto frame = std::chrono::milliseconds(1000 / kFps);
  auto last = clock::now();
  bool running = true;
  while (running) {
    const auto now = clock::now();
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(now - last);
    last += elapsed;  // остаток меньше миллисекунды уходит в следующий кадр
    running = controller.step(static_cast<int>(elapsed.count()));

    const auto spent = clock::now() - now;
    if (spent < frame) std::this_thread::sleep_for(frame - spent);
  }

  if (const GameInfo_t* info = controller.info()) {
    spdlog::info("[grid_snake_cli] finished: best length {}, resets {}",
                 info->best_length, info->resets);
  }
  return EXIT_SUCCESS;
}
