/**
 * @file gs_controller.cpp
 * @brief Реализация контроллера кадра
 */

#include "gs_controller.hpp"

#include <spdlog/spdlog.h>

extern "C" {
#include "gs_game_cmn.h"
}
#include "gs_snake.h"

namespace gsnake {

std::optional<GameKey_t> map_view_key(int key_code) noexcept {
  switch (key_code) {
    case VIEW_KEY_ARROW_LEFT:
      return GS_KEY_ARROW_LEFT;
    case VIEW_KEY_ARROW_RIGHT:
      return GS_KEY_ARROW_RIGHT;
    case VIEW_KEY_ARROW_DOWN:
      return GS_KEY_ARROW_DOWN;
    case VIEW_KEY_ARROW_UP:
      return GS_KEY_ARROW_UP;
    case 'a':
      return GS_KEY_A;
    case 'd':
      return GS_KEY_D;
    case 's':
      return GS_KEY_S;
    case 'w':
      return GS_KEY_W;
    default:
      return std::nullopt;
  }
}

std::optional<GameAction_t> map_view_action(int key_code) noexcept {
  switch (key_code) {
    case 'p':
      return GS_ACTION_PAUSE;
    case 'r':
      return GS_ACTION_RESTART;
    default:
      return std::nullopt;
  }
}

bool is_quit_key(int key_code) noexcept {
  return key_code == 'q' || key_code == VIEW_KEY_ESCAPE;
}

Controller::Controller(const ViewInterface& view, const GameConfig_t& config,
                       int fps, const ControllerLayout& layout) noexcept
    : view_(view), config_(config), fps_(fps), layout_(layout) {}

Controller::~Controller() { shutdown_(); }

bool Controller::start() {
  if (view_.version != VIEW_INTERFACE_VERSION) {
    spdlog::error("[Controller] view interface version {} (expected {})",
                  view_.version, VIEW_INTERFACE_VERSION);
    return false;
  }

  game_ = snake_create(&config_);
  if (game_ == nullptr) {
    spdlog::error("[Controller] failed to create a game session");
    return false;
  }

  handle_ = view_.init(config_.arena_width, config_.arena_height, fps_);
  if (handle_ == nullptr) {
    spdlog::error("[Controller] failed to initialize the view");
    shutdown_();
    return false;
  }

  const struct {
    const char* id;
    const ZoneRect& rect;
  } zones[] = {
      {"field", layout_.field},   {"length", layout_.length},
      {"best", layout_.best},     {"resets", layout_.resets},
      {"status", layout_.status},
  };
  for (const auto& z : zones) {
    ViewResult_t r = view_.configure_zone(handle_, z.id, z.rect.x, z.rect.y,
                                          z.rect.w, z.rect.h);
    if (r != VIEW_OK) {
      spdlog::error("[Controller] zone '{}' rejected by the view (code {})",
                    z.id, static_cast<int>(r));
      shutdown_();
      return false;
    }
  }

  spdlog::info("[Controller] started at {} fps", fps_);
  return draw_();
}

bool Controller::step(int elapsed_ms) {
  if (game_ == nullptr || handle_ == nullptr) return false;
  if (!pollInput_()) {
    spdlog::info("[Controller] quit requested");
    return false;
  }
  snake_update(game_, elapsed_ms);
  return draw_();
}

const GameInfo_t* Controller::info() const noexcept {
  return snake_get_info(game_);
}

bool Controller::pollInput_() {
  InputEvent_t ev{};
  while (view_.poll_input(handle_, &ev) == VIEW_OK) {
    if (ev.key_state == VIEW_KEY_RELEASE) {
      if (auto key = map_view_key(ev.key_code)) {
        snake_set_key(game_, *key, GS_KEY_RELEASED);
      }
      continue;
    }

    if (is_quit_key(ev.key_code)) return false;

    if (auto key = map_view_key(ev.key_code)) {
      snake_set_key(game_, *key,
                    ev.key_state == VIEW_KEY_PRESS ? GS_KEY_PRESSED
                                                   : GS_KEY_TAPPED);
    } else if (auto action = map_view_action(ev.key_code)) {
      snake_handle_action(game_, *action);
    }
  }
  return true;
}

bool Controller::draw_() {
  const GameInfo_t* info = snake_get_info(game_);
  if (!gsnake_is_valid_game_info(info)) {
    spdlog::error("[Controller] inconsistent game snapshot, stopping");
    return false;
  }

  status_ = info->pause ? "PAUSED\np: resume  r: restart  q: quit"
                        : "arrows/WASD: move\np: pause  r: restart  q: quit";

  ElementData_t field{};
  field.type = ELEMENT_MATRIX;
  field.content.matrix.data = info->field;
  field.content.matrix.width = info->width;
  field.content.matrix.height = info->height;

  ElementData_t length{};
  length.type = ELEMENT_NUMBER;
  length.content.number = info->chain_length;

  ElementData_t best{};
  best.type = ELEMENT_NUMBER;
  best.content.number = info->best_length;

  ElementData_t resets{};
  resets.type = ELEMENT_NUMBER;
  resets.content.number = info->resets;

  ElementData_t status{};
  status.type = ELEMENT_TEXT;
  status.content.text = status_.c_str();

  const struct {
    const char* id;
    const ElementData_t* data;
  } elements[] = {
      {"field", &field}, {"length", &length}, {"best", &best},
      {"resets", &resets}, {"status", &status},
  };
  for (const auto& e : elements) {
    ViewResult_t r = view_.draw_element(handle_, e.id, e.data);
    if (r != VIEW_OK) {
      spdlog::warn("[Controller] draw '{}' failed (code {})", e.id,
                   static_cast<int>(r));
    }
  }

  if (view_.render(handle_) != VIEW_OK) {
    spdlog::error("[Controller] render failed");
    return false;
  }
  return true;
}

void Controller::shutdown_() noexcept {
  if (handle_ != nullptr) {
    if (view_.shutdown(handle_) != VIEW_OK) {
      spdlog::warn("[Controller] view shutdown reported an error");
    }
    handle_ = nullptr;
  }
  snake_destroy(game_);
  game_ = nullptr;
}

}  // namespace gsnake
