#include "gs_input.hpp"

extern "C" {
#include "gs_game_cmn.h"
}

namespace gsnake {

bool KeyboardState::is_held(GameKey_t key) const noexcept {
  if (!gsnake_is_valid_key(key)) return false;
  return keys_[key] != GS_KEY_RELEASED;
}

bool KeyboardState::set(GameKey_t key, KeyState_t state) noexcept {
  if (!gsnake_is_valid_key(key) || !gsnake_is_valid_key_state(state)) {
    return false;
  }
  keys_[key] = state;
  return true;
}

void KeyboardState::release_taps() noexcept {
  for (auto& k : keys_) {
    if (k == GS_KEY_TAPPED) k = GS_KEY_RELEASED;
  }
}

void KeyboardState::release_all() noexcept { keys_.fill(GS_KEY_RELEASED); }

}  // namespace gsnake
