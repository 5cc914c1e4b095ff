#pragma once

extern "C" {
#include "../common/view.h"  // ViewInterface, ViewHandle_t, ElementData_t, InputEvent_t
}

/**
 * @brief Экземпляр Qt-бэкенда отображения.
 *
 * Реализует ViewInterface на Qt6 Widgets. Зоны задаются в пикселях окна.
 * Клавиши сообщаются парами VIEW_KEY_PRESS / VIEW_KEY_RELEASE, автоповтор
 * отбрасывается.
 *
 * @note Перед init() должен существовать QApplication.
 */
extern const ViewInterface qt_view;
