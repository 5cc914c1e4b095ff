#include "qt_view.hpp"

#include <QApplication>
#include <QKeyEvent>
#include <QMainWindow>
#include <QPainter>
#include <QWidget>

#include <algorithm>
#include <cstring>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

// ---------- Внутренние структуры (скрыты за ViewHandle_t) ----------

namespace {

struct Zone {
  int x, y, w, h;
  std::string name;
};

// Копия ElementData_t: окно может перерисоваться (resize, expose) уже после
// того, как буферы контроллера изменились
struct StoredElement {
  ElementType_t type = ELEMENT_TEXT;
  QString text;
  int number = 0;
  std::vector<int> cells;
  int width = 0;
  int height = 0;
};

QColor colorForCell(int value) {
  switch (value) {
    case 1:
      return QColor(0x4c, 0xaf, 0x50);  // тело
    case 2:
      return QColor(0xcd, 0xdc, 0x39);  // голова
    case 3:
      return QColor(0xe0, 0x40, 0xfb);  // еда
    default:
      return Qt::black;
  }
}

int mapQtKey(int key, const QString& text) {
  switch (key) {
    case Qt::Key_Left:
      return VIEW_KEY_ARROW_LEFT;
    case Qt::Key_Right:
      return VIEW_KEY_ARROW_RIGHT;
    case Qt::Key_Up:
      return VIEW_KEY_ARROW_UP;
    case Qt::Key_Down:
      return VIEW_KEY_ARROW_DOWN;
    case Qt::Key_Escape:
      return VIEW_KEY_ESCAPE;
    default:
      if (key >= Qt::Key_A && key <= Qt::Key_Z) {
        return 'a' + (key - Qt::Key_A);
      }
      return text.isEmpty() ? 0 : text.at(0).toLower().toLatin1();
  }
}

class GameWidget : public QWidget {
 public:
  explicit GameWidget(QWidget* parent = nullptr) : QWidget(parent) {
    setFocusPolicy(Qt::StrongFocus);
  }

  void setElementData(const std::string& id, const ElementData_t& data) {
    StoredElement& e = elements_[id];
    e.type = data.type;
    switch (data.type) {
      case ELEMENT_TEXT:
        e.text = QString::fromUtf8(data.content.text);
        break;
      case ELEMENT_NUMBER:
        e.number = data.content.number;
        break;
      case ELEMENT_MATRIX:
        e.width = data.content.matrix.width;
        e.height = data.content.matrix.height;
        e.cells.assign(data.content.matrix.data,
                       data.content.matrix.data + e.width * e.height);
        break;
    }
  }

  void setZones(const std::vector<Zone>& zones) { zones_ = zones; }

  bool popInput(InputEvent_t& out) {
    if (inputQueue_.empty()) return false;
    out = inputQueue_.front();
    inputQueue_.pop();
    return true;
  }

 protected:
  void paintEvent(QPaintEvent*) override {
    QPainter p(this);
    p.fillRect(rect(), QColor(0x20, 0x20, 0x20));

    for (const Zone& z : zones_) {
      QRect zoneRect(z.x, z.y, z.w, z.h);

      auto it = elements_.find(z.name);
      if (it == elements_.end()) continue;
      const StoredElement& data = it->second;

      p.setPen(Qt::white);
      switch (data.type) {
        case ELEMENT_TEXT:
          p.drawText(zoneRect, Qt::AlignLeft | Qt::AlignTop, data.text);
          break;
        case ELEMENT_NUMBER:
          p.drawText(zoneRect, Qt::AlignRight | Qt::AlignVCenter,
                     QString::number(data.number));
          break;
        case ELEMENT_MATRIX:
          paintMatrix(p, zoneRect, data);
          break;
      }
    }
  }

  void keyPressEvent(QKeyEvent* event) override {
    if (!pushKey(event, VIEW_KEY_PRESS)) QWidget::keyPressEvent(event);
  }

  void keyReleaseEvent(QKeyEvent* event) override {
    if (!pushKey(event, VIEW_KEY_RELEASE)) QWidget::keyReleaseEvent(event);
  }

 private:
  static void paintMatrix(QPainter& p, const QRect& zoneRect,
                          const StoredElement& data) {
    const int mw = data.width;
    const int mh = data.height;
    const std::vector<int>& cells = data.cells;
    if (mw <= 0 || mh <= 0 || cells.size() != static_cast<size_t>(mw * mh)) {
      return;
    }

    const int cell = std::min(zoneRect.width() / mw, zoneRect.height() / mh);
    p.setPen(Qt::gray);
    p.drawRect(zoneRect.x(), zoneRect.y(), cell * mw, cell * mh);

    for (int row = 0; row < mh; ++row) {
      for (int col = 0; col < mw; ++col) {
        const int value = cells[row * mw + col];
        if (value == 0) continue;
        QRect r(zoneRect.x() + col * cell, zoneRect.y() + row * cell, cell,
                cell);
        p.fillRect(r.adjusted(1, 1, -1, -1), colorForCell(value));
      }
    }
  }

  bool pushKey(QKeyEvent* event, ViewKeyState_t state) {
    if (event->isAutoRepeat()) return true;
    InputEvent_t ev{};
    ev.key_code = mapQtKey(event->key(), event->text());
    ev.key_state = state;
    if (ev.key_code == 0) return false;
    inputQueue_.push(ev);
    return true;
  }

  std::vector<Zone> zones_;
  std::unordered_map<std::string, StoredElement> elements_;
  std::queue<InputEvent_t> inputQueue_;
};

struct QtViewContext {
  int width;
  int height;
  int fps;
  QMainWindow* window;
  GameWidget* widget;
  std::vector<Zone> zones;
};

}  // namespace

// ---------- Реализация ViewInterface для Qt ----------

static ViewHandle_t qt_init(int width, int height, int fps) {
  if (width <= 0 || height <= 0 || fps < 1) return nullptr;
  if (!QApplication::instance()) return nullptr;

  auto* ctx = new QtViewContext{};
  ctx->width = width;
  ctx->height = height;
  ctx->fps = fps;

  ctx->window = new QMainWindow;
  ctx->window->setWindowTitle("grid_snake");
  ctx->window->resize(640, 520);
  ctx->widget = new GameWidget;
  ctx->window->setCentralWidget(ctx->widget);
  ctx->window->show();
  ctx->widget->setFocus();
  QApplication::processEvents();

  return static_cast<ViewHandle_t>(ctx);
}

static ViewResult_t qt_configure_zone(ViewHandle_t handle,
                                      const char* element_id, int x, int y,
                                      int max_w, int max_h) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  if (!element_id || std::strlen(element_id) == 0) return VIEW_BAD_DATA;
  if (x < 0 || y < 0 || max_w <= 0 || max_h <= 0) return VIEW_BAD_DATA;

  auto* ctx = static_cast<QtViewContext*>(handle);
  auto it = std::find_if(ctx->zones.begin(), ctx->zones.end(),
                         [&](const Zone& z) { return z.name == element_id; });
  if (it != ctx->zones.end()) {
    *it = Zone{x, y, max_w, max_h, element_id};
  } else {
    ctx->zones.push_back(Zone{x, y, max_w, max_h, element_id});
  }
  ctx->widget->setZones(ctx->zones);
  return VIEW_OK;
}

static ViewResult_t qt_draw_element(ViewHandle_t handle,
                                    const char* element_id,
                                    const ElementData_t* data) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  if (!element_id || !data) return VIEW_BAD_DATA;

  auto* ctx = static_cast<QtViewContext*>(handle);
  auto it = std::find_if(ctx->zones.begin(), ctx->zones.end(),
                         [&](const Zone& z) { return z.name == element_id; });
  if (it == ctx->zones.end()) return VIEW_INVALID_ID;
  if (data->type == ELEMENT_TEXT && !data->content.text) return VIEW_BAD_DATA;
  if (data->type == ELEMENT_MATRIX &&
      (!data->content.matrix.data || data->content.matrix.width <= 0 ||
       data->content.matrix.height <= 0)) {
    return VIEW_BAD_DATA;
  }

  ctx->widget->setElementData(element_id, *data);
  return VIEW_OK;
}

static ViewResult_t qt_render(ViewHandle_t handle) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  auto* ctx = static_cast<QtViewContext*>(handle);
  ctx->widget->update();
  return VIEW_OK;
}

static ViewResult_t qt_poll_input(ViewHandle_t handle, InputEvent_t* event) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  if (!event) return VIEW_BAD_DATA;

  auto* ctx = static_cast<QtViewContext*>(handle);
  InputEvent_t ev{};
  if (ctx->widget->popInput(ev)) {
    *event = ev;
    return VIEW_OK;
  }
  return VIEW_NO_EVENT;
}

static ViewResult_t qt_shutdown(ViewHandle_t handle) {
  if (!handle) return VIEW_NOT_INITIALIZED;

  auto* ctx = static_cast<QtViewContext*>(handle);
  if (ctx->window) {
    ctx->window->close();
    delete ctx->window;
  }
  delete ctx;
  return VIEW_OK;
}

const ViewInterface qt_view = {
    VIEW_INTERFACE_VERSION, qt_init,        qt_configure_zone, qt_draw_element,
    qt_render,              qt_poll_input,  qt_shutdown,
};
