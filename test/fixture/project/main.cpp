#include "widget.hpp"

int main() {
  shapes::Widget w{3};
  return w.area() > shapes::kMaxWidgets;
}
