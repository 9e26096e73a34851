#include "widget.hpp"

namespace shapes {

Widget::Widget(int size) : size_{size} {}

int Widget::area() const {
  return size_ * size_;
}

}  // namespace shapes
