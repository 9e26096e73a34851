#pragma once

namespace shapes {

class Widget {
 public:
  explicit Widget(int size);
  int area() const;

 private:
  int size_;
};

constexpr int kMaxWidgets = 16;

}  // namespace shapes
