#ifndef CSVEXPR_LAZY_SLOT_H
#define CSVEXPR_LAZY_SLOT_H

#include <memory>

namespace csvexpr {

// Owns a resource built on first use. Copies start empty, so a copied
// expression never shares a parser or writer with its source.
//
// Not thread-safe: the owner is confined to one thread at a time.
template <typename T> class LazySlot {
public:
  LazySlot() = default;
  LazySlot(const LazySlot&) {}
  LazySlot& operator=(const LazySlot&) {
    value_.reset();
    return *this;
  }
  LazySlot(LazySlot&&) noexcept = default;
  LazySlot& operator=(LazySlot&&) noexcept = default;

  // Returns the resource, building it with factory() the first time.
  // factory returns std::unique_ptr<T>; if it throws, the slot stays empty.
  template <typename Factory> T& get(Factory&& factory) const {
    if (!value_)
      value_ = factory();
    return *value_;
  }

  bool initialized() const { return value_ != nullptr; }
  void reset() { value_.reset(); }

private:
  mutable std::unique_ptr<T> value_;
};

} // namespace csvexpr

#endif // CSVEXPR_LAZY_SLOT_H
