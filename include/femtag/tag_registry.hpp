#pragma once

#include "femtag/error.hpp"
#include "femtag/log.hpp"
#include "femtag/tag_types.hpp"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>
#include <vector>

namespace femtag {

template <typename T>
class TagRegistry;

// Entity-side half of the tagging contract. T is the kind's base class and
// must derive from Tagged<T>. The registry owns the tag value; the entity only
// caches it, and the registry rewrites it in place on every renumbering.
template <typename T>
class Tagged {
public:
  Tagged(const Tagged&) = delete;
  Tagged& operator=(const Tagged&) = delete;
  Tagged(Tagged&&) = delete;
  Tagged& operator=(Tagged&&) = delete;

  // kInvalidTag once detached.
  Tag tag() const { return tag_; }
  CreationOrder creation_order() const { return creation_order_; }
  bool is_registered() const { return registry_ != nullptr; }
  TagRegistry<T>* registry() const { return registry_; }

  // Why the registry refused this entity at construction, or Success.
  ErrorCode admission() const { return admission_; }

  ErrorCode remove();

protected:
  explicit Tagged(TagRegistry<T>& registry)
      : Tagged(registry, ErrorCode::Success) {}

  // A kind whose own rules refuse the entity (a taken user name) passes the
  // failure here; the entity is then left detached.
  Tagged(TagRegistry<T>& registry, ErrorCode admission);
  ~Tagged();

private:
  void detach() {
    registry_ = nullptr;
    tag_ = kInvalidTag;
  }

  TagRegistry<T>* registry_ = nullptr;
  Tag tag_ = kInvalidTag;
  CreationOrder creation_order_ = 0;
  ErrorCode admission_ = ErrorCode::Success;

  friend class TagRegistry<T>;
};

// Dense sequential tag allocator for one entity kind.
//
// Live entities are kept in creation order, and the entity at position i
// always carries tag start_tag() + i. Because of that, a tag lookup is a
// subtraction and a bounds check.
//
// Not thread-safe; callers serialize access per registry.
template <typename T>
class TagRegistry {
public:
  using entity_type = T;

  TagRegistry() = default;

  TagRegistry(const TagRegistry&) = delete;
  TagRegistry& operator=(const TagRegistry&) = delete;
  TagRegistry(TagRegistry&&) = delete;
  TagRegistry& operator=(TagRegistry&&) = delete;

  ~TagRegistry() {
    reset();
  }

  static constexpr EntityKind kind() { return kind_of_v<T>; }

  // Returns kInvalidTag and leaves the entity detached when the next tag
  // would pass kMaxTag; entity.admission() then reports OutOfRange.
  Tag add(Tagged<T>& entity) {
    assert(entity.registry_ == nullptr);
    if (!has_room(start_, live_.size() + 1)) {
      log::error("{} registry: no tag left after {}", entity_kind_name(kind()), kMaxTag);
      entity.admission_ = ErrorCode::OutOfRange;
      return kInvalidTag;
    }
    entity.admission_ = ErrorCode::Success;
    entity.registry_ = this;
    entity.creation_order_ = next_order_++;
    entity.tag_ = tag_at(live_.size());
    live_.push_back(&entity);
    return entity.tag_;
  }

  ErrorCode remove(Tag tag) {
    const std::size_t pos = position_of(tag);
    if (pos == kNpos) {
      log::warn("{} registry: no live entity with tag {}", entity_kind_name(kind()), tag);
      return ErrorCode::NotFound;
    }
    erase_at(pos);
    return ErrorCode::Success;
  }

  ErrorCode remove(const Tagged<T>& entity) {
    const std::size_t pos = locate(entity);
    if (pos == kNpos) {
      log::warn("{} registry: entity is not registered here", entity_kind_name(kind()));
      return ErrorCode::NotFound;
    }
    erase_at(pos);
    return ErrorCode::Success;
  }

  // Always renumbers every live entity, whether new_start is above, below or
  // equal to the current start.
  ErrorCode set_start(Tag new_start) {
    if (new_start <= 0) {
      log::warn("{} registry: start tag must be positive, got {}", entity_kind_name(kind()), new_start);
      return ErrorCode::InvalidArgument;
    }
    // Leave room for the live range plus the next add.
    if (!has_room(new_start, live_.size() + 1)) {
      log::warn("{} registry: start tag {} leaves no room for {} live entities",
                entity_kind_name(kind()), new_start, live_.size());
      return ErrorCode::OutOfRange;
    }
    start_ = new_start;
    renumber_from(0);
    return ErrorCode::Success;
  }

  void reset() {
    for (Tagged<T>* entity : live_) {
      entity->detach();
    }
    live_.clear();
    start_ = kDefaultStartTag;
    next_order_ = 0;
  }

  void clear_all() {
    reset();
  }

  bool contains(Tag tag) const {
    return position_of(tag) != kNpos;
  }

  T* try_get(Tag tag) {
    const std::size_t pos = position_of(tag);
    if (pos == kNpos) {
      return nullptr;
    }
    return downcast(live_[pos]);
  }

  const T* try_get(Tag tag) const {
    const std::size_t pos = position_of(tag);
    if (pos == kNpos) {
      return nullptr;
    }
    return downcast(live_[pos]);
  }

  T& get(Tag tag) {
    auto* ptr = try_get(tag);
    assert(ptr != nullptr);
    return *ptr;
  }

  const T& get(Tag tag) const {
    const auto* ptr = try_get(tag);
    assert(ptr != nullptr);
    return *ptr;
  }

  // First live entity in creation order for which pred returns true.
  template <typename Pred>
  T* find_if(Pred&& pred) {
    for (Tagged<T>* entity : live_) {
      T* typed = downcast(entity);
      if (pred(static_cast<const T&>(*typed))) {
        return typed;
      }
    }
    return nullptr;
  }

  template <typename Pred>
  const T* find_if(Pred&& pred) const {
    for (const Tagged<T>* entity : live_) {
      const T* typed = downcast(entity);
      if (pred(*typed)) {
        return typed;
      }
    }
    return nullptr;
  }

  // Visits live entities in creation order. fn must not add or remove.
  template <typename Fn>
  void each(Fn&& fn) {
    const std::size_t count = live_.size();
    for (std::size_t i = 0; i < count; ++i) {
      fn(*downcast(live_[i]));
    }
  }

  template <typename Fn>
  void each(Fn&& fn) const {
    const std::size_t count = live_.size();
    for (std::size_t i = 0; i < count; ++i) {
      fn(static_cast<const T&>(*downcast(live_[i])));
    }
  }

  std::vector<Tag> tags() const {
    std::vector<Tag> out;
    out.reserve(live_.size());
    for (std::size_t i = 0; i < live_.size(); ++i) {
      out.push_back(tag_at(i));
    }
    return out;
  }

  std::size_t size() const { return live_.size(); }
  bool empty() const { return live_.empty(); }
  Tag start_tag() const { return start_; }
  // kInvalidTag when the tag space is exhausted.
  Tag next_tag() const {
    return has_room(start_, live_.size() + 1) ? tag_at(live_.size()) : kInvalidTag;
  }
  CreationOrder next_creation_order() const { return next_order_; }

private:
  static constexpr std::size_t kNpos = std::numeric_limits<std::size_t>::max();

  static T* downcast(Tagged<T>* entity) {
    static_assert(std::is_base_of_v<Tagged<T>, T>, "T must derive from Tagged<T>.");
    return static_cast<T*>(entity);
  }

  static const T* downcast(const Tagged<T>* entity) {
    static_assert(std::is_base_of_v<Tagged<T>, T>, "T must derive from Tagged<T>.");
    return static_cast<const T*>(entity);
  }

  static bool has_room(Tag start, std::size_t count) {
    return static_cast<std::int64_t>(start) + static_cast<std::int64_t>(count) - 1 <= kMaxTag;
  }

  Tag tag_at(std::size_t pos) const {
    return static_cast<Tag>(start_ + static_cast<Tag>(pos));
  }

  std::size_t position_of(Tag tag) const {
    if (tag < start_) {
      return kNpos;
    }
    const auto pos = static_cast<std::size_t>(tag - start_);
    if (pos >= live_.size()) {
      return kNpos;
    }
    assert(live_[pos]->tag_ == tag);
    return pos;
  }

  // By address; the cached tag is only a hint.
  std::size_t locate(const Tagged<T>& entity) const {
    if (entity.registry_ != this) {
      return kNpos;
    }
    const std::size_t pos = position_of(entity.tag_);
    if (pos != kNpos && live_[pos] == &entity) {
      return pos;
    }
    const auto it = std::find(live_.begin(), live_.end(), &entity);
    if (it == live_.end()) {
      return kNpos;
    }
    return static_cast<std::size_t>(it - live_.begin());
  }

  void erase_at(std::size_t pos) {
    assert(pos < live_.size());
    Tagged<T>* gone = live_[pos];
    live_.erase(live_.begin() + static_cast<std::ptrdiff_t>(pos));
    gone->detach();
    renumber_from(pos);
  }

  void renumber_from(std::size_t pos) {
    for (std::size_t i = pos; i < live_.size(); ++i) {
      live_[i]->tag_ = tag_at(i);
    }
    log::debug("{} registry: renumbered {} entities from position {}, start tag {}",
               entity_kind_name(kind()), live_.size() - pos, pos, start_);
  }

  std::vector<Tagged<T>*> live_;
  Tag start_ = kDefaultStartTag;
  CreationOrder next_order_ = 0;

  friend class Tagged<T>;
};

template <typename T>
Tagged<T>::Tagged(TagRegistry<T>& registry, ErrorCode admission)
    : admission_(admission) {
  if (ok(admission_)) {
    registry.add(*this);
  }
}

template <typename T>
Tagged<T>::~Tagged() {
  if (registry_ == nullptr) {
    return;
  }
  const std::size_t pos = registry_->locate(*this);
  if (pos != TagRegistry<T>::kNpos) {
    registry_->erase_at(pos);
  }
}

template <typename T>
ErrorCode Tagged<T>::remove() {
  if (registry_ == nullptr) {
    log::warn("{}: entity is already detached", entity_kind_name(kind_of_v<T>));
    return ErrorCode::NotFound;
  }
  return registry_->remove(*this);
}

} // namespace femtag
