#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>

namespace ingest_service {

class NameRegistry;

// Move-only claim on a final name; the name is freed when the handle dies.
class NameReservation {
public:
  NameReservation() = default;
  NameReservation(NameReservation&& other) noexcept
    : registry_(std::exchange(other.registry_, nullptr)), name_(std::move(other.name_)) {}
  NameReservation& operator=(NameReservation&& other) noexcept {
    if (this != &other) {
      reset();
      registry_ = std::exchange(other.registry_, nullptr);
      name_ = std::move(other.name_);
    }
    return *this;
  }
  NameReservation(const NameReservation&) = delete;
  NameReservation& operator=(const NameReservation&) = delete;
  ~NameReservation() { reset(); }

  const std::string& name() const { return name_; }
  explicit operator bool() const { return registry_ != nullptr; }

private:
  friend class NameRegistry;
  NameReservation(NameRegistry* registry, std::string name)
    : registry_(registry), name_(std::move(name)) {}
  void reset() noexcept;

  NameRegistry* registry_{nullptr};
  std::string name_;
};

// Final names held by queued or in-flight jobs.
class NameRegistry {
public:
  std::optional<NameReservation> reserve(const std::string& name) {
    std::lock_guard<std::mutex> lock{mtx_};
    if (!names_.insert(name).second) {
      return std::nullopt;
    }
    return NameReservation(this, name);
  }

  bool contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock{mtx_};
    return names_.count(name) != 0;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock{mtx_};
    return names_.size();
  }

private:
  friend class NameReservation;
  void free(const std::string& name) noexcept {
    std::lock_guard<std::mutex> lock{mtx_};
    names_.erase(name);
  }

  mutable std::mutex mtx_;
  std::unordered_set<std::string> names_;
};

inline void NameReservation::reset() noexcept {
  if (registry_) {
    registry_->free(name_);
    registry_ = nullptr;
  }
}

} // namespace ingest_service
