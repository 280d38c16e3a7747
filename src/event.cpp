#include "sase/event.hpp"

#include <algorithm>

namespace sase {

Event::Event(std::string type, attributes_t attributes)
    : type_(std::move(type)), attributes_(std::move(attributes)) {}

auto Event::attr(std::string_view name) const -> std::expected<Scalar, core::error> {
  auto it = attributes_.find(std::string(name));
  if (it == attributes_.end()) {
    return std::unexpected(core::error{
        core::error_code::field_not_found,
        "event '" + type_ + "' has no attribute '" + std::string(name) + "'",
        "event.attr"});
  }
  return it->second;
}

auto make_event(std::string type, Event::attributes_t attributes) -> EventPtr {
  return std::make_shared<Event>(std::move(type), std::move(attributes));
}

auto CapturedEvents::lookup(std::string_view alias) const -> std::expected<const Event*, core::error> {
  auto it = std::find_if(bindings_.begin(), bindings_.end(),
                         [&](const auto& b) { return b.first == alias; });
  if (it == bindings_.end()) {
    return std::unexpected(core::error{
        core::error_code::event_not_found,
        "no event captured for alias '" + std::string(alias) + "'",
        "captured_events"});
  }
  return it->second.get();
}

auto CapturedEvents::with(std::string alias, EventPtr ev) const -> std::expected<CapturedEvents, core::error> {
  if (alias.empty() || !ev) {
    return std::unexpected(core::error{
        core::error_code::invalid_argument, "alias and event must be non-empty", "captured_events.with"});
  }
  if (contains(alias)) {
    return std::unexpected(core::error{
        core::error_code::invalid_argument, "alias '" + alias + "' is already bound", "captured_events.with"});
  }
  CapturedEvents next;
  next.bindings_.reserve(bindings_.size() + 1);
  next.bindings_.assign(bindings_.begin(), bindings_.end());
  next.bindings_.emplace_back(std::move(alias), std::move(ev));
  return next;
}

auto CapturedEvents::contains(std::string_view alias) const noexcept -> bool {
  return std::any_of(bindings_.begin(), bindings_.end(),
                     [&](const auto& b) { return b.first == alias; });
}

auto CapturedEvents::aliases() const -> std::vector<std::string> {
  std::vector<std::string> out;
  out.reserve(bindings_.size());
  for (const auto& b : bindings_) out.push_back(b.first);
  return out;
}

} // namespace sase
