#pragma once

/** \file event.hpp
 *  \brief Events and the per-candidate alias binding read by predicates.
 *
 * Ownership: events are immutable and shared via std::shared_ptr<const Event>. A
 * CapturedEvents snapshot is never mutated; with() returns an extended copy, so a snapshot
 * handed to an in-flight evaluation cannot change underneath it.
 *
 * Thread-safety: all const member functions are safe to call concurrently.
 */

#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "sase/error.hpp"
#include "sase/scalar.hpp"

namespace sase {

/** \brief One event from the stream: a type name and its attributes. */
class Event {
public:
    using attributes_t = std::unordered_map<std::string, Scalar>;

    Event(std::string type, attributes_t attributes);

    auto type() const noexcept -> const std::string& { return type_; }
    auto attributes() const noexcept -> const attributes_t& { return attributes_; }

    /** \brief Attribute value, or field_not_found if the event has no such attribute. */
    auto attr(std::string_view name) const -> std::expected<Scalar, core::error>;

private:
    std::string type_;
    attributes_t attributes_;
};

using EventPtr = std::shared_ptr<const Event>;

auto make_event(std::string type, Event::attributes_t attributes) -> EventPtr;

/** \brief Ordered alias -> event binding of one candidate match. */
class CapturedEvents {
public:
    CapturedEvents() = default;

    /** \brief Event bound to alias, or event_not_found if alias has no binding yet. */
    auto lookup(std::string_view alias) const -> std::expected<const Event*, core::error>;

    /**
     * \brief A new snapshot with alias bound to ev; this snapshot is left untouched.
     * \return invalid_argument if alias is empty, already bound, or ev is null
     */
    auto with(std::string alias, EventPtr ev) const -> std::expected<CapturedEvents, core::error>;

    auto contains(std::string_view alias) const noexcept -> bool;
    auto aliases() const -> std::vector<std::string>;
    auto size() const noexcept -> std::size_t { return bindings_.size(); }
    auto empty() const noexcept -> bool { return bindings_.empty(); }

private:
    std::vector<std::pair<std::string, EventPtr>> bindings_;
};

} // namespace sase
