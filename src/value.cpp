#include "sase/value.hpp"

#include <utility>

namespace sase {

FieldValue::FieldValue(std::string alias, std::string field)
    : alias_(std::move(alias)), field_(std::move(field)) {}

auto FieldValue::value(const CapturedEvents& evs) const -> std::expected<Scalar, core::error> {
  auto ev = evs.lookup(alias_);
  if (!ev) return std::unexpected(ev.error());
  auto v = (*ev)->attr(field_);
  if (!v) {
    return std::unexpected(core::error{
        v.error().code, query_text() + ": " + v.error().message, "value.field"});
  }
  return v;
}

auto FieldValue::query_text() const -> std::string {
  return alias_ + "." + field_;
}

auto FieldValue::used_aliases() const -> std::vector<std::string> {
  return {alias_};
}

LiteralValue::LiteralValue(Scalar v) : value_(std::move(v)) {}

auto LiteralValue::value(const CapturedEvents& /*evs*/) const -> std::expected<Scalar, core::error> {
  return value_;
}

auto LiteralValue::query_text() const -> std::string {
  return to_query_text(value_);
}

auto LiteralValue::used_aliases() const -> std::vector<std::string> {
  return {};
}

auto make_field(std::string alias, std::string field) -> std::expected<ValueExprPtr, core::error> {
  if (alias.empty() || field.empty()) {
    return std::unexpected(core::error{
        core::error_code::invalid_argument, "field access needs an alias and a field name", "value.make_field"});
  }
  return std::make_shared<FieldValue>(std::move(alias), std::move(field));
}

auto make_literal(Scalar v) -> ValueExprPtr {
  return std::make_shared<LiteralValue>(std::move(v));
}

} // namespace sase
