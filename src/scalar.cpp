#include "sase/scalar.hpp"

#include <array>
#include <charconv>
#include <string>

namespace sase {

namespace {
    struct kind_visitor {
        auto operator()(std::monostate) const noexcept -> std::string_view { return "null"; }
        auto operator()(double) const noexcept -> std::string_view { return "number"; }
        auto operator()(const std::string&) const noexcept -> std::string_view { return "string"; }
        auto operator()(bool) const noexcept -> std::string_view { return "bool"; }
    };

    inline std::string number_text(double d) {
        std::array<char, 64> buf{};
        auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), d);
        if (ec != std::errc()) return "nan"; // 64 bytes always fits the shortest form
        return std::string(buf.data(), ptr);
    }

    inline std::string quoted(const std::string& s) {
        std::string out;
        out.reserve(s.size() + 2);
        out.push_back('"');
        for (char c : s) {
            if (c == '"' || c == '\\') out.push_back('\\');
            out.push_back(c);
        }
        out.push_back('"');
        return out;
    }
}

auto structurally_equal(const Scalar& a, const Scalar& b) noexcept -> bool {
  if (a.index() != b.index()) return false;
  return a == b; // same alternative: compares payloads, double uses IEEE ==
}

auto as_number(const Scalar& s) -> std::expected<double, core::error> {
  if (const auto* d = std::get_if<double>(&s)) return *d;
  return std::unexpected(core::error{
      core::error_code::type_mismatch,
      std::string("expected number, got ") + std::string(kind_name(s)),
      "scalar"});
}

auto kind_name(const Scalar& s) noexcept -> std::string_view {
  return std::visit(kind_visitor{}, s);
}

auto to_query_text(const Scalar& s) -> std::string {
  if (std::holds_alternative<std::monostate>(s)) {
    return "null";
  } else if (const auto* d = std::get_if<double>(&s)) {
    return number_text(*d);
  } else if (const auto* str = std::get_if<std::string>(&s)) {
    return quoted(*str);
  } else if (const auto* b = std::get_if<bool>(&s)) {
    return *b ? "true" : "false";
  }
  return {};
}

} // namespace sase
