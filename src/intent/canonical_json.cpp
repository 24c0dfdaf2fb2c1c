#include <keyward/intent/canonical_json.hpp>
#include <keyward/keccak/hash.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <memory>
#include <system_error>

namespace keyward::intent {

namespace {

std::string write_scalar(const Json::Value& value) {
  auto builder = Json::StreamWriterBuilder{};
  builder["indentation"] = "";
  builder["emitUTF8"] = true;
  return Json::writeString(builder, value);
}

/// Shortest round-trip digits laid out as ECMAScript Number::toString does,
/// so 0.1 stays "0.1" and 1e21 becomes "1e+21".
std::string write_number(const double value) {
  if (!std::isfinite(value)) {
    return "null";
  }
  if (value == 0) {
    return "0";
  }
  auto buffer = std::array<char, 64>{};
  auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(),
                                 value, std::chars_format::scientific);
  if (ec != std::errc{}) {
    return "null";
  }
  // d[.ddd]e[+-]XX
  auto text = std::string_view{buffer.data(),
                               static_cast<std::size_t>(end - buffer.data())};
  auto out = std::string{};
  if (text.front() == '-') {
    out.push_back('-');
    text.remove_prefix(1);
  }
  auto e_pos = text.find('e');
  auto digits = std::string{};
  for (const auto c : text.substr(0, e_pos)) {
    if (c != '.') {
      digits.push_back(c);
    }
  }
  auto k = static_cast<int>(digits.size());
  auto n = std::atoi(std::string{text.substr(e_pos + 1)}.c_str()) + 1;

  if (k <= n && n <= 21) {
    out += digits;
    out.append(static_cast<std::size_t>(n - k), '0');
  } else if (0 < n && n <= 21) {
    out += digits.substr(0, static_cast<std::size_t>(n));
    out.push_back('.');
    out += digits.substr(static_cast<std::size_t>(n));
  } else if (-6 < n && n <= 0) {
    out += "0.";
    out.append(static_cast<std::size_t>(-n), '0');
    out += digits;
  } else {
    out.push_back(digits.front());
    if (k > 1) {
      out.push_back('.');
      out += digits.substr(1);
    }
    out.push_back('e');
    out.push_back(n - 1 < 0 ? '-' : '+');
    out += std::to_string(std::abs(n - 1));
  }
  return out;
}

void write_canonical(const Json::Value& value, std::string& out) {
  switch (value.type()) {
    case Json::objectValue: {
      auto names = value.getMemberNames();
      std::ranges::sort(names);
      out.push_back('{');
      auto first = true;
      for (const auto& name : names) {
        if (!first) {
          out.push_back(',');
        }
        first = false;
        out += write_scalar(Json::Value{name});
        out.push_back(':');
        write_canonical(value[name], out);
      }
      out.push_back('}');
      break;
    }
    case Json::arrayValue: {
      out.push_back('[');
      for (Json::ArrayIndex i = 0; i < value.size(); ++i) {
        if (i > 0) {
          out.push_back(',');
        }
        write_canonical(value[i], out);
      }
      out.push_back(']');
      break;
    }
    case Json::realValue:
      out += write_number(value.asDouble());
      break;
    default:
      out += write_scalar(value);
      break;
  }
}

}  // namespace

std::string canonical_json(const Json::Value& value) {
  auto out = std::string{};
  write_canonical(value, out);
  return out;
}

keyward::schema::hash32_t canonical_json_hash(const Json::Value& value) {
  return keyward::keccak::hash(canonical_json(value));
}

std::optional<Json::Value> parse_json(const std::string_view& text,
                                      std::string& error) {
  auto builder = Json::CharReaderBuilder{};
  Json::CharReaderBuilder::strictMode(&builder.settings_);
  auto reader = std::unique_ptr<Json::CharReader>{builder.newCharReader()};
  auto value = Json::Value{};
  if (!reader->parse(text.data(), text.data() + text.size(), &value, &error)) {
    return std::nullopt;
  }
  return value;
}

}  // namespace keyward::intent
