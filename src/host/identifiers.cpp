#include <ibc/host/identifiers.hpp>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace ibc::host {

namespace {

constexpr auto kValidSpecialChars = std::string_view{"._+-#[]<>"};

using ibc::common::error_code;
using ibc::common::make_error;

}  // namespace

ibc::common::status_t validate_identifier_chars(const std::string_view id) {
  auto valid = std::ranges::all_of(id, [](const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 ||
           kValidSpecialChars.find(c) != std::string_view::npos;
  });
  if (!valid) {
    return make_error(error_code::invalid_identifier_character,
                      fmt::format("identifier '{}' has invalid characters", id));
  }
  return outcome::success();
}

ibc::common::status_t validate_identifier_length(const std::string_view id,
                                                 const uint64_t min,
                                                 const uint64_t max) {
  auto floor = std::max<uint64_t>(min, 1);
  if (id.size() < floor || id.size() > max) {
    return make_error(error_code::invalid_identifier_length,
                      fmt::format("identifier '{}' must be {}..{} characters",
                                  id, floor, max));
  }
  return outcome::success();
}

ibc::common::status_t validate_named_index(const std::string_view id,
                                           const std::string_view prefix) {
  auto invalid = [&] {
    return make_error(
        error_code::invalid_identifier_prefix,
        fmt::format("identifier '{}' is not of the form {}-N", id, prefix));
  };
  if (!id.starts_with(prefix) || id.size() < prefix.size() + 2 ||
      id[prefix.size()] != '-') {
    return invalid();
  }
  auto number = id.substr(prefix.size() + 1);
  if (number.size() > 1 && number.front() == '0') {
    return invalid();
  }
  auto parsed = uint64_t{};
  const auto* end = number.data() + number.size();
  auto [ptr, ec] = std::from_chars(number.data(), end, parsed);
  if (ec != std::errc{} || ptr != end) {
    return invalid();
  }
  return outcome::success();
}

ibc::common::status_t validate(const client_id_t& id) {
  BOOST_OUTCOME_TRYV(validate_identifier_chars(id.value));
  return validate_identifier_length(id.value, 9, 64);
}

ibc::common::status_t validate(const connection_id_t& id) {
  BOOST_OUTCOME_TRYV(validate_identifier_chars(id.value));
  BOOST_OUTCOME_TRYV(validate_identifier_length(id.value, 10, 64));
  return validate_named_index(id.value, kConnectionPrefix);
}

ibc::common::status_t validate(const channel_id_t& id) {
  BOOST_OUTCOME_TRYV(validate_identifier_chars(id.value));
  BOOST_OUTCOME_TRYV(validate_identifier_length(id.value, 8, 64));
  return validate_named_index(id.value, kChannelPrefix);
}

ibc::common::status_t validate(const port_id_t& id) {
  BOOST_OUTCOME_TRYV(validate_identifier_chars(id.value));
  return validate_identifier_length(id.value, 2, 128);
}

ibc::common::result_t<client_id_t> make_client_id(std::string value) {
  auto id = client_id_t{.value = std::move(value)};
  BOOST_OUTCOME_TRYV(validate(id));
  return id;
}

ibc::common::result_t<connection_id_t> make_connection_id(std::string value) {
  auto id = connection_id_t{.value = std::move(value)};
  BOOST_OUTCOME_TRYV(validate(id));
  return id;
}

ibc::common::result_t<channel_id_t> make_channel_id(std::string value) {
  auto id = channel_id_t{.value = std::move(value)};
  BOOST_OUTCOME_TRYV(validate(id));
  return id;
}

ibc::common::result_t<port_id_t> make_port_id(std::string value) {
  auto id = port_id_t{.value = std::move(value)};
  BOOST_OUTCOME_TRYV(validate(id));
  return id;
}

client_id_t format_client_id(const std::string_view client_type,
                             const uint64_t counter) {
  return client_id_t{.value = fmt::format("{}-{}", client_type, counter)};
}

connection_id_t format_connection_id(const uint64_t counter) {
  return connection_id_t{
      .value = fmt::format("{}-{}", kConnectionPrefix, counter)};
}

channel_id_t format_channel_id(const uint64_t counter) {
  return channel_id_t{.value = fmt::format("{}-{}", kChannelPrefix, counter)};
}

}  // namespace ibc::host
