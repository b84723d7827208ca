#include <ibc/connection/version.hpp>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <iterator>

namespace ibc::connection {

namespace {

using ibc::common::error_code;
using ibc::common::make_error;

const version_t* find_by_identifier(const std::vector<version_t>& versions,
                                    const std::string_view identifier) {
  auto it = std::find_if(
      std::begin(versions), std::end(versions),
      [&](const version_t& v) { return v.identifier == identifier; });
  return it == std::end(versions) ? nullptr : &*it;
}

std::vector<std::string> feature_intersection(const version_t& lhs,
                                              const version_t& rhs) {
  auto out = std::vector<std::string>{};
  std::copy_if(std::begin(lhs.features), std::end(lhs.features),
               std::back_inserter(out), [&](const std::string& feature) {
                 return verify_supported_feature(rhs, feature);
               });
  return out;
}

}  // namespace

version_t default_version() {
  return version_t{.identifier = std::string{kDefaultVersionIdentifier},
                   .features = {std::string{kOrderOrdered},
                                std::string{kOrderUnordered}}};
}

std::vector<version_t> compatible_versions() {
  return {default_version()};
}

ibc::common::status_t validate_version(const version_t& version) {
  if (version.identifier.empty()) {
    return make_error(error_code::invalid_version,
                      "version identifier cannot be blank");
  }
  for (const auto& feature : version.features) {
    if (feature.empty()) {
      return make_error(error_code::invalid_version,
                        fmt::format("version {} has a blank feature",
                                    version.identifier));
    }
  }
  return outcome::success();
}

bool verify_supported_feature(const version_t& version,
                              const std::string_view feature) {
  return std::find(std::begin(version.features), std::end(version.features),
                   feature) != std::end(version.features);
}

ibc::common::status_t verify_proposed_version(
    const version_t& proposed,
    const std::vector<version_t>& supported) {
  BOOST_OUTCOME_TRYV(validate_version(proposed));
  const auto* known = find_by_identifier(supported, proposed.identifier);
  if (known == nullptr) {
    return make_error(error_code::version_not_supported,
                      fmt::format("version identifier {} is not supported",
                                  proposed.identifier));
  }
  if (proposed.features.empty()) {
    return make_error(error_code::version_not_supported,
                      fmt::format("version {} proposes no features",
                                  proposed.identifier));
  }
  for (const auto& feature : proposed.features) {
    if (!verify_supported_feature(*known, feature)) {
      return make_error(error_code::version_not_supported,
                        fmt::format("feature {} is not supported by version "
                                    "{}",
                                    feature, proposed.identifier));
    }
  }
  return outcome::success();
}

bool is_supported_version(const version_t& version,
                          const std::vector<version_t>& supported) {
  return static_cast<bool>(verify_proposed_version(version, supported));
}

ibc::common::result_t<version_t> pick_version(
    const std::vector<version_t>& supported,
    const std::vector<version_t>& counterparty) {
  auto intersection = std::vector<version_t>{};
  for (const auto& ours : supported) {
    const auto* theirs = find_by_identifier(counterparty, ours.identifier);
    if (theirs == nullptr) {
      continue;
    }
    auto features = feature_intersection(ours, *theirs);
    if (features.empty()) {
      continue;
    }
    intersection.push_back(
        version_t{.identifier = ours.identifier, .features = features});
  }
  if (intersection.empty()) {
    return make_error(
        error_code::no_common_version,
        fmt::format("no common version among {} counterparty versions",
                    counterparty.size()));
  }
  std::sort(std::begin(intersection), std::end(intersection),
            [](const version_t& lhs, const version_t& rhs) {
              return lhs.identifier < rhs.identifier;
            });
  return intersection.front();
}

}  // namespace ibc::connection
