#include <ibc/router/router.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace ibc::router {

ibc::common::status_t router::add_route(const ibc::host::port_id_t& port_id,
                                        std::shared_ptr<module> app) {
  BOOST_OUTCOME_TRYV(ibc::host::validate(port_id));
  if (!app) {
    return ibc::common::make_error(
        ibc::common::error_code::module_not_found,
        fmt::format("no module given for port {}", port_id.value));
  }
  auto [it, inserted] = modules_.try_emplace(port_id.value, std::move(app));
  if (!inserted) {
    return ibc::common::make_error(
        ibc::common::error_code::route_exists,
        fmt::format("port {} is already bound", port_id.value));
  }
  spdlog::debug("Bound port {}", port_id.value);
  return outcome::success();
}

ibc::common::result_t<module*> router::route(
    const ibc::host::port_id_t& port_id) const {
  auto it = modules_.find(port_id.value);
  if (it == modules_.end()) {
    return ibc::common::make_error(
        ibc::common::error_code::module_not_found,
        fmt::format("no module bound to port {}", port_id.value));
  }
  return it->second.get();
}

bool router::has_route(const ibc::host::port_id_t& port_id) const {
  return modules_.contains(port_id.value);
}

ibc::common::error_t callback_error(const ibc::common::error_t& error) {
  if (error.code == ibc::common::error_code::module_callback_failed) {
    return error;
  }
  return ibc::common::wrap_error(ibc::common::error_code::module_callback_failed,
                                 error);
}

}  // namespace ibc::router
