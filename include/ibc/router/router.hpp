#pragma once

#include <ibc/router/module.hpp>

#include <map>
#include <memory>
#include <string>

namespace ibc::router {

/// Port id to module binding. A port is bound once.
class router final {
 public:
  ibc::common::status_t add_route(const ibc::host::port_id_t& port_id,
                                  std::shared_ptr<module> app);

  ibc::common::result_t<module*> route(
      const ibc::host::port_id_t& port_id) const;

  bool has_route(const ibc::host::port_id_t& port_id) const;

 private:
  std::map<std::string, std::shared_ptr<module>> modules_;
};

/// Re-raise a module failure as `module_callback_failed`, keeping its log.
ibc::common::error_t callback_error(const ibc::common::error_t& error);

}  // namespace ibc::router
