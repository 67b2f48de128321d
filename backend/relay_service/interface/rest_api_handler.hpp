#pragma once
#include "application/task_manager.hpp"
#include "common/restful/rest_api_handler_base.hpp"
#include "interface/download_registry.hpp"
#include <memory>
#include <nlohmann/json.hpp>

namespace relay_service {

// GET    /api/status
// POST   /api/downloads          {"url": "...", "fallback": false}
// GET    /api/downloads/<id>
// DELETE /api/downloads/<id>
class RestApiHandler : public common::RestApiHandlerBase {
public:
  RestApiHandler(TaskManager& manager, DownloadRegistry& registry);

protected:
  common::StringResponse doHandleRequest(common::StringRequest&& req) override;

private:
  common::StringResponse handleStatus();
  common::StringResponse handleSubmit(const nlohmann::json& body);
  common::StringResponse handleGetDownload(const std::string& id);
  common::StringResponse handleDeleteDownload(const std::string& id);

  TaskManager& manager_;
  DownloadRegistry& registry_;
};

} // namespace relay_service
