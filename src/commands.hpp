#pragma once
#include <string>
#include <vector>

namespace semsearch {

int cmd_init(const std::string& config_path);
int cmd_status(const std::string& config_path);
int cmd_ingest(const std::string& config_path, const std::vector<std::string>& args);
int cmd_query(const std::string& config_path, const std::vector<std::string>& args);
int cmd_serve(const std::string& config_path, const std::vector<std::string>& args);

} // namespace semsearch
