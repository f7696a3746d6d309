#include "toolsmith/tools/builtin/search.hpp"

#include "toolsmith/common/fs.hpp"

namespace toolsmith::tools {

common::Result<script::Value> SearchCapability::execute(const CapabilityArgs &args) {
  const std::string query = common::trim(args.at(0));
  return common::Result<script::Value>::success(
      script::Value::string("Search results for '" + query +
                            "' (offline stub):\n1. No search backend is configured.\n"
                            "2. Use scrape_url to fetch a known page instead."));
}

} // namespace toolsmith::tools
