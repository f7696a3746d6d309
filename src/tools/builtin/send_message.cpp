#include "toolsmith/tools/builtin/send_message.hpp"

namespace toolsmith::tools {

SendMessageCapability::SendMessageCapability(const std::uint64_t timeout_ms)
    : client_(timeout_ms) {}

common::Result<script::Value> SendMessageCapability::execute(const CapabilityArgs &args) {
  if (args.size() != 2) {
    return common::Result<script::Value>::failure(common::ErrorCode::ArityMismatch,
                                                  "send_message expects (url, message)");
  }
  auto response = client_.send_text(args[0], args[1]);
  if (!response.ok()) {
    return common::Result<script::Value>::failure(response.status());
  }
  return common::Result<script::Value>::success(script::Value::string(response.value()));
}

} // namespace toolsmith::tools
