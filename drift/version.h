#pragma once

namespace Drift {

constexpr const char* TOOL_NAME = "s3drift";
constexpr const char* TOOL_VERSION = "0.3.0";

} // namespace Drift
