#pragma once

#include <memory>

#include <plog/Init.h>
#include <plog/Log.h>

namespace relaydeck
{
namespace internal
{
/**
 * @brief Attaches the appender to the default plog logger, initializing the logger on first use.
 * @remark plog holds appenders by raw pointer, so the appender is retained for the lifetime of the
 * process.  Attaching the same appender twice has no effect.
 */
void initLogging(const std::shared_ptr<plog::IAppender>& appender);
} // namespace internal
} // namespace relaydeck
