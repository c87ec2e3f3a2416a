#pragma once

#include <plog/Log.h>
#include <noscrypt.h>

/*
* @brief Logs an error message with the function name and line number where a noscrypt call
* failed.  Successful results are not logged.
*/
#define NC_LOG_ERROR(result) relaydeck::internal::printNoscryptError(result, __func__, __LINE__)

namespace relaydeck
{
namespace internal
{
void printNoscryptError(NCResult result, const char* func, int line);
} // namespace internal
} // namespace relaydeck
