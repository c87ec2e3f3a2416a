#include <mutex>
#include <vector>

#include "logging.hpp"

using namespace std;

namespace relaydeck
{
namespace internal
{
void initLogging(const shared_ptr<plog::IAppender>& appender)
{
    static mutex initMutex;
    static vector<shared_ptr<plog::IAppender>> retainedAppenders;

    if (appender == nullptr)
    {
        return;
    }

    lock_guard<mutex> lock(initMutex);
    for (const auto& retained : retainedAppenders)
    {
        if (retained == appender)
        {
            return;
        }
    }

    retainedAppenders.push_back(appender);
    if (plog::get() == nullptr)
    {
        plog::init(plog::debug, appender.get());
    }
    else
    {
        plog::get()->addAppender(appender.get());
    }
};
} // namespace internal
} // namespace relaydeck
