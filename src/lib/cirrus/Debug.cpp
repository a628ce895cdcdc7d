
#include <algorithm>
#include <sstream>
#include <thread>
#include <utility>

#include "Debug.hpp"
#include "StringUtil.hpp"

using std::chrono::steady_clock;

namespace Cirrus {

std::mutex Debug::sMutex;
const steady_clock::time_point Debug::sStart { steady_clock::now() };
std::vector<Debug::Sink> Debug::sSinks;
std::list<std::ofstream> Debug::sFiles;
std::atomic<Debug::Level> Debug::sMaxLevel { Debug::Level::ERRORS };

/*****************************************************/
const char* Debug::LevelName(Level level)
{
    switch (level)
    {
        case Level::ERRORS: return "ERROR";
        case Level::BACKEND: return "BACKEND";
        case Level::INFO: return "INFO";
        case Level::DETAILS: return "DETAILS";
        default: return "?";
    }
}

/*****************************************************/
bool Debug::Sink::Accepts(Level lvl, const std::string& module) const
{
    if (lvl > level) return false;

    // errors are never filtered
    return lvl == Level::ERRORS || filters.empty() || filters.count(module) != 0;
}

/*****************************************************/
void Debug::UpdateMaxLevel()
{
    Level maxLevel { Level::ERRORS };
    for (const Sink& sink : sSinks)
        maxLevel = std::max(maxLevel, sink.level);
    sMaxLevel.store(maxLevel);
}

/*****************************************************/
void Debug::SetLevel(Level level)
{
    const std::lock_guard<decltype(sMutex)> lock(sMutex);

    for (Sink& sink : sSinks) sink.level = level;
    UpdateMaxLevel();
}

/*****************************************************/
void Debug::SetLevel(Level level, const std::ostream& stream)
{
    const std::lock_guard<decltype(sMutex)> lock(sMutex);

    for (Sink& sink : sSinks)
        if (sink.stream == &stream) sink.level = level;
    UpdateMaxLevel();
}

/*****************************************************/
void Debug::SetFilters(const std::string& filters)
{
    const StringUtil::StringList modules { StringUtil::splitList(filters, ',') };

    const std::lock_guard<decltype(sMutex)> lock(sMutex);

    for (Sink& sink : sSinks)
        sink.filters = decltype(Sink::filters)(modules.cbegin(), modules.cend());
}

/*****************************************************/
void Debug::AddStream(std::ostream& stream)
{
    const std::lock_guard<decltype(sMutex)> lock(sMutex);

    sSinks.emplace_back(stream);
    UpdateMaxLevel();
}

/*****************************************************/
void Debug::RemoveStream(const std::ostream& stream)
{
    const std::lock_guard<decltype(sMutex)> lock(sMutex);

    sSinks.erase(std::remove_if(sSinks.begin(), sSinks.end(),
        [&](const Sink& sink){ return sink.stream == &stream; }), sSinks.end());
    UpdateMaxLevel();
}

/*****************************************************/
bool Debug::AddLogFile(const std::string& path)
{
    std::ofstream file(path, std::ofstream::out | std::ofstream::app);
    if (!file.is_open()) return false;

    const std::lock_guard<decltype(sMutex)> lock(sMutex);

    sFiles.push_back(std::move(file));

    Sink sink(sFiles.back());
    if (!sSinks.empty())
    {
        sink.level = sSinks.front().level;
        sink.filters = sSinks.front().filters;
    }
    sSinks.push_back(std::move(sink));

    UpdateMaxLevel();
    return true;
}

/*****************************************************/
void Debug::Print(const StreamFunc& strfunc, Level level)
{
    std::ostringstream line;
    line << mModule << ": "; strfunc(line);
    const std::string text { line.str() };

    const std::lock_guard<decltype(sMutex)> lock(sMutex);

    for (const Sink& sink : sSinks)
    {
        if (!sink.Accepts(level, mModule)) continue;
        std::ostream& stream { *sink.stream };

        if (sink.level >= Level::DETAILS)
        {
            const std::chrono::duration<double> elapsed { steady_clock::now() - sStart };
            stream << "[" << LevelName(level) << "] tid:" << std::this_thread::get_id()
                   << " time:" << elapsed.count() << " ";

            if (mAddr != nullptr) stream << "obj:" << mAddr << " ";
            else stream << "static ";
        }

        stream << text << std::endl;
    }
}

} // namespace Cirrus
