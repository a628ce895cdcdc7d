#ifndef LIBCIRRUS_DEBUG_H_
#define LIBCIRRUS_DEBUG_H_

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <list>
#include <mutex>
#include <ostream>
#include <string>
#include <unordered_set>
#include <vector>

namespace Cirrus {

/**
 * Global thread-safe debug printing
 * Each instance names a module (e.g. "UploadSession") that can be filtered on.
 * Output goes to any number of sinks (streams or log files), each with its own level.
 */
class Debug
{
public:

    /** Debug verbosity */
    enum class Level
    {
        /** Only show Error()s */         ERRORS,
        /** Also show each request */     BACKEND,
        /** Show upload progress */       INFO,
        /** Prefix thread, time, object */ DETAILS,
        LAST = DETAILS
    };

    /** Returns the display name of a level */
    static const char* LevelName(Level level);

    /** Returns the highest level of all sinks */
    static Level GetLevel(){ return sMaxLevel.load(); }

    /** Sets the level of every sink - THREAD SAFE */
    static void SetLevel(Level level);

    /** Sets the level of the sink for the given stream - THREAD SAFE */
    static void SetLevel(Level level, const std::ostream& stream);

    /**
     * Sets the modules that non-error output is shown for - THREAD SAFE
     * @param filters comma-separated module names, empty for all
     */
    static void SetFilters(const std::string& filters);

    /** Adds a sink for the given stream, at ERRORS with no filters - THREAD SAFE */
    static void AddStream(std::ostream& stream);

    /** Removes the sink for the given stream - THREAD SAFE */
    static void RemoveStream(const std::ostream& stream);

    /**
     * Adds a sink appending to the given file - THREAD SAFE
     * Takes the level and filters of the first sink, if any
     * @return false if the file could not be opened
     */
    static bool AddLogFile(const std::string& path);

    /**
     * @param module name of the module printing, used for filters
     * @param addr address of the printing object (or nullptr)
     */
    explicit Debug(const std::string& module, const void* addr) noexcept :
        mAddr(addr), mModule(module) { }

    /** Function to send debug text to a given output stream */
    using StreamFunc = std::function<void (std::ostream&)>;

    /** Prints func if any sink is at ERRORS or above */
    inline void Error(const StreamFunc& strfunc) { Print(strfunc, Level::ERRORS); }

    /** Prints func if any sink is at BACKEND or above */
    inline void Backend(const StreamFunc& strfunc)
    {
        if (sMaxLevel.load() >= Level::BACKEND) Print(strfunc, Level::BACKEND);
    }

    /** Prints func if any sink is at INFO or above */
    inline void Info(const StreamFunc& strfunc)
    {
        // the usual case of debug off costs one atomic load
        if (sMaxLevel.load() >= Level::INFO) Print(strfunc, Level::INFO);
    }

    /** Syntactic sugar to send the current function name and strcode to debug (error) */
    #define DBG_ERROR(debug, strcode) { const char* const myfname { __func__ }; \
        debug.Error([&](std::ostream& str){ str << myfname << strcode; }); }

    /** Syntactic sugar to send the current function name and strcode to debug (backend) */
    #define DBG_BACKEND(debug, strcode) { const char* const myfname { __func__ }; \
        debug.Backend([&](std::ostream& str){ str << myfname << strcode; }); }

    /** Syntactic sugar to send the current function name and strcode to debug (info) */
    #define DBG_INFO(debug, strcode) { const char* const myfname { __func__ }; \
        debug.Info([&](std::ostream& str){ str << myfname << strcode; }); }

    #define DDBG_ERROR(strfunc) DBG_ERROR(debug, strfunc)
    #define MDBG_ERROR(strfunc) DBG_ERROR(mDebug, strfunc)

    #define MDBG_BACKEND(strfunc) DBG_BACKEND(mDebug, strfunc)

    #define DDBG_INFO(strfunc) DBG_INFO(debug, strfunc)
    #define MDBG_INFO(strfunc) DBG_INFO(mDebug, strfunc)

private:

    /** Formats the line once and writes it to each sink that accepts it - THREAD SAFE */
    void Print(const StreamFunc& strfunc, Level level);

    /** A destination for debug output */
    struct Sink
    {
        explicit Sink(std::ostream& str) : stream(&str) { }

        /** Returns true if this sink shows output of the level from the module */
        [[nodiscard]] bool Accepts(Level lvl, const std::string& module) const;

        std::ostream* stream;
        Level level { Level::ERRORS };
        std::unordered_set<std::string> filters;
    };

    /** Recomputes sMaxLevel, must hold sMutex */
    static void UpdateMaxLevel();

    /** The address of the object printing */
    const void* const mAddr;
    /** The module name to print and filter on */
    const std::string mModule;

    static std::mutex sMutex;
    /** When the program started, for DETAILS */
    static const std::chrono::steady_clock::time_point sStart;

    static std::vector<Sink> sSinks;
    /** Log files we own, a list so sink pointers stay valid */
    static std::list<std::ofstream> sFiles;

    /** Highest level of all sinks, checked before taking the lock */
    static std::atomic<Level> sMaxLevel;
};

} // namespace Cirrus

#endif // LIBCIRRUS_DEBUG_H_
