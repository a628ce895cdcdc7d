#ifndef LIBCIRRUS_BASEOPTIONS_H_
#define LIBCIRRUS_BASEOPTIONS_H_

#include <filesystem>
#include <list>
#include <map>
#include <string>
#include <vector>

#include "BaseException.hpp"

namespace Cirrus {

/**
 * Common user options, from the command line or config files
 * A program adds its own flags and options by overriding AddFlag/AddOption
 */
class BaseOptions
{
public:

    virtual ~BaseOptions() = default;

    /** Base class for all command line and config file errors */
    class Exception : public BaseException {
        using BaseException::BaseException; };

    /** Thrown by -h/--help, the caller prints the help text */
    class ShowHelpException : public Exception { public:
        ShowHelpException() : Exception("help") {} };

    /** Thrown by -V/--version, the caller prints the version */
    class ShowVersionException : public Exception { public:
        ShowVersionException() : Exception("version") {} };

    /** Thrown for malformed arguments, e.g. a value without a key */
    class BadUsageException : public Exception { public:
        explicit BadUsageException(const std::string& details) :
            Exception("Invalid Usage: "+details) {} };

    /** Thrown when no AddFlag() override accepts a flag */
    class BadFlagException : public Exception { public:
        explicit BadFlagException(const std::string& flag) :
            Exception("Unknown Flag: "+flag) {} };

    /** Thrown when no AddOption() override accepts an option */
    class BadOptionException : public Exception { public:
        explicit BadOptionException(const std::string& option) :
            Exception("Unknown Option: "+option) {} };

    /** Thrown for an unparseable or out of range value, or an unreadable file */
    class BadValueException : public Exception { public:
        explicit BadValueException(const std::string& option) :
            Exception("Bad Option Value: "+option) {} };

    /** Thrown by Validate() when a required option (e.g. the destination path) is absent */
    class MissingOptionException : public Exception { public:
        explicit MissingOptionException(const std::string& option) :
            Exception("Missing Option: "+option) {} };

    using Flags = std::list<std::string>;
    using Options = std::multimap<std::string, std::string>;

    /**
     * Parses command line arguments from main (skips argv[0]!)
     * Accepts -x, --xx, -x val, -xval, --xx val, -x=val and --xx=val
     * @param stopmm if true, stop at "--" rather than failing
     * @throws Exception if invalid arguments
     * @return index of the first argument not consumed (argc if all were)
     */
    size_t ParseArgs(size_t argc, const char* const* argv, bool stopmm = false);

    /**
     * Parses a config file, one flag or option=value per line
     * Surrounding whitespace is ignored, lines starting with # are comments
     * @throws BadValueException if the file cannot be read
     * @throws Exception if invalid arguments
     */
    void ParseFile(const std::filesystem::path& path);

    /**
     * Returns the config files checked for the given program, in order
     * cirrus.conf then cirrus-name.conf in each system then user directory
     */
    [[nodiscard]] static std::vector<std::filesystem::path> GetConfigPaths(const std::string& name);

    /**
     * Parses every existing config file from GetConfigPaths()
     * @throws Exception if invalid arguments
     */
    void ParseConfig(const std::string& name);

    /**
     * Adds the given argument, returning true iff it was used
     * @throws ShowHelpException if help text is requested
     * @throws ShowVersionException if version text is requested
     */
    virtual bool AddFlag(const std::string& flag);

    /**
     * Adds the given option/value, returning true iff it was used
     * @throws Exception if invalid arguments
     */
    virtual bool AddOption(const std::string& option, const std::string& value);

    /**
     * Makes sure all required options were provided
     * @throws MissingOptionException if a required option is missing
     */
    virtual void Validate() = 0;

protected:

    /** Retrieve the help/version usage line */
    static std::string CoreBaseHelpText();

    /**
     * Retrieve the config and debugging help text
     * @param name the program name used for its config file
     */
    static std::string DetailBaseHelpText(const std::string& name);

private:

    /** Passes the collected flags then options to AddFlag/AddOption */
    void AddAll(const Flags& flags, const Options& options);
};

} // namespace Cirrus

#endif // LIBCIRRUS_BASEOPTIONS_H_
