#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "BaseOptions.hpp"
#include "Debug.hpp"
#include "PlatformUtil.hpp"
#include "StringUtil.hpp"

namespace Cirrus {

/*****************************************************/
std::string BaseOptions::CoreBaseHelpText()
{
    return "(-h|--help | -V|--version)";
}

/*****************************************************/
std::string BaseOptions::DetailBaseHelpText(const std::string& name)
{
    std::ostringstream output;
    using std::endl;

    output << "Config File:     [-c|--config path]" << endl
           << "Debugging:       [-d|--debug 0-" << static_cast<unsigned>(Debug::Level::LAST) << "] [--debug-filter module1,module2] [--debug-log path]" << endl << endl
           << "Flags and options (without dashes) may also be given one per line in:" << endl;

    for (const std::filesystem::path& path : GetConfigPaths(name))
        output << "    " << path.string() << endl;
    output << "Later files and the command line take precedence.";

    return output.str();
}

/*****************************************************/
size_t BaseOptions::ParseArgs(size_t argc, const char* const* argv, bool stopmm)
{
    Flags flags; Options options;

    // the next arg is a value unless it is another key ("-" alone is stdin)
    const auto nextIsValue { [&](size_t idx)->bool {
        return idx+1 < argc && (argv[idx+1][0] != '-' || std::string(argv[idx+1]) == "-"); } };

    size_t idx { 1 }; for (; idx < argc; ++idx)
    {
        const std::string arg { argv[idx] };
        if (arg.empty() || arg[0] != '-')
            throw BadUsageException("expected key at arg "+std::to_string(idx));

        const bool isLong { StringUtil::startsWith(arg, "--") };
        const std::string key { arg.substr(isLong ? 2 : 1) };

        if (key.empty() || std::isspace(static_cast<unsigned char>(key[0])))
        {
            if (stopmm && arg == "--") { ++idx; break; }
            throw BadUsageException("empty key at arg "+std::to_string(idx));
        }

        if (key.find('=') != std::string::npos)
            options.emplace(StringUtil::split(key, "=")); // -x=val, --xx=val
        else if (!isLong && key.size() > 1)
            options.emplace(key.substr(0,1), key.substr(1)); // -xval
        else if (nextIsValue(idx))
            options.emplace(key, argv[++idx]); // -x val, --xx val
        else flags.push_back(key);
    }

    AddAll(flags, options);
    return idx;
}

/*****************************************************/
void BaseOptions::ParseFile(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open()) throw BadValueException("config "+path.string());

    Flags flags; Options options;

    std::string line; while (std::getline(file, line))
    {
        StringUtil::trim_void(line); // also drops \r from Windows files
        if (line.empty() || line[0] == '#') continue;

        if (line.find('=') == std::string::npos)
        {
            flags.push_back(line); continue;
        }

        StringUtil::StringPair pair { StringUtil::split(line, "=") };
        StringUtil::trim_void(pair.first);
        StringUtil::trim_void(pair.second);
        options.emplace(std::move(pair));
    }

    if (file.bad()) throw BadValueException("config "+path.string());

    AddAll(flags, options);
}

/*****************************************************/
std::vector<std::filesystem::path> BaseOptions::GetConfigPaths(const std::string& name)
{
    std::vector<std::filesystem::path> dirs { "/etc/cirrus", "/usr/local/etc/cirrus" };

    const std::string home { PlatformUtil::GetHomeDirectory() };
    if (!home.empty()) dirs.emplace_back(std::filesystem::path(home) / ".config" / "cirrus");
    dirs.emplace_back(".");

    std::vector<std::filesystem::path> retval;
    for (const std::filesystem::path& dir : dirs)
    {
        retval.push_back(dir / "cirrus.conf");
        if (!name.empty()) retval.push_back(dir / ("cirrus-"+name+".conf"));
    }
    return retval;
}

/*****************************************************/
void BaseOptions::ParseConfig(const std::string& name)
{
    for (const std::filesystem::path& path : GetConfigPaths(name))
    {
        if (std::filesystem::is_regular_file(path))
            ParseFile(path);
    }
}

/*****************************************************/
void BaseOptions::AddAll(const Flags& flags, const Options& options)
{
    for (const Flags::value_type& flag : flags)
        if (!AddFlag(flag)) throw BadFlagException(flag);

    for (const Options::value_type& pair : options)
        if (!AddOption(pair.first, pair.second)) throw BadOptionException(pair.first);
}

/*****************************************************/
bool BaseOptions::AddFlag(const std::string& flag)
{
    if (flag == "h" || flag == "help")
        throw ShowHelpException();
    if (flag == "V" || flag == "version")
        throw ShowVersionException();
    return false; // not used
}

/*****************************************************/
bool BaseOptions::AddOption(const std::string& option, const std::string& value)
{
    if (option == "c" || option == "config")
    {
        if (!std::filesystem::is_regular_file(value))
            throw BadValueException(option);
        ParseFile(value);
    }
    else if (option == "d" || option == "debug")
    {
        uint64_t level { 0 };
        try { level = StringUtil::stringToUnsigned(value, static_cast<uint64_t>(Debug::Level::LAST)); }
        catch (const std::logic_error& e) {
            throw BadValueException(option); }

        Debug::SetLevel(static_cast<Debug::Level>(level));
    }
    else if (option == "debug-filter")
    {
        Debug::SetFilters(value);
    }
    else if (option == "debug-log")
    {
        if (!Debug::AddLogFile(value))
            throw BadValueException(option);
    }
    else return false; // not used

    return true;
}

} // namespace Cirrus
