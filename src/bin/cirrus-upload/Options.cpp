
#include <filesystem>
#include <fstream>
#include <sstream>

#include "Options.hpp"

#include "cirrus/BaseOptions.hpp"
using Cirrus::BaseOptions;
#include "cirrus/PlatformUtil.hpp"
using Cirrus::PlatformUtil;
#include "cirrus/StringUtil.hpp"
using Cirrus::StringUtil;
#include "cirrus/backend/HTTPOptions.hpp"
using Cirrus::Backend::HTTPOptions;
#include "cirrus/backend/RunnerOptions.hpp"
using Cirrus::Backend::RunnerOptions;
using Cirrus::Upload::Credential;
using Cirrus::Upload::UploadOptions;

namespace CirrusCli {

/*****************************************************/
std::string Options::HelpText()
{
    std::ostringstream output;

    using std::endl;

    output
        << "Usage Syntax: " << endl
        << "cirrus-upload " << CoreBaseHelpText() << endl
        << "cirrus-upload -p|--path dest [-f|--file path|-] [-a|--apiurl url]" << endl << endl

        << "NOTE the access token is read from the " << TOKEN_ENV << " environment variable or the first line of --token-file." << endl
        << "NOTE without --file (or with -f -) the content is read from stdin." << endl << endl

        << "Upload Options:  [--token-type str(Bearer)] [--token-file path] [--autorename] [--mute]" << endl
        << UploadOptions::HelpText() << endl
        << HTTPOptions::HelpText() << endl
        << RunnerOptions::HelpText() << endl << endl

        << DetailBaseHelpText("upload");

    return output.str();
}

/*****************************************************/
Options::Options(HTTPOptions& httpOptions, RunnerOptions& runnerOptions, UploadOptions& uploadOptions) :
    mHttpOptions(httpOptions), mRunnerOptions(runnerOptions), mUploadOptions(uploadOptions) { }

/*****************************************************/
bool Options::AddFlag(const std::string& flag)
{
    if (BaseOptions::AddFlag(flag)) { }

    else if (flag == "autorename") mCommit.autorename = true;
    else if (flag == "mute") mCommit.mute = true;

    else if (mHttpOptions.AddFlag(flag)) { }
    else return false; // not used

    return true;
}

/*****************************************************/
bool Options::AddOption(const std::string& option, const std::string& value)
{
    if (BaseOptions::AddOption(option, value)) { }

    else if (option == "a" || option == "apiurl") mApiUrl = value;
    else if (option == "p" || option == "path") mCommit.path = value;
    else if (option == "f" || option == "file") mSourcePath = value;

    else if (option == "token-type") mTokenType = value;
    else if (option == "token-file")
    {
        if (!std::filesystem::is_regular_file(value))
            throw BadValueException(option);
        mTokenFile = value;
    }

    else if (mHttpOptions.AddOption(option, value)) { }
    else if (mRunnerOptions.AddOption(option, value)) { }
    else if (mUploadOptions.AddOption(option, value)) { }
    else return false; // not used

    return true;
}

/*****************************************************/
void Options::Validate()
{
    if (mCommit.path.empty())
        throw MissingOptionException("path");
    if (mApiUrl.empty())
        throw MissingOptionException("apiurl");
}

/*****************************************************/
Credential Options::GetCredential() const
{
    Credential retval;
    retval.tokenType = mTokenType;

    retval.accessToken = StringUtil::trim(PlatformUtil::GetEnvironment(TOKEN_ENV));

    if (retval.accessToken.empty() && !mTokenFile.empty())
    {
        std::ifstream file(mTokenFile, std::ios::in | std::ios::binary);
        if (!file.is_open()) throw BadValueException("token-file");

        std::string line; std::getline(file, line);
        retval.accessToken = StringUtil::trim(line);
    }

    return retval;
}

} // namespace CirrusCli
