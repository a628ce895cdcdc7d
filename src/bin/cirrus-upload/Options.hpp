#ifndef CIRRUSCLI_OPTIONS_H_
#define CIRRUSCLI_OPTIONS_H_

#include <string>

#include "cirrus/BaseOptions.hpp"
#include "cirrus/upload/UploadArgs.hpp"
#include "cirrus/upload/UploadOptions.hpp"

namespace Cirrus {
    namespace Backend { struct HTTPOptions; struct RunnerOptions; }
}

namespace CirrusCli {

/** Manages command line options and config */
class Options : public Cirrus::BaseOptions
{
public:

    /** The default content API base URL */
    static constexpr const char* DEFAULT_API_URL { "https://content.dropboxapi.com/2/" };

    /** The environment variable holding the access token */
    static constexpr const char* TOKEN_ENV { "cirrus_token" };

    /** Retrieve the full help text string */
    static std::string HelpText();

    /**
     * @param[out] httpOptions HTTPRunner options ref to fill
     * @param[out] runnerOptions BaseRunner options ref to fill
     * @param[out] uploadOptions UploadSession options ref to fill
     */
    explicit Options(
        Cirrus::Backend::HTTPOptions& httpOptions,
        Cirrus::Backend::RunnerOptions& runnerOptions,
        Cirrus::Upload::UploadOptions& uploadOptions);

    bool AddFlag(const std::string& flag) override;

    bool AddOption(const std::string& option, const std::string& value) override;

    void Validate() override;

    /** Returns the URL of the API endpoint */
    [[nodiscard]] const std::string& GetApiUrl() const { return mApiUrl; }

    /** Returns the source file path (- for stdin) */
    [[nodiscard]] const std::string& GetSourcePath() const { return mSourcePath; }

    /** Returns true if the source is stdin */
    [[nodiscard]] bool isStdin() const { return mSourcePath == "-"; }

    /** Returns the destination and commit flags */
    [[nodiscard]] const Cirrus::Upload::CommitInfo& GetCommitInfo() const { return mCommit; }

    /**
     * Returns the credential from the environment or the token file
     * The access token is left empty if neither has one
     * @throws BadValueException if the token file cannot be read
     */
    [[nodiscard]] Cirrus::Upload::Credential GetCredential() const;

private:

    Cirrus::Backend::HTTPOptions& mHttpOptions;
    Cirrus::Backend::RunnerOptions& mRunnerOptions;
    Cirrus::Upload::UploadOptions& mUploadOptions;

    std::string mApiUrl { DEFAULT_API_URL };
    std::string mSourcePath { "-" };
    std::string mTokenType { "Bearer" };
    std::string mTokenFile;

    Cirrus::Upload::CommitInfo mCommit;
};

} // namespace CirrusCli

#endif // CIRRUSCLI_OPTIONS_H_
