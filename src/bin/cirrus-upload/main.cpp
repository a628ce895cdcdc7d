
#include <fstream>
#include <iostream>
#include <istream>
#include <memory>

#include <nlohmann/json.hpp>

#include "CancelSignals.hpp"
using CirrusCli::CancelSignals;
#include "Options.hpp"
using CirrusCli::Options;

#include "cirrus/Debug.hpp"
using Cirrus::Debug;
#include "cirrus/backend/HTTPOptions.hpp"
using Cirrus::Backend::HTTPOptions;
#include "cirrus/backend/HTTPRunner.hpp"
using Cirrus::Backend::HTTPRunner;
#include "cirrus/backend/RunnerOptions.hpp"
using Cirrus::Backend::RunnerOptions;
#include "cirrus/upload/UploadArgs.hpp"
using Cirrus::Upload::FileMetadata;
using Cirrus::Upload::WireFormatException;
#include "cirrus/upload/UploadOptions.hpp"
using Cirrus::Upload::UploadOptions;
#include "cirrus/upload/UploadSession.hpp"
using Cirrus::Upload::UploadSession;

enum class ExitCode
{
    SUCCESS,
    BAD_USAGE,
    INVALID_INPUT,
    TRANSPORT,
    REMOTE_REJECTION,
    PROTOCOL,
    CANCELED
};

int main(int argc, char** argv)
{
    Debug::AddStream(std::cerr);
    Debug debug("main",nullptr);

    HTTPOptions httpOptions;
    RunnerOptions runnerOptions;
    UploadOptions uploadOptions;

    Options options(httpOptions, runnerOptions, uploadOptions);

    try
    {
        options.ParseConfig("upload");

        options.ParseArgs(static_cast<size_t>(argc), argv);
        options.Validate();
    }
    catch (const Options::ShowHelpException& ex)
    {
        std::cout << Options::HelpText() << std::endl;
        return static_cast<int>(ExitCode::SUCCESS);
    }
    catch (const Options::ShowVersionException& ex)
    {
        std::cout << "version: " << CIRRUS_VERSION << std::endl;
        return static_cast<int>(ExitCode::SUCCESS);
    }
    catch (const Options::Exception& ex)
    {
        std::cout << ex.what() << std::endl << std::endl;
        std::cout << Options::HelpText() << std::endl;
        return static_cast<int>(ExitCode::BAD_USAGE);
    }

    DDBG_INFO("()");

    std::unique_ptr<std::ifstream> file;
    if (!options.isStdin())
        file = std::make_unique<std::ifstream>(
            options.GetSourcePath(), std::ios::in | std::ios::binary);
    std::istream& source { file ? *file : std::cin };

    const std::string userAgent(std::string("cirrus-upload/")
        +CIRRUS_VERSION+"/"+SYSTEM_NAME);

    HTTPRunner runner(options.GetApiUrl(), userAgent, runnerOptions, httpOptions);

    std::string resp; try
    {
        UploadSession session(runner, options.GetCredential(), uploadOptions);

        const CancelSignals signals([&](){ session.Cancel(); });

        resp = session.Upload(options.GetCommitInfo(), source);
    }
    catch (const Options::Exception& ex)
    {
        DDBG_ERROR(": " << ex.what());
        return static_cast<int>(ExitCode::BAD_USAGE);
    }
    catch (const UploadSession::InvalidArgumentException& ex)
    {
        DDBG_ERROR(": " << ex.what());
        return static_cast<int>(ExitCode::INVALID_INPUT);
    }
    catch (const UploadSession::SourceException& ex)
    {
        DDBG_ERROR(": " << ex.what());
        return static_cast<int>(ExitCode::INVALID_INPUT);
    }
    catch (const UploadSession::TransportException& ex)
    {
        DDBG_ERROR(": " << ex.what());
        return static_cast<int>(ExitCode::TRANSPORT);
    }
    catch (const UploadSession::RemoteRejectionException& ex)
    {
        DDBG_ERROR(": " << ex.what());
        std::cerr << ex.GetBody() << std::endl;
        return static_cast<int>(ExitCode::REMOTE_REJECTION);
    }
    catch (const UploadSession::ProtocolException& ex)
    {
        DDBG_ERROR(": " << ex.what());
        return static_cast<int>(ExitCode::PROTOCOL);
    }
    catch (const UploadSession::CanceledException& ex)
    {
        DDBG_ERROR(": " << ex.what());
        return static_cast<int>(ExitCode::CANCELED);
    }
    catch (const CancelSignals::Exception& ex)
    {
        DDBG_ERROR(": " << ex.what());
        return static_cast<int>(ExitCode::INVALID_INPUT);
    }

    // the upload is committed, a response we cannot read does not undo it
    try
    {
        const nlohmann::json val(nlohmann::json::parse(resp));
        std::cout << val.dump(4) << std::endl;
    }
    catch (const nlohmann::json::exception& ex)
    {
        DDBG_ERROR(": JSON Error: " << ex.what());
        std::cout << resp << std::endl;
    }

    try
    {
        const FileMetadata metadata { FileMetadata::FromJSON(resp) };
        DDBG_INFO(": uploaded " << metadata.pathDisplay << " (" << metadata.size << " bytes) rev:" << metadata.rev);
    }
    catch (const WireFormatException& ex)
    {
        DDBG_ERROR(": " << ex.what());
    }

    return static_cast<int>(ExitCode::SUCCESS);
}
