#ifndef LIBCIRRUS_UPLOADARGS_H_
#define LIBCIRRUS_UPLOADARGS_H_

#include <cstdint>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "cirrus/BaseException.hpp"

namespace Cirrus {
namespace Upload {

/** Exception indicating a response or argument was not in the expected format */
class WireFormatException : public BaseException { public:
    explicit WireFormatException(const std::string& message) :
        BaseException("Wire Format: "+message) {}; };

/** Header carrying the JSON arguments of append/finish */
constexpr const char* API_ARG_HEADER { "Dropbox-API-Arg" };

/** Anchors the next append/finish to a position in the session */
struct SessionCursor
{
    /** ID assigned by the service on session start */
    std::string sessionID;
    /** Number of bytes accepted so far */
    uint64_t offset { 0 };
};

/** The destination of an upload, applied when the session finishes */
struct CommitInfo
{
    /** Write mode, uploads only ever add new files */
    static constexpr const char* MODE_ADD { "add" };

    /** Destination path */
    std::string path;
    /** Let the service rename the file on conflict */
    bool autorename { false };
    /** Do not notify the user's devices */
    bool mute { false };
};

/** Arguments of the finish request */
struct UploadSessionFinish
{
    SessionCursor cursor;
    CommitInfo commit;
};

/** Metadata of a committed file, from the finish response */
struct FileMetadata
{
    std::string name;
    std::string id;
    std::string pathLower;
    std::string pathDisplay;
    std::string rev;
    uint64_t size { 0 };
    std::string contentHash;
    std::string clientModified;
    std::string serverModified;

    /**
     * Parses the finish response body
     * @throws WireFormatException if not valid JSON or missing name/id
     */
    [[nodiscard]] static FileMetadata FromJSON(const std::string& body);
};

void to_json(nlohmann::json& json, const SessionCursor& cursor);
void to_json(nlohmann::json& json, const CommitInfo& commit);
void to_json(nlohmann::json& json, const UploadSessionFinish& finish);

/**
 * Returns the compact JSON header value for an append, non-ASCII escaped
 * @throws WireFormatException if a string is not valid UTF-8
 */
[[nodiscard]] std::string ToArgHeader(const SessionCursor& cursor);

/** Returns the compact JSON header value for a finish (see above) */
[[nodiscard]] std::string ToArgHeader(const UploadSessionFinish& finish);

/**
 * Returns the session ID from a start response body
 * @throws WireFormatException if not valid JSON or no session_id string
 */
[[nodiscard]] std::string ParseSessionID(const std::string& body);

} // namespace Upload
} // namespace Cirrus

#endif // LIBCIRRUS_UPLOADARGS_H_
