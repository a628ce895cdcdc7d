
#include <nlohmann/json.hpp>

#include "UploadArgs.hpp"

namespace Cirrus {
namespace Upload {

/*****************************************************/
void to_json(nlohmann::json& json, const SessionCursor& cursor)
{
    json = {{"session_id", cursor.sessionID}, {"offset", cursor.offset}};
}

/*****************************************************/
void to_json(nlohmann::json& json, const CommitInfo& commit)
{
    json = {
        {"path", commit.path},
        {"mode", CommitInfo::MODE_ADD},
        {"autorename", commit.autorename},
        {"mute", commit.mute}
    };
}

/*****************************************************/
void to_json(nlohmann::json& json, const UploadSessionFinish& finish)
{
    json = {{"cursor", finish.cursor}, {"commit", finish.commit}};
}

namespace {

/** Compact JSON with non-ASCII escaped, HTTP headers must be ASCII */
std::string DumpHeader(const nlohmann::json& json)
{
    try { return json.dump(-1, ' ', true); }
    catch (const nlohmann::json::exception& ex)
    {
        throw WireFormatException(ex.what()); // invalid UTF-8
    }
}

/** Parses a response body as a JSON object */
nlohmann::json ParseObject(const std::string& body)
{
    nlohmann::json json;
    try { json = nlohmann::json::parse(body); }
    catch (const nlohmann::json::exception& ex)
    {
        throw WireFormatException(ex.what());
    }

    if (!json.is_object())
        throw WireFormatException("expected an object");
    return json;
}

} // namespace

/*****************************************************/
std::string ToArgHeader(const SessionCursor& cursor)
{
    return DumpHeader(cursor);
}

/*****************************************************/
std::string ToArgHeader(const UploadSessionFinish& finish)
{
    return DumpHeader(finish);
}

/*****************************************************/
std::string ParseSessionID(const std::string& body)
{
    const nlohmann::json json = ParseObject(body);

    const nlohmann::json::const_iterator it { json.find("session_id") };
    if (it == json.cend() || !it->is_string())
        throw WireFormatException("missing session_id");

    std::string sessionID { it->get<std::string>() };
    if (sessionID.empty())
        throw WireFormatException("empty session_id");
    return sessionID;
}

/*****************************************************/
FileMetadata FileMetadata::FromJSON(const std::string& body)
{
    const nlohmann::json json = ParseObject(body);

    try
    {
        FileMetadata retval;
        retval.name = json.at("name").get<std::string>();
        retval.id = json.at("id").get<std::string>();

        retval.pathLower = json.value("path_lower", "");
        retval.pathDisplay = json.value("path_display", "");
        retval.rev = json.value("rev", "");
        retval.size = json.value("size", static_cast<uint64_t>(0));
        retval.contentHash = json.value("content_hash", "");
        retval.clientModified = json.value("client_modified", "");
        retval.serverModified = json.value("server_modified", "");
        return retval;
    }
    catch (const nlohmann::json::exception& ex)
    {
        throw WireFormatException(ex.what());
    }
}

} // namespace Upload
} // namespace Cirrus
